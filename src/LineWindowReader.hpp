#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "ReadLimits.hpp"

struct ReadRequest {
    std::string path;
    std::string encoding = kDefaultEncoding;
    std::string workingDirectory;
    // 1-based from the head when positive; -1 is the last line, -2 the one before it, ...
    long long startLine = kDefaultBeginLine;
    long long maxLines = kDefaultMaxLines;
};

struct LineWindowResult {
    std::string resolvedPath;
    // Echo of the requested start line, even when a tail offset ran past the head.
    long long startLine = 0;
    size_t lineCount = 0;
    std::vector<std::string> lines;
};

// Read a contiguous window of at most maxLines lines, streaming the file once.
// Negative start lines keep only the last (|startLine| + maxLines) lines in memory.
// Throws ToolError: InvalidArgument, NotFound, SizeExceeded (window over
// kMaxContentBytes), DecodeError, or Internal for other I/O failures.
LineWindowResult read_line_window(const ReadRequest& request);
