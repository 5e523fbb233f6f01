#pragma once
#include <cstddef>
#include <istream>
#include <string>

enum class LineRead {
    End,
    Line,
    // The line ran past max_bytes; the rest of it was consumed and dropped.
    Oversize
};

// Read one raw line ending at "\n", "\r\n" or a lone "\r", keeping the terminator.
// At most max_bytes bytes (terminator included) are kept in memory.
LineRead read_raw_line(std::istream& in, std::string& line, size_t max_bytes);

// Advance past one line without keeping its bytes. Returns false at end of stream.
bool skip_raw_line(std::istream& in);

// Remove a trailing "\r\n", "\n" or "\r".
void strip_line_terminator(std::string& line);

// Rewrite every "\r\n" and lone "\r" as "\n".
void normalize_newlines(std::string& text);
