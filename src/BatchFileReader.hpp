#pragma once
#include <string>
#include <variant>
#include <vector>

// A per-file encoding value the caller supplied with the wrong type.
struct InvalidEncoding {
    std::string description;
};

// Absent (default encoding), a named encoding (blank also means default), or invalid.
using EncodingArg = std::variant<std::monostate, std::string, InvalidEncoding>;

struct BatchReadRequest {
    std::vector<std::string> paths;
    // Aligned with paths; missing trailing entries are treated as absent.
    std::vector<EncodingArg> encodings;
    bool skipErrors = true;
    std::string workingDirectory;
};

struct FileContent {
    std::string path;
    std::string content;
};

struct BatchReadResult {
    std::vector<FileContent> files;
};

// Read each file in full, in input order. A file that is missing, not a regular
// file, larger than kMaxContentBytes or not decodable is skipped when skipErrors
// is set; otherwise its ToolError aborts the whole call.
BatchReadResult read_file_batch(const BatchReadRequest& request);
