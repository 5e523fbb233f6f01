#include "LineWindowReader.hpp"
#include "BoundedRing.hpp"
#include "LineUtils.hpp"
#include "Log.hpp"
#include "PathResolver.hpp"
#include "TextDecoder.hpp"
#include "ToolError.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <optional>
#include <utility>

namespace {

// Running total of the bytes selected for return.
class ByteBudget {
public:
    explicit ByteBudget(size_t limit) : limit_(limit) {}

    size_t remaining() const { return limit_ - used_; }

    void charge(size_t bytes) {
        if (bytes > remaining()) exceeded();
        used_ += bytes;
    }

    void exceeded() const {
        log_error("Content exceeds maximum size limit of 10MB");
        throw ToolError(ErrorKind::SizeExceeded, "Content exceeds maximum size limit of 10MB");
    }

private:
    size_t limit_;
    size_t used_ = 0;
};

// Largest raw line worth holding in memory when at most `budget` decoded bytes may
// still be returned. UTF-8 decodes byte for byte; other charsets produce at least
// one output byte per kMaxBytesPerChar input bytes.
size_t raw_line_cap(const std::string& encoding, size_t budget) {
    if (is_utf8_encoding(encoding)) return budget;
    return budget * kMaxBytesPerChar;
}

void append_line(std::string decoded, ByteBudget& budget, LineWindowResult& result) {
    budget.charge(decoded.size());
    strip_line_terminator(decoded);
    result.lines.push_back(std::move(decoded));
}

void read_forward(std::istream& in, const ReadRequest& request, const std::string& encoding, LineWindowResult& result) {
    for (long long skipped = 1; skipped < request.startLine; ++skipped) {
        if (!skip_raw_line(in)) return;
    }

    ByteBudget budget(kMaxContentBytes);
    std::string raw;
    for (long long taken = 0; taken < request.maxLines; ++taken) {
        LineRead got = read_raw_line(in, raw, raw_line_cap(encoding, budget.remaining()));
        if (got == LineRead::End) break;
        if (got == LineRead::Oversize) budget.exceeded();
        append_line(decode_to_utf8(raw, encoding), budget, result);
    }
}

void read_tail(std::istream& in, const ReadRequest& request, const std::string& encoding, LineWindowResult& result) {
    // -(startLine + 1) cannot overflow, unlike -startLine
    const size_t k = static_cast<size_t>(-(request.startLine + 1)) + 1;
    const size_t max_lines = static_cast<size_t>(request.maxLines);
    const size_t cap = raw_line_cap(encoding, kMaxContentBytes);

    // An empty slot stands for a line too long to ever be returned.
    BoundedRing<std::optional<std::string>> window(k + max_lines);
    std::string raw;
    for (;;) {
        LineRead got = read_raw_line(in, raw, cap);
        if (got == LineRead::End) break;
        if (got == LineRead::Oversize) {
            window.push(std::nullopt);
        } else {
            window.push(decode_to_utf8(raw, encoding));
        }
    }

    const size_t held = window.size();
    const size_t start_idx = held > k ? held - k : 0;
    const size_t take = std::min({max_lines, k, held - start_idx});

    ByteBudget budget(kMaxContentBytes);
    for (size_t i = 0; i < take; ++i) {
        std::optional<std::string>& line = window.at(start_idx + i);
        if (!line) budget.exceeded();
        append_line(std::move(*line), budget, result);
    }
}

} // namespace

LineWindowResult read_line_window(const ReadRequest& request) {
    if (trim_copy(request.path).empty()) {
        throw ToolError(ErrorKind::InvalidArgument, "File path must be a non-empty string");
    }
    if (trim_copy(request.encoding).empty()) {
        throw ToolError(ErrorKind::InvalidArgument, "File encoding must be a non-empty string");
    }
    if (request.startLine == 0) {
        throw ToolError(ErrorKind::InvalidArgument, "Begin line must be a non-zero integer");
    }
    if (request.maxLines < 1 || request.maxLines > kMaxLinesLimit) {
        throw ToolError(ErrorKind::InvalidArgument, "Max lines must be a positive integer between 1 and 10000");
    }

    LineWindowResult result;
    result.resolvedPath = resolve_path(request.path, request.workingDirectory);
    result.startLine = request.startLine;

    const std::string encoding = canonical_encoding(request.encoding);
    if (!is_ascii_compatible_encoding(encoding)) {
        throw ToolError(ErrorKind::InvalidArgument, "Encoding '" + encoding + "' is not supported for line reads");
    }
    ensure_encoding_supported(encoding);

    const std::string& path = result.resolvedPath;
    try {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            throw ToolError(ErrorKind::NotFound, "File '" + path + "' does not exist or is not readable");
        }
        log_debug("Reading file lines '" + path + "' with encoding '" + encoding + "', begin line " +
                  std::to_string(request.startLine) + ", max lines " + std::to_string(request.maxLines));

        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            throw ToolError(ErrorKind::Internal, "Error reading file '" + path + "': cannot open file");
        }

        if (request.startLine > 0) {
            read_forward(in, request, encoding, result);
        } else {
            read_tail(in, request, encoding, result);
        }
        if (in.bad()) {
            throw ToolError(ErrorKind::Internal, "Error reading file '" + path + "': stream read failure");
        }
    } catch (const ToolError&) {
        throw;
    } catch (const std::exception& e) {
        log_error("Error reading file '" + path + "': " + e.what());
        throw ToolError(ErrorKind::Internal, "Error reading file '" + path + "': " + e.what());
    }

    result.lineCount = result.lines.size();
    return result;
}
