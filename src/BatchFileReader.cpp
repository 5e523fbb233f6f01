#include "BatchFileReader.hpp"
#include "LineUtils.hpp"
#include "Log.hpp"
#include "MappedFile.hpp"
#include "PathResolver.hpp"
#include "ReadLimits.hpp"
#include "TextDecoder.hpp"
#include "ToolError.hpp"
#include <filesystem>

namespace {

FileContent read_whole_file(const std::string& path, const std::string& encoding) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw ToolError(ErrorKind::NotFound, "File '" + path + "' does not exist or is not readable");
    }

    // The limit is checked against the mapping itself, not an earlier stat.
    MappedFile mapped(path);
    if (mapped.size() > kMaxContentBytes) {
        throw ToolError(ErrorKind::SizeExceeded, "File '" + path + "' exceeds maximum size limit of 10MB");
    }

    FileContent file;
    file.path = path;
    file.content = decode_to_utf8(mapped.data(), mapped.data() + mapped.size(), encoding);
    normalize_newlines(file.content);
    return file;
}

// Resolve the encoding for entry i, substituting the default for an invalid value
// when errors are skipped.
std::string encoding_for(const BatchReadRequest& request, size_t i) {
    if (i >= request.encodings.size()) return canonical_encoding(kDefaultEncoding);
    const EncodingArg& arg = request.encodings[i];
    if (const auto* name = std::get_if<std::string>(&arg)) {
        return canonical_encoding(*name);
    }
    if (const auto* invalid = std::get_if<InvalidEncoding>(&arg)) {
        if (!request.skipErrors) {
            log_error("Invalid file encoding value for '" + request.paths[i] + "': " + invalid->description);
            throw ToolError(ErrorKind::InvalidArgument, "Invalid file encoding value for '" + request.paths[i] + "'");
        }
        log_warning("Invalid file encoding for '" + request.paths[i] + "', defaulting to " + kDefaultEncoding);
    }
    return canonical_encoding(kDefaultEncoding);
}

} // namespace

BatchReadResult read_file_batch(const BatchReadRequest& request) {
    if (request.paths.empty()) {
        throw ToolError(ErrorKind::InvalidArgument, "File paths must be a non-empty list of strings");
    }

    // Every path and encoding is validated before any file is opened.
    std::vector<std::string> resolved;
    std::vector<std::string> encodings;
    resolved.reserve(request.paths.size());
    encodings.reserve(request.paths.size());
    for (size_t i = 0; i < request.paths.size(); ++i) {
        resolved.push_back(resolve_path(request.paths[i], request.workingDirectory));
        encodings.push_back(encoding_for(request, i));
    }

    BatchReadResult result;
    for (size_t i = 0; i < resolved.size(); ++i) {
        const std::string& path = resolved[i];
        log_debug("Reading file '" + path + "' with encoding '" + encodings[i] + "'...");
        try {
            result.files.push_back(read_whole_file(path, encodings[i]));
        } catch (const ToolError& e) {
            if (request.skipErrors) {
                log_warning("Skipping file '" + path + "': " + e.what());
                continue;
            }
            log_error(e.what());
            throw;
        } catch (const std::exception& e) {
            if (request.skipErrors) {
                log_warning("Skipping file '" + path + "': " + e.what());
                continue;
            }
            log_error("Error reading file '" + path + "': " + e.what());
            throw ToolError(ErrorKind::Internal, "Error reading file '" + path + "': " + e.what());
        }
    }
    return result;
}
