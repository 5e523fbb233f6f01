#include "PathResolver.hpp"
#include "ToolError.hpp"
#include <cctype>
#include <cstdlib>
#include <filesystem>

std::string trim_copy(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

std::string expand_home(const std::string& path) {
    // Only "~" and "~/..." are expanded; "~user" is left alone.
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/' && path[1] != '\\') return path;
    const char* home = std::getenv("HOME");
    if (!home || !*home) return path;
    return std::string(home) + path.substr(1);
}

std::string resolve_path(const std::string& path, const std::string& working_directory) {
    std::string trimmed = trim_copy(path);
    if (trimmed.empty()) {
        throw ToolError(ErrorKind::InvalidArgument, "File path must be a non-empty string");
    }
    std::string base = trim_copy(working_directory);
    if (base.empty()) {
        throw ToolError(ErrorKind::InvalidArgument, "Working directory must be a non-empty string");
    }

    std::filesystem::path p(expand_home(trimmed));
    if (!p.is_absolute()) {
        p = std::filesystem::path(expand_home(base)) / p;
    }
    p = p.lexically_normal();

    std::string resolved = p.generic_string();
    // lexically_normal keeps a trailing separator for directory-like inputs ("a/b/").
    while (resolved.size() > 1 && resolved.back() == '/') {
        resolved.pop_back();
    }
    if (resolved.empty()) resolved = ".";
    return resolved;
}
