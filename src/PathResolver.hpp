#pragma once
#include <string>

// Resolve a user-supplied path into an absolute path with '/' separators.
// Surrounding whitespace is trimmed and a leading '~' expands to $HOME. Relative
// paths are joined onto working_directory; '.' and '..' segments, repeated
// separators and a trailing separator are normalized away. No filesystem access.
// Throws ToolError(InvalidArgument) when either argument is blank.
std::string resolve_path(const std::string& path, const std::string& working_directory);

std::string trim_copy(const std::string& text);

// Replace a leading '~' with $HOME; other paths are returned unchanged.
std::string expand_home(const std::string& path);
