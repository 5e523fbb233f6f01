#pragma once
#include <string>

// Canonical charset name for a user-supplied encoding: trimmed, with the usual
// aliases mapped (utf8 -> UTF-8, latin-1 -> ISO-8859-1, ascii -> US-ASCII, ...).
// A blank name yields the default encoding.
std::string canonical_encoding(const std::string& encoding);

bool is_utf8_encoding(const std::string& canonical);

// True when '\n' is a single 0x0A byte in the encoding, which line splitting relies on.
bool is_ascii_compatible_encoding(const std::string& canonical);

// Throws ToolError(InvalidArgument) if the charset is unknown to the converter.
void ensure_encoding_supported(const std::string& canonical);

// Decode bytes in the given canonical charset into UTF-8.
// Throws ToolError(DecodeError) on illegal or truncated sequences and
// ToolError(InvalidArgument) for an unknown charset.
std::string decode_to_utf8(const char* begin, const char* end, const std::string& canonical);
std::string decode_to_utf8(const std::string& bytes, const std::string& canonical);
