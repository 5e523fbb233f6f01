#include "TextDecoder.hpp"
#include "PathResolver.hpp"
#include "ReadLimits.hpp"
#include "ToolError.hpp"
#include <boost/locale/encoding.hpp>
#include <cctype>
#include <unordered_map>

namespace {
// Lowercase without '-', '_' or spaces, so "UTF_8", "utf-8" and "Utf8" compare equal.
std::string alias_key(const std::string& name) {
    std::string key;
    key.reserve(name.size());
    for (char c : name) {
        if (c == '-' || c == '_' || c == ' ') continue;
        key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return key;
}

const std::unordered_map<std::string, std::string>& alias_table() {
    static const std::unordered_map<std::string, std::string> aliases = {
        {"utf8", "UTF-8"}, {"u8", "UTF-8"}, {"utf", "UTF-8"}, {"cp65001", "UTF-8"},
        {"latin1", "ISO-8859-1"}, {"latin", "ISO-8859-1"}, {"l1", "ISO-8859-1"},
        {"iso88591", "ISO-8859-1"}, {"8859", "ISO-8859-1"}, {"cp819", "ISO-8859-1"},
        {"ascii", "US-ASCII"}, {"usascii", "US-ASCII"}, {"646", "US-ASCII"},
        {"cp1252", "CP1252"}, {"windows1252", "CP1252"},
        {"gbk", "GBK"}, {"gb2312", "GB2312"}, {"gb18030", "GB18030"},
        {"shiftjis", "SHIFT_JIS"}, {"sjis", "SHIFT_JIS"}, {"eucjp", "EUC-JP"},
        {"big5", "BIG5"}, {"euckr", "EUC-KR"}, {"koi8r", "KOI8-R"},
        {"utf16", "UTF-16"}, {"utf16le", "UTF-16LE"}, {"utf16be", "UTF-16BE"},
        {"utf32", "UTF-32"}, {"utf32le", "UTF-32LE"}, {"utf32be", "UTF-32BE"},
    };
    return aliases;
}
} // namespace

std::string canonical_encoding(const std::string& encoding) {
    std::string trimmed = trim_copy(encoding);
    if (trimmed.empty()) return canonical_encoding(kDefaultEncoding);
    auto it = alias_table().find(alias_key(trimmed));
    if (it != alias_table().end()) return it->second;
    return trimmed;
}

bool is_utf8_encoding(const std::string& canonical) {
    return alias_key(canonical) == "utf8";
}

bool is_ascii_compatible_encoding(const std::string& canonical) {
    std::string key = alias_key(canonical);
    for (const char* wide : {"utf16", "utf32", "ucs2", "ucs4", "unicode"}) {
        if (key.rfind(wide, 0) == 0) return false;
    }
    return true;
}

void ensure_encoding_supported(const std::string& canonical) {
    if (is_utf8_encoding(canonical)) return;
    // The converter is opened even for empty input, which validates the name.
    decode_to_utf8(std::string(), canonical);
}

std::string decode_to_utf8(const char* begin, const char* end, const std::string& canonical) {
    try {
        if (is_utf8_encoding(canonical)) {
            return boost::locale::conv::utf_to_utf<char>(begin, end, boost::locale::conv::stop);
        }
        return boost::locale::conv::to_utf<char>(begin, end, canonical, boost::locale::conv::stop);
    } catch (const boost::locale::conv::invalid_charset_error&) {
        throw ToolError(ErrorKind::InvalidArgument, "Unknown file encoding: " + canonical);
    } catch (const boost::locale::conv::conversion_error&) {
        throw ToolError(ErrorKind::DecodeError, "Content cannot be decoded as " + canonical);
    }
}

std::string decode_to_utf8(const std::string& bytes, const std::string& canonical) {
    return decode_to_utf8(bytes.data(), bytes.data() + bytes.size(), canonical);
}
