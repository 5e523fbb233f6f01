#include <iostream>
#include <string>
#include "../src/TextDecoder.hpp"
#include "../src/ToolError.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

static bool decode_fails_with(const std::string& bytes, const std::string& encoding, ErrorKind kind) {
    try {
        decode_to_utf8(bytes, canonical_encoding(encoding));
    } catch (const ToolError& e) {
        return e.kind() == kind;
    }
    return false;
}

int main() {
    try {
        // Aliases and blanks
        ASSERT_TRUE(canonical_encoding("utf-8") == "UTF-8");
        ASSERT_TRUE(canonical_encoding(" UTF_8 ") == "UTF-8");
        ASSERT_TRUE(canonical_encoding("") == "UTF-8");
        ASSERT_TRUE(canonical_encoding("   ") == "UTF-8");
        ASSERT_TRUE(canonical_encoding("latin-1") == "ISO-8859-1");
        ASSERT_TRUE(canonical_encoding("Latin1") == "ISO-8859-1");
        ASSERT_TRUE(canonical_encoding("ascii") == "US-ASCII");
        ASSERT_TRUE(canonical_encoding("KOI8-U") == "KOI8-U");

        ASSERT_TRUE(is_utf8_encoding("UTF-8"));
        ASSERT_TRUE(!is_utf8_encoding("ISO-8859-1"));
        ASSERT_TRUE(is_ascii_compatible_encoding("ISO-8859-1"));
        ASSERT_TRUE(is_ascii_compatible_encoding("UTF-8"));
        ASSERT_TRUE(!is_ascii_compatible_encoding("UTF-16LE"));
        ASSERT_TRUE(!is_ascii_compatible_encoding("utf-32"));

        // UTF-8 passes through unchanged
        std::string utf8 = "Caf\xC3\xA9 r\xC3\xA9sum\xC3\xA9\n";
        ASSERT_TRUE(decode_to_utf8(utf8, "UTF-8") == utf8);
        ASSERT_TRUE(decode_to_utf8(std::string(), "UTF-8").empty());

        // Latin-1 bytes become UTF-8
        std::string latin1 = "Caf\xE9";
        ASSERT_TRUE(decode_to_utf8(latin1, canonical_encoding("latin-1")) == "Caf\xC3\xA9");

        // UTF-16LE with explicit byte order
        std::string utf16le("H\0i\0", 4);
        ASSERT_TRUE(decode_to_utf8(utf16le, "UTF-16LE") == "Hi");

        // Invalid and truncated UTF-8 sequences
        ASSERT_TRUE(decode_fails_with("ok \xFF\xFE", "utf-8", ErrorKind::DecodeError));
        ASSERT_TRUE(decode_fails_with("cut \xC3", "utf-8", ErrorKind::DecodeError));
        // Non-ASCII byte under ASCII
        ASSERT_TRUE(decode_fails_with("Caf\xE9", "ascii", ErrorKind::DecodeError));

        // Unknown charset names
        ASSERT_TRUE(decode_fails_with("abc", "no-such-charset-xyz", ErrorKind::InvalidArgument));
        bool threw = false;
        try {
            ensure_encoding_supported("no-such-charset-xyz");
        } catch (const ToolError& e) {
            threw = e.kind() == ErrorKind::InvalidArgument;
        }
        ASSERT_TRUE(threw);
        ensure_encoding_supported("UTF-8");
        ensure_encoding_supported("ISO-8859-1");

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All text decoder tests passed" << std::endl;
    return 0;
}
