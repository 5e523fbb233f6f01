#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include "../src/BatchFileReader.hpp"
#include "../src/MappedFile.hpp"
#include "../src/ToolError.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

static void write_file(const std::filesystem::path& path, const std::string& bytes) {
    std::ofstream ofs(path, std::ios::binary);
    ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

static std::string norm(const std::filesystem::path& p) {
    return p.lexically_normal().generic_string();
}

static bool fails_with(const BatchReadRequest& req, ErrorKind kind) {
    try {
        read_file_batch(req);
    } catch (const ToolError& e) {
        return e.kind() == kind;
    }
    return false;
}

int main() {
    auto dir = std::filesystem::temp_directory_path() / "utilbox_batch_test";
    try {
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);

        auto t1 = dir / "file1.txt";
        auto t2 = dir / "file2_latin1.txt";
        auto t3 = dir / "empty.txt";
        auto missing = dir / "missing.txt";
        std::string text = "Line 1\nLine 2\nLine 3\nLine 4\nLine 5\n";
        write_file(t1, text);
        write_file(t2, "Caf\xE9 r\xE9sum\xE9 na\xEFve\n");
        write_file(t3, "");

        // Absolute paths, default encodings, empty file included
        BatchReadRequest basic;
        basic.paths = {t1.string(), t3.string()};
        basic.workingDirectory = "/";
        BatchReadResult r1 = read_file_batch(basic);
        ASSERT_TRUE(r1.files.size() == 2);
        ASSERT_TRUE(r1.files[0].path == norm(t1));
        ASSERT_TRUE(r1.files[0].content == text);
        ASSERT_TRUE(r1.files[1].path == norm(t3));
        ASSERT_TRUE(r1.files[1].content.empty());

        // Relative paths against the working directory
        BatchReadRequest relative;
        relative.paths = {"file1.txt", "./sub/../empty.txt"};
        relative.workingDirectory = dir.string();
        BatchReadResult r2 = read_file_batch(relative);
        ASSERT_TRUE(r2.files.size() == 2);
        ASSERT_TRUE(r2.files[0].path == norm(t1));
        ASSERT_TRUE(r2.files[1].path == norm(t3));

        // Per-file encodings, shorter list than paths, blank means default
        BatchReadRequest encoded;
        encoded.paths = {t1.string(), t2.string(), t1.string()};
        encoded.encodings = {std::monostate{}, std::string("latin-1")};
        encoded.workingDirectory = "/";
        BatchReadResult r3 = read_file_batch(encoded);
        ASSERT_TRUE(r3.files.size() == 3);
        ASSERT_TRUE(r3.files[1].content == "Caf\xC3\xA9 r\xC3\xA9sum\xC3\xA9 na\xC3\xAFve\n");
        ASSERT_TRUE(r3.files[2].content == text);
        BatchReadRequest blank;
        blank.paths = {t1.string()};
        blank.encodings = {std::string("  ")};
        blank.workingDirectory = "/";
        ASSERT_TRUE(read_file_batch(blank).files[0].content == text);

        // Line endings come back as "\n" whatever the file uses
        auto dos = dir / "dos.txt";
        auto mac = dir / "mac.txt";
        write_file(dos, "x\r\ny\r\n");
        write_file(mac, "p\rq\r\nr");
        BatchReadRequest endings;
        endings.paths = {dos.string(), mac.string()};
        endings.encodings = {std::monostate{}, std::string("latin-1")};
        endings.workingDirectory = "/";
        endings.skipErrors = false;
        BatchReadResult translated = read_file_batch(endings);
        ASSERT_TRUE(translated.files.size() == 2);
        ASSERT_TRUE(translated.files[0].content == "x\ny\n");
        ASSERT_TRUE(translated.files[1].content == "p\nq\nr");

        // The mapping reports the file's own length
        {
            MappedFile mapped(t1.string());
            ASSERT_TRUE(mapped.size() == text.size());
            ASSERT_TRUE(std::string(mapped.data(), mapped.size()) == text);
            MappedFile mapped_empty(t3.string());
            ASSERT_TRUE(mapped_empty.size() == 0);
            ASSERT_TRUE(std::string(mapped_empty.data()).empty());
        }

        // Partial failure: [A, missing, B]
        BatchReadRequest partial;
        partial.paths = {t1.string(), missing.string(), t3.string()};
        partial.workingDirectory = "/";
        partial.skipErrors = true;
        BatchReadResult r4 = read_file_batch(partial);
        ASSERT_TRUE(r4.files.size() == 2);
        ASSERT_TRUE(r4.files[0].path == norm(t1));
        ASSERT_TRUE(r4.files[1].path == norm(t3));
        partial.skipErrors = false;
        ASSERT_TRUE(fails_with(partial, ErrorKind::NotFound));

        // A directory is not a regular file
        BatchReadRequest directory;
        directory.paths = {dir.string()};
        directory.workingDirectory = "/";
        directory.skipErrors = false;
        ASSERT_TRUE(fails_with(directory, ErrorKind::NotFound));
        directory.skipErrors = true;
        ASSERT_TRUE(read_file_batch(directory).files.empty());

        // Invalid encoding value: default when skipping, InvalidArgument otherwise
        BatchReadRequest invalid;
        invalid.paths = {t1.string()};
        invalid.encodings = {InvalidEncoding{"integer"}};
        invalid.workingDirectory = "/";
        invalid.skipErrors = true;
        BatchReadResult r5 = read_file_batch(invalid);
        ASSERT_TRUE(r5.files.size() == 1);
        ASSERT_TRUE(r5.files[0].content == text);
        invalid.skipErrors = false;
        ASSERT_TRUE(fails_with(invalid, ErrorKind::InvalidArgument));

        // Undecodable content and unknown charset are per-file errors
        BatchReadRequest undecodable;
        undecodable.paths = {t2.string(), t1.string()};
        undecodable.workingDirectory = "/";
        BatchReadResult r6 = read_file_batch(undecodable);
        ASSERT_TRUE(r6.files.size() == 1);
        ASSERT_TRUE(r6.files[0].path == norm(t1));
        undecodable.skipErrors = false;
        ASSERT_TRUE(fails_with(undecodable, ErrorKind::DecodeError));

        BatchReadRequest unknown;
        unknown.paths = {t1.string()};
        unknown.encodings = {std::string("no-such-charset-xyz")};
        unknown.workingDirectory = "/";
        ASSERT_TRUE(read_file_batch(unknown).files.empty());
        unknown.skipErrors = false;
        ASSERT_TRUE(fails_with(unknown, ErrorKind::InvalidArgument));

        // Size cap applies per file
        auto big = dir / "big.bin";
        {
            std::ofstream ofs(big, std::ios::binary);
            std::string chunk(1024 * 1024, 'y');
            for (int i = 0; i < 10; ++i) ofs << chunk;
            ofs << 'z';
        }
        BatchReadRequest oversized;
        oversized.paths = {big.string(), t1.string()};
        oversized.workingDirectory = "/";
        BatchReadResult r7 = read_file_batch(oversized);
        ASSERT_TRUE(r7.files.size() == 1);
        ASSERT_TRUE(r7.files[0].path == norm(t1));
        oversized.skipErrors = false;
        ASSERT_TRUE(fails_with(oversized, ErrorKind::SizeExceeded));

        // Exactly at the cap is allowed
        std::filesystem::resize_file(big, 10 * 1024 * 1024);
        BatchReadRequest at_cap;
        at_cap.paths = {big.string()};
        at_cap.workingDirectory = "/";
        at_cap.skipErrors = false;
        BatchReadResult r8 = read_file_batch(at_cap);
        ASSERT_TRUE(r8.files.size() == 1);
        ASSERT_TRUE(r8.files[0].content.size() == 10 * 1024 * 1024);

        // Empty path list and blank paths are terminal even when skipping
        BatchReadRequest none;
        none.workingDirectory = "/";
        ASSERT_TRUE(fails_with(none, ErrorKind::InvalidArgument));
        BatchReadRequest blank_path;
        blank_path.paths = {t1.string(), "   "};
        blank_path.workingDirectory = "/";
        ASSERT_TRUE(fails_with(blank_path, ErrorKind::InvalidArgument));

        std::filesystem::remove_all(dir);
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All batch file reader tests passed" << std::endl;
    return 0;
}
