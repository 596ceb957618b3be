#include <cerrno>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "common/temp_dir.hpp"
#include "common/test_check.hpp"
#include "pngstash/fs/file.hpp"

using namespace pngstash;

/*
================================================================================
Whole-file I/O: Unit Tests
================================================================================
*/

void test_read_missing_file() {
    std::cout << "[TEST] fs read (missing file)..." << std::endl;

    TempDir dir;
    std::vector<std::uint8_t> out = {1, 2, 3};
    auto err = fs::read_file(dir.file("does_not_exist.png"), out);
    TEST_CHECK(err.code == fs::Status::OpenFailed);
    TEST_CHECK(err.sys_errno == ENOENT);
    TEST_CHECK((out == std::vector<std::uint8_t>{1, 2, 3}));

    std::ostringstream oss;
    oss << err;
    TEST_CHECK(oss.str().find("open failed") != std::string::npos);
    TEST_CHECK(oss.str().find("does_not_exist.png") != std::string::npos);

    std::cout << "[TEST] OK\n";
}

void test_write_then_read() {
    std::cout << "[TEST] fs write + read..." << std::endl;

    TempDir dir;
    const std::string path = dir.file("data.bin");

    // Larger than one read slice
    std::vector<std::uint8_t> bytes(200 * 1024);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<std::uint8_t>(i * 31u);
    }

    TEST_CHECK(fs::write_file(path, bytes).ok());
    TEST_CHECK(read_bytes(path) == bytes);

    std::vector<std::uint8_t> out;
    TEST_CHECK(fs::read_file(path, out).ok());
    TEST_CHECK(out == bytes);

    std::cout << "[TEST] OK\n";
}

void test_write_replaces_whole_file() {
    std::cout << "[TEST] fs write (full overwrite)..." << std::endl;

    TempDir dir;
    const std::string path = dir.file("data.bin");
    write_bytes(path, std::vector<std::uint8_t>(100, 0xAA));

    const std::vector<std::uint8_t> shorter = {0x01, 0x02, 0x03};
    TEST_CHECK(fs::write_file(path, shorter).ok());
    TEST_CHECK(read_bytes(path) == shorter);

    // No temporary left behind
    std::size_t entries = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
        (void)entry;
        ++entries;
    }
    TEST_CHECK_EQ(entries, 1u);

    std::cout << "[TEST] OK\n";
}

void test_write_empty() {
    std::cout << "[TEST] fs write (empty)..." << std::endl;

    TempDir dir;
    const std::string path = dir.file("empty.bin");
    TEST_CHECK(fs::write_file(path, {}).ok());

    std::vector<std::uint8_t> out = {9};
    TEST_CHECK(fs::read_file(path, out).ok());
    TEST_CHECK(out.empty());

    std::cout << "[TEST] OK\n";
}

void test_write_into_missing_directory() {
    std::cout << "[TEST] fs write (missing directory)..." << std::endl;

    TempDir dir;
    auto err = fs::write_file(dir.file("nope/out.png"), std::vector<std::uint8_t>{1});
    TEST_CHECK(err.code == fs::Status::OpenFailed);

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// MAIN
// ------------------------------------------------------------

int main() {
    test_read_missing_file();
    test_write_then_read();
    test_write_replaces_whole_file();
    test_write_empty();
    test_write_into_missing_directory();

    std::cout << "[TEST] ALL FILE TESTS PASSED!\n";
    return 0;
}
