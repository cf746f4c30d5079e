// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <icnx/disk/file_writer.hpp>
#include <icnx/core/config.hpp>
#include "test_support.hpp"

using namespace icnx::disk;
using icnx::test::TempDir;
using icnx::test::read_file;

namespace {

std::span<const std::byte> bytes_of(const std::string& s) {
    return std::as_bytes(std::span<const char>(s.data(), s.size()));
}

} // namespace

TEST_CASE("FileWriter - write and close", "[disk]") {
    TempDir dir;
    auto path = dir / "sub" / "out.bin";

    FileWriter writer;
    REQUIRE(!writer.open(path));
    CHECK(writer.is_open());
    CHECK(std::filesystem::exists(path));

    std::string a = "hello ";
    std::string b = "world";
    REQUIRE(!writer.write(bytes_of(a)));
    REQUIRE(!writer.write(bytes_of(b)));
    CHECK(writer.bytes_written() == 11);

    REQUIRE(!writer.close());
    CHECK(!writer.is_open());
    CHECK(read_file(path) == "hello world");

    // Second close is a no-op
    CHECK(!writer.close());
}

TEST_CASE("FileWriter - writes larger than the buffer", "[disk]") {
    TempDir dir;
    auto path = dir / "big.bin";
    std::string chunk(icnx::core::WRITE_BUFFER_SIZE / 2 + 7, 'a');

    FileWriter writer;
    REQUIRE(!writer.open(path));
    for (int i = 0; i < 5; ++i) {
        REQUIRE(!writer.write(bytes_of(chunk)));
    }
    std::string whole(icnx::core::WRITE_BUFFER_SIZE + 1, 'b');
    REQUIRE(!writer.write(bytes_of(whole)));
    REQUIRE(!writer.close());

    CHECK(std::filesystem::file_size(path) == chunk.size() * 5 + whole.size());
}

TEST_CASE("FileWriter - discard removes the file", "[disk]") {
    TempDir dir;
    auto path = dir / "partial.bin";

    FileWriter writer;
    REQUIRE(!writer.open(path));
    std::string data = "partial";
    REQUIRE(!writer.write(bytes_of(data)));
    REQUIRE(!writer.discard());

    CHECK(!writer.is_open());
    CHECK(!std::filesystem::exists(path));
}

TEST_CASE("FileWriter - errors", "[disk]") {
    TempDir dir;

    SECTION("Write before open") {
        FileWriter writer;
        std::string data = "x";
        CHECK(writer.write(bytes_of(data)) == DiskErrc::handle_invalid);
    }

    SECTION("Parent is a regular file") {
        icnx::test::write_file(dir / "blocker", "file");
        FileWriter writer;
        CHECK(writer.open(dir / "blocker" / "out.bin") == DiskErrc::create_dir_failed);
        CHECK(!writer.is_open());
    }

    SECTION("Open twice") {
        FileWriter writer;
        REQUIRE(!writer.open(dir / "a.bin"));
        CHECK(writer.open(dir / "b.bin") == DiskErrc::handle_invalid);
    }
}
