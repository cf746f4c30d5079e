// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <icnx/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <vector>

namespace icnx::disk {

// Sequential writer for one downloaded file. Writes are buffered and
// flushed in WRITE_BUFFER_SIZE batches.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    // Create parent directories and truncate/create the file
    [[nodiscard]] std::error_code open(const std::filesystem::path& path) noexcept;

    [[nodiscard]] std::error_code write(std::span<const std::byte> data) noexcept;

    [[nodiscard]] std::error_code flush() noexcept;

    // Flush and close; safe to call twice
    [[nodiscard]] std::error_code close() noexcept;

    // Close and delete the file
    [[nodiscard]] std::error_code discard() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return file_ != nullptr; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return written_; }

private:
    std::error_code flush_buffer() noexcept;

    std::FILE* file_{nullptr};
    std::filesystem::path path_;
    std::vector<std::byte> buffer_;
    std::uint64_t written_{0};
};

} // namespace icnx::disk
