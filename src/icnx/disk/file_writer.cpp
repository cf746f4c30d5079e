// Copyright (c) 2026 changcheng967. All rights reserved.

#include <icnx/disk/file_writer.hpp>
#include <icnx/core/config.hpp>
#include <cerrno>

namespace icnx::disk {

namespace {

DiskErrc from_errno(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case EACCES:
        case EPERM:
        case EROFS:
            return DiskErrc::access_denied;
        case ENOSPC:
            return DiskErrc::disk_full;
        default:
            return fallback;
    }
}

} // namespace

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    if (file_) {
        (void)close();
    }
}

std::error_code FileWriter::open(const std::filesystem::path& path) noexcept {
    if (file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return make_error_code(DiskErrc::create_dir_failed);
        }
    }

    errno = 0;
    file_ = std::fopen(path.c_str(), "wb");
    if (!file_) {
        return make_error_code(from_errno(errno, DiskErrc::open_failed));
    }

    path_ = path;
    written_ = 0;
    buffer_.clear();
    buffer_.reserve(core::WRITE_BUFFER_SIZE);
    return {};
}

std::error_code FileWriter::write(std::span<const std::byte> data) noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    if (buffer_.size() + data.size() > core::WRITE_BUFFER_SIZE) {
        if (auto ec = flush_buffer()) {
            return ec;
        }
    }

    if (data.size() >= core::WRITE_BUFFER_SIZE) {
        errno = 0;
        if (std::fwrite(data.data(), 1, data.size(), file_) != data.size()) {
            return make_error_code(from_errno(errno, DiskErrc::write_error));
        }
    } else {
        buffer_.insert(buffer_.end(), data.begin(), data.end());
    }

    written_ += data.size();
    return {};
}

std::error_code FileWriter::flush_buffer() noexcept {
    if (buffer_.empty()) {
        return {};
    }
    errno = 0;
    if (std::fwrite(buffer_.data(), 1, buffer_.size(), file_) != buffer_.size()) {
        return make_error_code(from_errno(errno, DiskErrc::write_error));
    }
    buffer_.clear();
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (auto ec = flush_buffer()) {
        return ec;
    }
    errno = 0;
    if (std::fflush(file_) != 0) {
        return make_error_code(from_errno(errno, DiskErrc::flush_error));
    }
    return {};
}

std::error_code FileWriter::close() noexcept {
    if (!file_) {
        return {};
    }

    auto ec = flush();
    if (std::fclose(file_) != 0 && !ec) {
        ec = make_error_code(DiskErrc::flush_error);
    }
    file_ = nullptr;
    return ec;
}

std::error_code FileWriter::discard() noexcept {
    if (file_) {
        buffer_.clear();
        std::fclose(file_);
        file_ = nullptr;
    }
    if (path_.empty()) {
        return {};
    }

    std::error_code ec;
    std::filesystem::remove(path_, ec);
    return ec ? make_error_code(DiskErrc::remove_failed) : std::error_code{};
}

} // namespace icnx::disk
