#include "fs.hpp"
#include <fmt/core.h>
#include <system_error>

namespace blockcopy::adapters::fs {

// =============== Источник ===============

SourceFile::SourceFile(std::filesystem::path path, std::ifstream stream, std::uint64_t size)
    : path_(std::move(path)), stream_(std::move(stream)), size_(size) {}

auto SourceFile::open(const std::filesystem::path& path) -> infra::Result<SourceFile> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
                               fmt::format("Source is not a regular file: {}", path.string())));
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::unexpected(infra::make_io_error(infra::ErrorCode::ReadFailed,
                               fmt::format("Cannot stat {}", path.string()), ec));
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                               fmt::format("Cannot open source file: {}", path.string())));
    }

    return SourceFile{path, std::move(stream), static_cast<std::uint64_t>(size)};
}

auto SourceFile::read_next(std::size_t length) -> infra::Result<std::vector<char>> {
    std::vector<char> buffer(length);
    if (length == 0) {
        return buffer;
    }

    stream_.read(buffer.data(), static_cast<std::streamsize>(length));
    const auto got = static_cast<std::size_t>(stream_.gcount());
    if (got != length) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ReadFailed,
                               fmt::format("Short read from {} at offset {}: {} of {} bytes",
                                           path_.string(), position_, got, length)));
    }

    position_ += length;
    return buffer;
}

// =============== Назначение ===============

SharedDestination::SharedDestination(Token, std::filesystem::path path, std::fstream stream)
    : path_(std::move(path)), stream_(std::move(stream)) {}

auto SharedDestination::create(const std::filesystem::path& path)
    -> infra::Result<std::unique_ptr<SharedDestination>>
{
    std::fstream stream(path, std::ios::binary | std::ios::in | std::ios::out | std::ios::trunc);
    if (!stream) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                               fmt::format("Cannot create destination file: {}", path.string())));
    }
    return std::make_unique<SharedDestination>(Token{}, path, std::move(stream));
}

auto SharedDestination::write_at(std::uint64_t offset, std::span<const char> bytes) -> infra::VoidResult {
    std::lock_guard lock(mutex_);

    if (!stream_.is_open()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::WriteFailed,
                               fmt::format("Destination already closed: {}", path_.string())));
    }

    stream_.seekp(static_cast<std::streamoff>(offset));
    stream_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!stream_) {
        stream_.clear();
        return std::unexpected(infra::make_error(infra::ErrorCode::WriteFailed,
                               fmt::format("Write error at offset {} in {}", offset, path_.string())));
    }
    return {};
}

auto SharedDestination::close() -> infra::VoidResult {
    std::lock_guard lock(mutex_);
    if (!stream_.is_open()) {
        return {};
    }

    stream_.flush();
    const bool flushed = static_cast<bool>(stream_);
    stream_.close();
    if (!flushed || stream_.fail()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::WriteFailed,
                               fmt::format("Failed to flush {}", path_.string())));
    }
    return {};
}

// =============== Примитивы ===============

auto exists(const std::filesystem::path& path) -> bool {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

auto is_regular(const std::filesystem::path& path) -> bool {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

auto copy_overwrite(const std::filesystem::path& from,
                    const std::filesystem::path& to,
                    infra::ErrorCode on_failure) -> infra::VoidResult
{
    std::error_code ec;
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return std::unexpected(infra::make_io_error(on_failure,
                               fmt::format("Cannot copy {} to {}", from.string(), to.string()), ec));
    }
    return {};
}

auto remove_file(const std::filesystem::path& path) -> infra::VoidResult {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return std::unexpected(infra::make_io_error(infra::ErrorCode::DeleteFailed,
                               fmt::format("Cannot remove {}", path.string()), ec));
    }
    return {};
}

auto same_file(const std::filesystem::path& a, const std::filesystem::path& b) -> bool {
    std::error_code ec;
    const bool same = std::filesystem::equivalent(a, b, ec);
    return !ec && same;
}

} // namespace blockcopy::adapters::fs
