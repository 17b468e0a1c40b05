#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <span>
#include <vector>
#include "infra/error_handler/error.hpp"

namespace blockcopy::adapters::fs {

// Источник: последовательное чтение с курсора, размер известен заранее
class SourceFile {
public:
    [[nodiscard]] static auto open(const std::filesystem::path& path) -> infra::Result<SourceFile>;

    SourceFile(SourceFile&&) = default;
    SourceFile& operator=(SourceFile&&) = default;

    [[nodiscard]] auto size() const noexcept -> std::uint64_t { return size_; }

    // Читает ровно length байт с текущей позиции
    [[nodiscard]] auto read_next(std::size_t length) -> infra::Result<std::vector<char>>;

private:
    SourceFile(std::filesystem::path path, std::ifstream stream, std::uint64_t size);

    std::filesystem::path path_;
    std::ifstream stream_;
    std::uint64_t size_ = 0;
    std::uint64_t position_ = 0;
};

// Файл назначения, общий для всех рабочих потоков.
// seek + write выполняются под одним mutex как неделимая пара.
class SharedDestination {
    struct Token {};

public:
    // Создаёт файл или обрезает существующий
    [[nodiscard]] static auto create(const std::filesystem::path& path)
        -> infra::Result<std::unique_ptr<SharedDestination>>;

    SharedDestination(Token, std::filesystem::path path, std::fstream stream);

    SharedDestination(const SharedDestination&) = delete;
    SharedDestination& operator=(const SharedDestination&) = delete;

    [[nodiscard]] auto write_at(std::uint64_t offset, std::span<const char> bytes) -> infra::VoidResult;

    // Сбрасывает буферы и закрывает; повторный вызов ничего не делает
    [[nodiscard]] auto close() -> infra::VoidResult;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
    std::fstream stream_;
};

// =============== Примитивы файловой системы ===============

[[nodiscard]] auto exists(const std::filesystem::path& path) -> bool;

[[nodiscard]] auto is_regular(const std::filesystem::path& path) -> bool;

// Копирует from поверх to (to перезаписывается)
[[nodiscard]] auto copy_overwrite(const std::filesystem::path& from,
                                  const std::filesystem::path& to,
                                  infra::ErrorCode on_failure) -> infra::VoidResult;

// Удаляет файл; отсутствие файла не ошибка
[[nodiscard]] auto remove_file(const std::filesystem::path& path) -> infra::VoidResult;

// Один и тот же файл (по inode), если оба существуют
[[nodiscard]] auto same_file(const std::filesystem::path& a,
                             const std::filesystem::path& b) -> bool;

} // namespace blockcopy::adapters::fs
