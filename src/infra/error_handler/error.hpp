#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace blockcopy::infra {

enum class ErrorCode {
    // Фатальные ошибки (задание завершается)
    FileNotFound,
    PermissionDenied,
    InvalidPath,
    InvalidConfig,

    // Ошибки ввода-вывода во время передачи
    ReadFailed,
    WriteFailed,
    BackupFailed,
    RestoreFailed,
    DeleteFailed,

    // Восстанавливаемые (retry на уровне блока)
    ChecksumMismatch,
    Interrupted,

    Unknown,
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    // Конструктор с автоматическим захватом location
    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;

    // Только несовпадение хеша блока лечится повтором
    [[nodiscard]] auto is_transient() const -> bool {
        return code == ErrorCode::ChecksumMismatch;
    }
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Ошибка из std::error_code, сообщение ОС сохраняется
[[nodiscard]] auto make_io_error(
    ErrorCode code,
    std::string_view what,
    const std::error_code& ec,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace blockcopy::infra
