#include "error.hpp"
#include <cstdlib>
#include <fmt/core.h>

namespace blockcopy::infra {

auto to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::FileNotFound:     return "file not found";
        case ErrorCode::PermissionDenied: return "permission denied";
        case ErrorCode::InvalidPath:      return "invalid path";
        case ErrorCode::InvalidConfig:    return "invalid config";
        case ErrorCode::ReadFailed:       return "read failed";
        case ErrorCode::WriteFailed:      return "write failed";
        case ErrorCode::BackupFailed:     return "backup failed";
        case ErrorCode::RestoreFailed:    return "restore failed";
        case ErrorCode::DeleteFailed:     return "delete failed";
        case ErrorCode::ChecksumMismatch: return "checksum mismatch";
        case ErrorCode::Interrupted:      return "interrupted";
        case ErrorCode::Unknown:          break;
    }
    return "unknown";
}

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::ChecksumMismatch:
        case ErrorCode::Interrupted:
            return false;
        default:
            return true;
    }
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::FileNotFound:
        case ErrorCode::InvalidPath:      return 10;
        case ErrorCode::InvalidConfig:    return 11;
        case ErrorCode::PermissionDenied: return 12;
        case ErrorCode::ReadFailed:
        case ErrorCode::WriteFailed:      return 20;
        case ErrorCode::BackupFailed:
        case ErrorCode::RestoreFailed:
        case ErrorCode::DeleteFailed:     return 21;
        case ErrorCode::ChecksumMismatch: return 22;
        case ErrorCode::Interrupted:      return 130; // как при SIGINT
        default:                          return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, message, loc};
}

Error make_io_error(ErrorCode code, std::string_view what,
                    const std::error_code& ec,
                    const std::source_location& loc) {
    return Error{code, fmt::format("{}: {}", what, ec.message()), loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace blockcopy::infra
