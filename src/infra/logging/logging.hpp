#pragma once

#include "../config/config.hpp"
#include "../error_handler/error.hpp"

namespace blockcopy::infra {

/// Настраивает логгер по умолчанию: цветная консоль + (если задан log_file)
/// файл, куда записи дописываются. quiet оставляет только ошибки,
/// verbose включает debug.
[[nodiscard]] auto init_logging(const Config& config) -> VoidResult;

} // namespace blockcopy::infra
