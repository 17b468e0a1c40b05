#pragma once

#include "error_handler/error.hpp"
#include <chrono>
#include <cmath>
#include <cstdint>
#include <thread>

namespace blockcopy::infra {
/*

auto res = infra::with_retry([&](std::uint32_t attempt) {
    return write_and_verify(block, attempt);
}, infra::RetryPolicy{ .max_attempts = 5 });

*/
struct RetryPolicy {
    std::uint32_t max_attempts = 5;
    std::chrono::milliseconds delay_unit = std::chrono::seconds(1);
    double backoff_factor = 2.0; // экспоненциальная задержка
};

// Задержка перед повтором номер retry_number (1, 2, ...): unit * factor^retry_number
[[nodiscard]] inline auto backoff_delay(const RetryPolicy& policy, std::uint32_t retry_number)
    -> std::chrono::milliseconds
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        policy.delay_unit * std::pow(policy.backoff_factor, static_cast<double>(retry_number)));
}

// operation(attempt) вызывается с номером попытки, начиная с 1.
// Повтор только для transient ошибок; после последней попытки не спим.
template<typename F>
[[nodiscard]] auto with_retry(F&& operation, const RetryPolicy& policy = {})
    -> decltype(operation(std::uint32_t{1}))
{
    const std::uint32_t attempts = policy.max_attempts == 0 ? 1 : policy.max_attempts;

    for (std::uint32_t attempt = 1; ; ++attempt) {
        auto result = operation(attempt);
        if (result.has_value()) {
            return result; // успех
        }

        const auto& err = result.error();
        if (!err.is_transient() || attempt >= attempts) {
            return result; // фатальная ошибка или последняя попытка
        }

        // Экспоненциальная задержка, lock в этот момент не удерживается
        std::this_thread::sleep_for(backoff_delay(policy, attempt));
    }
}

} // namespace blockcopy::infra
