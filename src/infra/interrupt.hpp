#pragma once

#include <atomic>
#include <csignal>

namespace blockcopy::infra {

extern std::atomic<bool> g_interrupted;

void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

// Сбрасывает флаг между заданиями (используется в тестах)
inline void reset_interrupted() {
    g_interrupted.store(false, std::memory_order_relaxed);
}

} // namespace blockcopy::infra
