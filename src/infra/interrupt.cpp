#include "interrupt.hpp"

namespace blockcopy::infra {

std::atomic<bool> g_interrupted{false};

namespace {

// В обработчике сигнала допустимы только lock-free атомики, без логирования
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

} // namespace

void install_signal_handler() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

} // namespace blockcopy::infra
