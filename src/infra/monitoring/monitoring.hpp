#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

namespace blockcopy::infra {

class ProgressMonitor {
public:
    struct Stats {
        std::uint64_t total_bytes = 0;
        std::uint64_t processed_bytes = 0;
        std::uint64_t blocks_done = 0;
        std::uint64_t retries = 0;
        std::chrono::steady_clock::time_point start_time{};
    };

    explicit ProgressMonitor(bool enabled = true, bool quiet = false);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    void set_total(std::uint64_t bytes);
    // Вызывается из рабочих потоков после проверенной записи блока
    void block_done(std::uint64_t bytes, std::uint32_t attempts);

    // Останавливает поток отрисовки и печатает финальную строку
    void finish();

    [[nodiscard]] auto get_stats() const -> Stats;

private:
    void render_() const;
    void start_rendering_thread_();
    void stop_rendering_thread_();

    // Атомики для thread-safe обновления
    std::atomic<std::uint64_t> processed_bytes_{0};
    std::atomic<std::uint64_t> blocks_done_{0};
    std::atomic<std::uint64_t> retries_{0};
    std::atomic<std::uint64_t> total_bytes_{0};

    const bool enabled_;
    std::chrono::steady_clock::time_point start_time_;
    std::atomic<bool> finished_{false};
    std::unique_ptr<std::jthread> render_thread_;
};

} // namespace blockcopy::infra
