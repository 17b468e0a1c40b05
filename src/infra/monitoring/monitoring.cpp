#include "monitoring.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>

namespace blockcopy::infra {

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet)
    , start_time_(std::chrono::steady_clock::now())
{
    if (enabled_) {
        start_rendering_thread_();
    }
}

ProgressMonitor::~ProgressMonitor() {
    finish();
}

void ProgressMonitor::set_total(std::uint64_t bytes) {
    total_bytes_.store(bytes, std::memory_order_relaxed);
}

void ProgressMonitor::block_done(std::uint64_t bytes, std::uint32_t attempts) {
    processed_bytes_.fetch_add(bytes, std::memory_order_relaxed);
    blocks_done_.fetch_add(1, std::memory_order_relaxed);
    if (attempts > 1) {
        retries_.fetch_add(attempts - 1, std::memory_order_relaxed);
    }
}

void ProgressMonitor::finish() {
    if (finished_.exchange(true)) {
        return;
    }
    stop_rendering_thread_();
    if (enabled_) {
        render_();
        std::fputs("\n", stderr); // финальный перенос
    }
}

auto ProgressMonitor::get_stats() const -> Stats {
    return Stats{
        .total_bytes = total_bytes_.load(std::memory_order_relaxed),
        .processed_bytes = processed_bytes_.load(std::memory_order_relaxed),
        .blocks_done = blocks_done_.load(std::memory_order_relaxed),
        .retries = retries_.load(std::memory_order_relaxed),
        .start_time = start_time_
    };
}

void ProgressMonitor::start_rendering_thread_() {
    render_thread_ = std::make_unique<std::jthread>([this](std::stop_token st) {
        while (!st.stop_requested()) {
            render_();
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
}

void ProgressMonitor::stop_rendering_thread_() {
    if (render_thread_) {
        render_thread_->request_stop();
        render_thread_.reset(); // ждём поток
    }
}

void ProgressMonitor::render_() const {
    auto stats = get_stats();
    if (stats.total_bytes == 0) return;

    const double progress = static_cast<double>(stats.processed_bytes) / static_cast<double>(stats.total_bytes);
    const int bar_width = 20;
    const int filled = std::min(bar_width, static_cast<int>(progress * bar_width));

    // Скорость (байт/сек)
    auto now = std::chrono::steady_clock::now();
    auto elapsed_sec = std::chrono::duration<double>(now - stats.start_time).count();
    double bytes_per_sec = elapsed_sec > 0 ? static_cast<double>(stats.processed_bytes) / elapsed_sec : 0.0;

    // Оставшееся время
    double eta_sec = 0.0;
    if (bytes_per_sec > 0 && stats.processed_bytes > 0) {
        double remaining_bytes = static_cast<double>(stats.total_bytes - std::min(stats.total_bytes, stats.processed_bytes));
        eta_sec = remaining_bytes / bytes_per_sec;
    }

    const char* unit = "B/s";
    double speed = bytes_per_sec;
    if (speed > 1024*1024*1024) { speed /= 1024*1024*1024; unit = "GB/s"; }
    else if (speed > 1024*1024) { speed /= 1024*1024; unit = "MB/s"; }
    else if (speed > 1024) { speed /= 1024; unit = "KB/s"; }

    std::string eta_str = "inf";
    if (std::isfinite(eta_sec) && eta_sec > 0) {
        int seconds = static_cast<int>(eta_sec);
        int hours = seconds / 3600;
        int minutes = (seconds % 3600) / 60;
        seconds = seconds % 60;
        if (hours > 0) {
            eta_str = fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds);
        } else {
            eta_str = fmt::format("{:02d}:{:02d}", minutes, seconds);
        }
    }

    std::string bar;
    for (int i = 0; i < bar_width; ++i) {
        bar += i < filled ? "█" : "░";
    }

    // ANSI: очистить строку; прогресс идёт в stderr, лог не ломается
    fmt::print(stderr,
        "\r\033[K[{}] {:.1f}% {:.1f} {} | ETA: {} | {} blocks, {} retries",
        bar,
        progress * 100.0,
        speed, unit,
        eta_str,
        stats.blocks_done,
        stats.retries
    );
    std::fflush(stderr);
}

} // namespace blockcopy::infra
