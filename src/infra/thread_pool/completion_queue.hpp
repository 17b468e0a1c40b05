#pragma once

#include <condition_variable>
#include <mutex>
#include <queue>

namespace blockcopy::infra {

// Канал завершений: рабочие потоки публикуют результат,
// координатор блокируется, пока не придёт хотя бы один.
template<typename T>
class CompletionQueue {
public:
    void push(T value) {
        {
            std::lock_guard lock(mutex_);
            items_.push(std::move(value));
        }
        cv_.notify_one();
    }

    [[nodiscard]] auto pop() -> T {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return !items_.empty(); });
        T value = std::move(items_.front());
        items_.pop();
        return value;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<T> items_;
};

} // namespace blockcopy::infra
