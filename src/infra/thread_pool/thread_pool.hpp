#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <thread>
#include <mutex>
#include <queue>
#include <condition_variable>
#include <stop_token>
#include <vector>
#include <stdexcept>
#include <memory>

namespace blockcopy::infra {

// Пул фиксированного размера. Планировщик передачи создаёт его
// с числом потоков == max_concurrent_transfers.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t nthreads = std::jthread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Запуск задачи без возврата
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args) -> void;

    // Запуск задачи с возвратом (future)
    template<typename F, typename... Args>
    auto enqueue_with_future(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>>;

private:
    using Task = std::function<void()>;

    void worker_loop_(std::stop_token st);

    std::queue<Task> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable_any cv_;
    bool stop_ = false;
    std::vector<std::jthread> workers_; // последним: потоки стартуют после остальных полей
};

// =============== Реализация шаблонов ===============

template<typename F, typename... Args>
void ThreadPool::enqueue(F&& f, Args&&... args) {
    (void)enqueue_with_future(std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ThreadPool::enqueue_with_future(F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>>
{
    using ReturnType = std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    auto future = task->get_future();
    {
        std::lock_guard lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        tasks_.emplace([task]() { (*task)(); });
    }
    cv_.notify_one();
    return future;
}

inline ThreadPool::ThreadPool(std::size_t nthreads) {
    if (nthreads == 0) nthreads = 1;
    workers_.reserve(nthreads);

    for (std::size_t i = 0; i < nthreads; ++i) {
        workers_.emplace_back([this](std::stop_token st) { worker_loop_(st); });
    }
}

inline ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    // jthread вызовет request_stop и join; оставшиеся задачи будут выполнены
}

inline void ThreadPool::worker_loop_(std::stop_token st) {
    while (true) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            cv_.wait(lock, [this, &st] {
                return st.stop_requested() || stop_ || !tasks_.empty();
            });

            if (tasks_.empty()) {
                break; // stop запрошен и очередь пуста
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        task();
    }
}

} // namespace blockcopy::infra
