#pragma once

#include <cstddef>
#include <functional>
#include <thread>
#include <mutex>
#include <queue>
#include <condition_variable>
#include <vector>
#include <exception>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../error_handler/error.hpp"

namespace treecp::infra {

/// Пул фиксированного размера с неблокирующей передачей задач.
///
/// try_submit() принимает задачу только если её может сразу забрать
/// свободный воркер (плюс не более queue_capacity задач в очереди сверх
/// этого). Иначе возвращается ErrorCode::QueueFull, и решение остаётся
/// за вызывающим кодом (см. retry.hpp).
///
/// Конструктор возвращается, когда все воркеры дошли до ожидания задачи,
/// так что первые nthreads вызовов try_submit() всегда проходят.
///
/// stop() закрывает очередь и ждёт, пока воркеры доработают все принятые
/// задачи. Нельзя вызывать stop() из задачи самого пула.
class ThreadPool {
public:
    using Task = std::function<void()>;

    explicit ThreadPool(std::size_t nthreads, std::size_t queue_capacity = 0);
    ~ThreadPool();

    // Удалить копирование и присваивание
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    [[nodiscard]] auto try_submit(Task task) -> VoidResult;

    // Закрыть очередь и дождаться выхода всех воркеров (барьер фазы)
    void stop();

    [[nodiscard]] auto size() const -> std::size_t { return nthreads_; }
    [[nodiscard]] auto is_stopped() const -> bool;

private:
    void worker_loop_();

    const std::size_t nthreads_;
    const std::size_t queue_capacity_;

    std::vector<std::jthread> workers_;
    std::queue<Task> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::condition_variable ready_cv_; // воркер встал в ожидание
    std::size_t idle_workers_ = 0; // воркеры, ждущие задачу в cv_.wait
    bool stop_ = false;
};

// =============== Реализация ===============

inline ThreadPool::ThreadPool(std::size_t nthreads, std::size_t queue_capacity)
    : nthreads_(nthreads == 0 ? 1 : nthreads)
    , queue_capacity_(queue_capacity)
{
    workers_.reserve(nthreads_);
    try {
        for (std::size_t i = 0; i < nthreads_; ++i) {
            workers_.emplace_back([this] { worker_loop_(); });
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to start worker thread: {}", e.what());
        // Уже запущенные воркеры должны выйти, иначе ~jthread зависнет на join
        stop();
        throw;
    }

    std::unique_lock lock(queue_mutex_);
    ready_cv_.wait(lock, [this] { return idle_workers_ == nthreads_; });
}

inline ThreadPool::~ThreadPool() {
    stop();
}

inline auto ThreadPool::try_submit(Task task) -> VoidResult {
    {
        std::lock_guard lock(queue_mutex_);
        if (stop_) {
            return std::unexpected(make_error(ErrorCode::PoolStopped, "ThreadPool is stopped"));
        }
        if (tasks_.size() >= idle_workers_ + queue_capacity_) {
            return std::unexpected(make_error(ErrorCode::QueueFull,
                fmt::format("task queue is full ({} queued, {} idle workers)",
                            tasks_.size(), idle_workers_)));
        }
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
    return {};
}

inline void ThreadPool::stop() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

inline auto ThreadPool::is_stopped() const -> bool {
    std::lock_guard lock(queue_mutex_);
    return stop_;
}

inline void ThreadPool::worker_loop_() {
    for (;;) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            if (++idle_workers_ == nthreads_) {
                ready_cv_.notify_all();
            }
            cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
            --idle_workers_;

            // Очередь закрыта и пуста: воркер завершается
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Worker task failed: {}", e.what());
        }
    }
}

} // namespace treecp::infra
