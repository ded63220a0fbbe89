#pragma once

#include "error_handler/error.hpp"
#include "thread_pool/thread_pool.hpp"
#include <chrono>
#include <thread>
#include <utility>

namespace treecp::infra {
/*

auto outcome = infra::submit_or_run_inline(pool, [&, chunk] {
    copy_files(source, target, chunk, monitor, buffer_size);
}, infra::RetryPolicy{ .backoff = std::chrono::milliseconds(50) });

*/
struct RetryPolicy {
    std::chrono::milliseconds backoff = std::chrono::milliseconds(1000);
};

enum class SubmitOutcome {
    Queued,     // задачу забрал воркер пула
    RanInline,  // пул был занят, задача выполнена в вызывающем потоке
};

/// Отдаёт работу в пул; если пул не может принять её сразу, ждёт
/// policy.backoff и выполняет работу синхронно. Работа выполняется
/// ровно один раз в любом случае.
template<typename F>
[[nodiscard]] auto submit_or_run_inline(ThreadPool& pool, F&& work, const RetryPolicy& policy = {})
    -> SubmitOutcome
{
    auto submitted = pool.try_submit(ThreadPool::Task{work});
    if (submitted) {
        return SubmitOutcome::Queued;
    }

    const auto& err = submitted.error();
    if (!err.is_transient()) {
        // Пул закрыт: работу всё равно нельзя потерять
        spdlog::warn("Submit rejected ({}), running inline", err.message);
    } else {
        spdlog::debug("Submit failed: {}; retrying inline in {} ms", err.message, policy.backoff.count());
    }

    if (policy.backoff.count() > 0) {
        std::this_thread::sleep_for(policy.backoff);
    }
    std::forward<F>(work)();
    return SubmitOutcome::RanInline;
}

} // namespace treecp::infra
