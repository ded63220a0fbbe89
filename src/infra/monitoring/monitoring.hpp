#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <memory>
#include <thread>

namespace treecp::infra {

class ProgressMonitor {
public:
    struct Stats {
        std::uint64_t total_files = 0;
        std::uint64_t processed_files = 0;
        std::uint64_t total_bytes = 0;
        std::uint64_t processed_bytes = 0;
        std::chrono::steady_clock::time_point start_time{};
    };

    explicit ProgressMonitor(bool enabled = true, bool quiet = false,
                             std::chrono::milliseconds render_interval = std::chrono::milliseconds(100));
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    // Обнуляет счётчики для нового прогона, останавливает отрисовку
    void reset();
    // Вызывается один раз перед фазой копирования, запускает отрисовку
    void set_total(std::uint64_t files, std::uint64_t bytes);
    // Потокобезопасно, вызывается воркерами после каждого файла
    void update(std::uint64_t files = 0, std::uint64_t bytes = 0);
    // Останавливает отрисовку и печатает финальную строку (один раз)
    void finish();

    [[nodiscard]] auto get_stats() const -> Stats;
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }
    [[nodiscard]] auto is_finished() const -> bool { return finished_.load(); }

    /// "<done> / <total> [=====>----] <pct>% <elapsed>"
    [[nodiscard]] static auto format_line(const Stats& stats,
                                          std::chrono::steady_clock::time_point now,
                                          int bar_width = 40) -> std::string;

private:
    void render_() const;
    void start_rendering_thread_();
    void stop_rendering_thread_();

    // Атомики для thread-safe обновления
    std::atomic<std::uint64_t> processed_files_{0};
    std::atomic<std::uint64_t> processed_bytes_{0};
    std::atomic<std::uint64_t> total_files_{0};
    std::atomic<std::uint64_t> total_bytes_{0};

    const bool enabled_;
    const bool quiet_;
    const std::chrono::milliseconds render_interval_;
    std::chrono::steady_clock::time_point start_time_;
    std::atomic<bool> finished_{false};
    std::unique_ptr<std::jthread> render_thread_;
};

/// Размер в единицах IEC: "15 B", "1.5 KiB", "340 MiB"
[[nodiscard]] auto format_bytes(std::uint64_t bytes) -> std::string;

/// "850ms", "12.345s", "3m07s", "1h02m03s"
[[nodiscard]] auto format_duration(std::chrono::nanoseconds elapsed) -> std::string;

} // namespace treecp::infra
