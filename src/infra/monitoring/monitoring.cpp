#include "monitoring.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <array>
#include <iostream>

namespace treecp::infra {

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet, std::chrono::milliseconds render_interval)
    : enabled_(enabled && !quiet)
    , quiet_(quiet)
    , render_interval_(render_interval)
    , start_time_(std::chrono::steady_clock::now())
{}

ProgressMonitor::~ProgressMonitor() {
    finish();
}

void ProgressMonitor::reset() {
    stop_rendering_thread_();
    processed_files_.store(0);
    processed_bytes_.store(0);
    total_files_.store(0);
    total_bytes_.store(0);
    start_time_ = std::chrono::steady_clock::now();
    finished_.store(false);
}

void ProgressMonitor::set_total(std::uint64_t files, std::uint64_t bytes) {
    total_files_.store(files);
    total_bytes_.store(bytes);
    start_time_ = std::chrono::steady_clock::now();
    if (enabled_ && !render_thread_ && !finished_.load()) {
        start_rendering_thread_();
    }
}

void ProgressMonitor::update(std::uint64_t files, std::uint64_t bytes) {
    processed_files_.fetch_add(files, std::memory_order_relaxed);
    processed_bytes_.fetch_add(bytes, std::memory_order_relaxed);
}

void ProgressMonitor::finish() {
    if (finished_.exchange(true)) {
        return;
    }
    stop_rendering_thread_();
    if (enabled_) {
        render_();
        std::cout << "\n" << std::flush; // финальный перенос
    }
}

auto ProgressMonitor::get_stats() const -> Stats {
    return Stats{
        .total_files = total_files_.load(),
        .processed_files = processed_files_.load(),
        .total_bytes = total_bytes_.load(),
        .processed_bytes = processed_bytes_.load(),
        .start_time = start_time_
    };
}

void ProgressMonitor::start_rendering_thread_() {
    render_thread_ = std::make_unique<std::jthread>([this](std::stop_token st) {
        while (!st.stop_requested()) {
            render_();
            std::this_thread::sleep_for(render_interval_);
        }
    });
}

void ProgressMonitor::stop_rendering_thread_() {
    if (render_thread_) {
        render_thread_->request_stop();
        render_thread_->join();
        render_thread_.reset();
    }
}

void ProgressMonitor::render_() const {
    if (quiet_ || !enabled_) return;

    // Очистка строки и вывод
    std::cout << "\r\033[K" << format_line(get_stats(), std::chrono::steady_clock::now()) << std::flush;
}

auto ProgressMonitor::format_line(const Stats& stats,
                                  std::chrono::steady_clock::time_point now,
                                  int bar_width) -> std::string
{
    const auto total = stats.total_files;
    const auto done = std::min(stats.processed_files, total);

    const double ratio = total == 0 ? 1.0 : static_cast<double>(done) / static_cast<double>(total);
    const int filled = static_cast<int>(ratio * bar_width);

    std::string bar;
    bar.reserve(static_cast<std::size_t>(bar_width));
    if (filled >= bar_width) {
        bar.assign(static_cast<std::size_t>(bar_width), '=');
    } else {
        bar.append(static_cast<std::size_t>(filled), '=');
        bar.push_back('>');
        bar.append(static_cast<std::size_t>(bar_width - filled - 1), '-');
    }

    return fmt::format("{} / {} [{}] {:.2f}% {}",
                       done, total, bar, ratio * 100.0,
                       format_duration(now - stats.start_time));
}

auto format_bytes(std::uint64_t bytes) -> std::string {
    static constexpr std::array<const char*, 6> units{"KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};
    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }

    double value = static_cast<double>(bytes) / 1024.0;
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }
    if (value < 10.0) {
        return fmt::format("{:.1f} {}", value, units[unit]);
    }
    return fmt::format("{:.0f} {}", value, units[unit]);
}

auto format_duration(std::chrono::nanoseconds elapsed) -> std::string {
    using namespace std::chrono;
    if (elapsed < nanoseconds::zero()) {
        elapsed = nanoseconds::zero();
    }
    if (elapsed < seconds(1)) {
        return fmt::format("{}ms", duration_cast<milliseconds>(elapsed).count());
    }
    if (elapsed < minutes(1)) {
        return fmt::format("{:.3f}s", duration<double>(elapsed).count());
    }

    const auto total_sec = duration_cast<seconds>(elapsed).count();
    const auto hours = total_sec / 3600;
    const auto mins = (total_sec % 3600) / 60;
    const auto secs = total_sec % 60;
    if (hours > 0) {
        return fmt::format("{}h{:02d}m{:02d}s", hours, mins, secs);
    }
    return fmt::format("{}m{:02d}s", mins, secs);
}

} // namespace treecp::infra
