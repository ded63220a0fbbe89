#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

#include "infra/monitoring/monitoring.hpp"

using namespace std::chrono_literals;
using treecp::infra::ProgressMonitor;
using treecp::infra::format_bytes;
using treecp::infra::format_duration;

TEST(ProgressMonitorTest, ConcurrentUpdatesAreNotLost)
{
    ProgressMonitor monitor(false);
    monitor.set_total(8000, 8000 * 3);

    std::vector<std::jthread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&monitor] {
            for (int i = 0; i < 1000; ++i) {
                monitor.update(1, 3);
            }
        });
    }
    workers.clear(); // join

    const auto stats = monitor.get_stats();
    EXPECT_EQ(stats.processed_files, 8000u);
    EXPECT_EQ(stats.total_files, 8000u);
    EXPECT_EQ(stats.processed_bytes, 24000u);
}

TEST(ProgressMonitorTest, FinishIsIdempotent)
{
    ProgressMonitor monitor(false);
    monitor.set_total(1, 0);
    EXPECT_FALSE(monitor.is_finished());
    monitor.finish();
    monitor.finish();
    EXPECT_TRUE(monitor.is_finished());
}

TEST(ProgressMonitorTest, ResetStartsNewRun)
{
    ProgressMonitor monitor(false);
    monitor.set_total(2, 20);
    monitor.update(2, 20);
    monitor.finish();

    monitor.reset();
    EXPECT_FALSE(monitor.is_finished());
    auto stats = monitor.get_stats();
    EXPECT_EQ(stats.processed_files, 0u);
    EXPECT_EQ(stats.processed_bytes, 0u);
    EXPECT_EQ(stats.total_files, 0u);

    monitor.set_total(3, 30);
    monitor.update(1, 10);
    stats = monitor.get_stats();
    EXPECT_EQ(stats.total_files, 3u);
    EXPECT_EQ(stats.processed_files, 1u);
    monitor.finish();
    EXPECT_TRUE(monitor.is_finished());
}

TEST(ProgressMonitorTest, QuietDisablesRendering)
{
    ProgressMonitor monitor(true, true);
    EXPECT_FALSE(monitor.is_enabled());
}

TEST(ProgressMonitorTest, RenderingThreadStopsOnFinish)
{
    ProgressMonitor monitor(true, false, 1ms);
    monitor.set_total(2, 0);
    monitor.update(1);
    std::this_thread::sleep_for(5ms);
    monitor.update(1);
    monitor.finish();
    EXPECT_EQ(monitor.get_stats().processed_files, 2u);
}

TEST(FormatLineTest, CountersBarAndPercent)
{
    const auto now = std::chrono::steady_clock::now();
    ProgressMonitor::Stats stats{.total_files = 3, .processed_files = 2, .start_time = now};
    EXPECT_EQ(ProgressMonitor::format_line(stats, now, 10), "2 / 3 [======>---] 66.67% 0ms");
}

TEST(FormatLineTest, CompletedIsClampedToTotal)
{
    const auto now = std::chrono::steady_clock::now();
    ProgressMonitor::Stats stats{.total_files = 3, .processed_files = 5, .start_time = now};
    EXPECT_EQ(ProgressMonitor::format_line(stats, now, 10), "3 / 3 [==========] 100.00% 0ms");
}

TEST(FormatLineTest, EmptyRunIsComplete)
{
    const auto now = std::chrono::steady_clock::now();
    ProgressMonitor::Stats stats{.start_time = now};
    EXPECT_EQ(ProgressMonitor::format_line(stats, now, 4), "0 / 0 [====] 100.00% 0ms");
}

TEST(FormatLineTest, StartOfRun)
{
    const auto now = std::chrono::steady_clock::now();
    ProgressMonitor::Stats stats{.total_files = 10, .start_time = now - 1500ms};
    EXPECT_EQ(ProgressMonitor::format_line(stats, now, 5), "0 / 10 [>----] 0.00% 1.500s");
}

TEST(FormatBytesTest, IecUnits)
{
    EXPECT_EQ(format_bytes(0), "0 B");
    EXPECT_EQ(format_bytes(15), "15 B");
    EXPECT_EQ(format_bytes(1023), "1023 B");
    EXPECT_EQ(format_bytes(1536), "1.5 KiB");
    EXPECT_EQ(format_bytes(10 * 1024), "10 KiB");
    EXPECT_EQ(format_bytes(1024 * 1024), "1.0 MiB");
    EXPECT_EQ(format_bytes(340ull * 1024 * 1024), "340 MiB");
    EXPECT_EQ(format_bytes(5ull * 1024 * 1024 * 1024 * 1024), "5.0 TiB");
}

TEST(FormatDurationTest, Ranges)
{
    EXPECT_EQ(format_duration(850ms), "850ms");
    EXPECT_EQ(format_duration(12345ms), "12.345s");
    EXPECT_EQ(format_duration(std::chrono::seconds(187)), "3m07s");
    EXPECT_EQ(format_duration(std::chrono::seconds(3723)), "1h02m03s");
    EXPECT_EQ(format_duration(-5ms), "0ms");
}
