#include "copy_engine.hpp"
#include <filesystem>
#include <system_error>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../infra/retry.hpp"
#include "../../infra/thread_pool/thread_pool.hpp"
#include "../partitioner/partitioner.hpp"
#include "../replicator/folder_replicator.hpp"
#include "../copier/file_copier.hpp"

namespace treecp::core {

namespace {

using Clock = std::chrono::steady_clock;

} // namespace

void CopyStats::reset() {
    folders_created.store(0);
    folder_errors.store(0);
    files_copied.store(0);
    bytes_copied.store(0);
    file_errors.store(0);
    inline_fallbacks.store(0);
}

CopyEngine::CopyEngine(infra::Config config,
                       infra::ProgressMonitor& monitor)
    : config_(std::move(config)), monitor_(monitor) {}

auto CopyEngine::validate_() const -> infra::VoidResult {
    if (!config_.threads || *config_.threads == 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                                                 "Number of threads must be positive"));
    }
    if (config_.pool_size && *config_.pool_size == 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                                                 "Pool size must be positive"));
    }
    return {};
}

auto CopyEngine::run(const std::filesystem::path& source,
                     const std::filesystem::path& target)
    -> std::expected<CopyStatsSnapshot, infra::Error>
{
    const auto start = Clock::now();
    if (auto valid = validate_(); !valid) {
        return std::unexpected(std::move(valid.error()));
    }

    // Сканирование: однопоточный барьер, до создания чего-либо в target
    auto scan_result = scan(source);
    if (!scan_result) {
        return std::unexpected(std::move(scan_result.error()));
    }
    const auto& scanned = *scan_result;
    const auto scan_elapsed = Clock::now() - start;

    spdlog::info("Size {} of total files / folders: {} / {}.\tElapsed time: {}",
                 infra::format_bytes(scanned.total_bytes), scanned.file_count,
                 scanned.folder_count(), infra::format_duration(scan_elapsed));

    auto result = execute(scanned, source, target);
    if (!result) {
        return result;
    }
    result->scan_elapsed = scan_elapsed;
    result->total_elapsed = Clock::now() - start;
    return result;
}

auto CopyEngine::execute(const ScanResult& scan,
                         const std::filesystem::path& source,
                         const std::filesystem::path& target)
    -> std::expected<CopyStatsSnapshot, infra::Error>
{
    if (auto valid = validate_(); !valid) {
        return std::unexpected(std::move(valid.error()));
    }
    stats_.reset();

    const auto start = Clock::now();
    {
        std::error_code ec;
        std::filesystem::create_directories(target, ec);
        if (ec) {
            return std::unexpected(infra::make_io_error(infra::ErrorCode::InvalidArgument,
                                                        "Cannot create target", target.string(), ec));
        }
    }

    // Фаза 1: каталоги. stop() внутри: барьер перед копированием файлов
    replicate_phase_(scan, source, target);
    const auto folders_done = Clock::now();
    spdlog::info("Created all folders in destination.\tElapsed time: {}",
                 infra::format_duration(folders_done - start));

    // Фаза 2: файлы
    copy_phase_(scan, source, target);
    const auto files_done = Clock::now();

    auto snapshot = snapshot_(scan);
    snapshot.folders_elapsed = folders_done - start;
    snapshot.files_elapsed = files_done - folders_done;
    snapshot.total_elapsed = files_done - start;

    if (snapshot.inline_fallbacks > 0) {
        spdlog::debug("{} chunk(s) ran inline after a full pool", snapshot.inline_fallbacks);
    }
    return snapshot;
}

void CopyEngine::replicate_phase_(const ScanResult& scan,
                                  const std::filesystem::path& source,
                                  const std::filesystem::path& target)
{
    const auto chunks = partition(scan.directories, *config_.threads);
    spdlog::debug("Replicating {} folders in {} chunk(s)", scan.directories.size(), chunks.size());

    const infra::RetryPolicy policy{.backoff = config_.submit_backoff()};
    infra::ThreadPool pool{config_.effective_pool_size(),
                           config_.queue_capacity.value_or(infra::kDefaultQueueCapacity)};

    for (const auto chunk : chunks) {
        const auto outcome = infra::submit_or_run_inline(pool, [this, &source, &target, chunk]() {
            const auto res = replicate_folders(source, target, chunk);
            stats_.folders_created.fetch_add(res.created, std::memory_order_relaxed);
            stats_.folder_errors.fetch_add(res.failed, std::memory_order_relaxed);
        }, policy);
        if (outcome == infra::SubmitOutcome::RanInline) {
            stats_.inline_fallbacks.fetch_add(1, std::memory_order_relaxed);
        }
    }

    pool.stop();
}

void CopyEngine::copy_phase_(const ScanResult& scan,
                             const std::filesystem::path& source,
                             const std::filesystem::path& target)
{
    monitor_.reset();
    monitor_.set_total(scan.file_count, scan.total_bytes);

    const auto chunks = partition(scan.files, *config_.threads);
    spdlog::debug("Copying {} files in {} chunk(s)", scan.files.size(), chunks.size());

    const auto buffer_size = config_.effective_buffer_size();
    const infra::RetryPolicy policy{.backoff = config_.submit_backoff()};
    infra::ThreadPool pool{config_.effective_pool_size(),
                           config_.queue_capacity.value_or(infra::kDefaultQueueCapacity)};

    for (const auto chunk : chunks) {
        const auto outcome = infra::submit_or_run_inline(pool, [this, &source, &target, chunk, buffer_size]() {
            const auto res = copy_files(source, target, chunk, monitor_, buffer_size);
            stats_.files_copied.fetch_add(res.copied, std::memory_order_relaxed);
            stats_.bytes_copied.fetch_add(res.bytes, std::memory_order_relaxed);
            stats_.file_errors.fetch_add(res.failed, std::memory_order_relaxed);
        }, policy);
        if (outcome == infra::SubmitOutcome::RanInline) {
            stats_.inline_fallbacks.fetch_add(1, std::memory_order_relaxed);
        }
    }

    pool.stop();
    monitor_.finish();
}

auto CopyEngine::snapshot_(const ScanResult& scan) const -> CopyStatsSnapshot {
    // Возвращаем снимок статистики
    return CopyStatsSnapshot{
        .file_count = scan.file_count,
        .total_bytes = scan.total_bytes,
        .folder_count = scan.folder_count(),
        .folders_created = stats_.folders_created.load(),
        .folder_errors = stats_.folder_errors.load(),
        .files_copied = stats_.files_copied.load(),
        .bytes_copied = stats_.bytes_copied.load(),
        .file_errors = stats_.file_errors.load(),
        .inline_fallbacks = stats_.inline_fallbacks.load(),
    };
}

} // namespace treecp::core
