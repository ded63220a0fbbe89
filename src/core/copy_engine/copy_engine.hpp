#pragma once

#include <chrono>
#include <filesystem>
#include <expected>
#include <atomic>
#include <cstdint>
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/monitoring.hpp"
#include "../scanner/scanner.hpp"

namespace treecp::core {

struct CopyStatsSnapshot {
    // Результат сканирования
    std::uint64_t file_count = 0;
    std::uint64_t total_bytes = 0;
    std::uint64_t folder_count = 0;

    std::uint64_t folders_created = 0;
    std::uint64_t folder_errors = 0;
    std::uint64_t files_copied = 0;
    std::uint64_t bytes_copied = 0;
    std::uint64_t file_errors = 0;
    std::uint64_t inline_fallbacks = 0; // чанки, выполненные в вызывающем потоке

    std::chrono::nanoseconds scan_elapsed{0};
    std::chrono::nanoseconds folders_elapsed{0};
    std::chrono::nanoseconds files_elapsed{0};
    std::chrono::nanoseconds total_elapsed{0};

    [[nodiscard]] auto has_errors() const -> bool { return folder_errors > 0 || file_errors > 0; }
};

struct CopyStats {
    std::atomic<std::uint64_t> folders_created{0};
    std::atomic<std::uint64_t> folder_errors{0};
    std::atomic<std::uint64_t> files_copied{0};
    std::atomic<std::uint64_t> bytes_copied{0};
    std::atomic<std::uint64_t> file_errors{0};
    std::atomic<std::uint64_t> inline_fallbacks{0};

    CopyStats() = default;

    // Запрещаем копирование и перемещение (из-за atomic)
    CopyStats(const CopyStats&) = delete;
    CopyStats& operator=(const CopyStats&) = delete;
    CopyStats(CopyStats&&) = delete;
    CopyStats& operator=(CopyStats&&) = delete;

    void reset();
};

/// Оркестратор копирования дерева.
///
/// run(): сканирование (ошибка фатальна, до создания target) → фаза 1,
/// создание каталогов в пуле → барьер → фаза 2, копирование файлов в
/// новом пуле с обновлением monitor после каждого файла.
///
/// Число потоков из config задаёт и размер пулов, и целевое число
/// чанков; config.pool_size переопределяет только размер пулов.
///
/// Один CopyEngine можно запускать повторно: статистика и monitor
/// обнуляются в начале каждого прогона.
class CopyEngine {
public:
    explicit CopyEngine(infra::Config config,
                        infra::ProgressMonitor& monitor);

    [[nodiscard]] auto run(const std::filesystem::path& source,
                           const std::filesystem::path& target)
        -> std::expected<CopyStatsSnapshot, infra::Error>;

    /// Обе фазы по уже готовому результату сканирования.
    [[nodiscard]] auto execute(const ScanResult& scan,
                               const std::filesystem::path& source,
                               const std::filesystem::path& target)
        -> std::expected<CopyStatsSnapshot, infra::Error>;

private:
    const infra::Config config_;
    infra::ProgressMonitor& monitor_;

    [[nodiscard]] auto validate_() const -> infra::VoidResult;
    void replicate_phase_(const ScanResult& scan,
                          const std::filesystem::path& source,
                          const std::filesystem::path& target);
    void copy_phase_(const ScanResult& scan,
                     const std::filesystem::path& source,
                     const std::filesystem::path& target);
    [[nodiscard]] auto snapshot_(const ScanResult& scan) const -> CopyStatsSnapshot;

    // Статистика
    CopyStats stats_{};
};

} // namespace treecp::core
