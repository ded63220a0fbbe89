#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include "adapters/fs.hpp"
#include "infra/monitoring/monitoring.hpp"

namespace treecp::core {

struct CopyChunkStats {
    std::uint64_t copied = 0;
    std::uint64_t failed = 0;
    std::uint64_t bytes = 0;
};

/// Копирует файлы чанка под target_root.
///
/// Ошибка по одному файлу (open/create/copy) логируется вместе с путём и
/// не прерывает чанк. После каждого файла, успешного или нет, monitor
/// продвигается на один файл, так что итоговый счётчик всегда доходит до
/// total. Каталоги назначения должны уже существовать.
auto copy_files(const std::filesystem::path& source_root,
                const std::filesystem::path& target_root,
                std::span<const std::filesystem::path> chunk,
                infra::ProgressMonitor& monitor,
                std::size_t buffer_size = infra::kDefaultBufferSize) -> CopyChunkStats;

} // namespace treecp::core
