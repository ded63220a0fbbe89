#pragma once

#include <cstdint>
#include <filesystem>
#include <span>

namespace treecp::core {

struct ReplicationStats {
    std::uint64_t created = 0;
    std::uint64_t failed = 0;
};

/// Воссоздаёт каталоги чанка под target_root (create_directories, идемпотентно).
/// Ошибка по одному каталогу логируется и не прерывает остальные.
auto replicate_folders(const std::filesystem::path& source_root,
                       const std::filesystem::path& target_root,
                       std::span<const std::filesystem::path> chunk) -> ReplicationStats;

} // namespace treecp::core
