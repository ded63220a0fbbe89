#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>
#include "infra/error_handler/error.hpp"

namespace treecp::core {

struct ScanResult {
    std::uint64_t file_count = 0;
    std::uint64_t total_bytes = 0;
    std::vector<std::filesystem::path> directories; // без самого корня
    std::vector<std::filesystem::path> files;

    [[nodiscard]] auto folder_count() const -> std::uint64_t { return directories.size(); }
};

/// Однопроходный обход дерева под root.
///
/// Каталоги попадают в directories, обычные файлы в files (с учётом
/// размера). Симлинки и спецфайлы пропускаются, в каталоги-симлинки
/// обход не заходит. Любая ошибка чтения прерывает сканирование с
/// ErrorCode::ScanFailed: частичный результат не возвращается.
[[nodiscard]] auto scan(const std::filesystem::path& root) -> infra::Result<ScanResult>;

} // namespace treecp::core
