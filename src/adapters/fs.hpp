#pragma once

#include <filesystem>
#include <expected>
#include <cstddef>
#include <cstdint>
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"

namespace treecp::adapters::fs {

/// Владеющий POSIX-дескриптор. Закрывается в деструкторе на любом пути выхода.
class FileHandle {
public:
    FileHandle() = default;
    explicit FileHandle(int fd) noexcept : fd_(fd) {}
    ~FileHandle();

    FileHandle(FileHandle&& other) noexcept;
    FileHandle& operator=(FileHandle&& other) noexcept;
    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    [[nodiscard]] static auto open_read(const std::filesystem::path& path)
        -> infra::Result<FileHandle>;
    [[nodiscard]] static auto create_truncate(const std::filesystem::path& path)
        -> infra::Result<FileHandle>;

    [[nodiscard]] auto get() const noexcept -> int { return fd_; }
    [[nodiscard]] auto is_open() const noexcept -> bool { return fd_ >= 0; }

    // Явное закрытие с проверкой ошибки (важно для записи)
    [[nodiscard]] auto close() noexcept -> std::error_code;

private:
    int fd_ = -1;
};

/// Путь назначения: target_root / (path относительно source_root)
[[nodiscard]] auto map_to_target(const std::filesystem::path& source_root,
                                 const std::filesystem::path& target_root,
                                 const std::filesystem::path& path) -> std::filesystem::path;

/// Потоковое копирование через буфер фиксированного размера.
/// Возвращает число скопированных байт.
/// Ошибки: FileOpenFailed, FileCreateFailed, FileCopyFailed.
[[nodiscard]] auto copy_file_buffered(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    std::size_t buffer_size = infra::kDefaultBufferSize
) -> infra::Result<std::uint64_t>;

} // namespace treecp::adapters::fs
