#include "fs.hpp"

#include <cerrno>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace treecp::adapters::fs {

namespace {

std::error_code last_error() {
    return {errno, std::generic_category()};
}

// write() может записать меньше запрошенного: дописываем до конца
std::error_code write_all(int fd, const char* data, std::size_t size) {
    while (size > 0) {
        const ssize_t written = ::write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) continue;
            return last_error();
        }
        data += written;
        size -= static_cast<std::size_t>(written);
    }
    return {};
}

} // namespace

FileHandle::~FileHandle() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

FileHandle::FileHandle(FileHandle&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
{}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

auto FileHandle::open_read(const std::filesystem::path& path) -> infra::Result<FileHandle> {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) {
        return std::unexpected(infra::make_io_error(infra::ErrorCode::FileOpenFailed,
                                                    "Cannot open source file", path.string(), last_error()));
    }
    return FileHandle{fd};
}

auto FileHandle::create_truncate(const std::filesystem::path& path) -> infra::Result<FileHandle> {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd == -1) {
        return std::unexpected(infra::make_io_error(infra::ErrorCode::FileCreateFailed,
                                                    "Failed to create target file", path.string(), last_error()));
    }
    return FileHandle{fd};
}

auto FileHandle::close() noexcept -> std::error_code {
    if (fd_ < 0) {
        return {};
    }
    const int fd = std::exchange(fd_, -1);
    if (::close(fd) == -1) {
        return last_error();
    }
    return {};
}

auto map_to_target(const std::filesystem::path& source_root,
                   const std::filesystem::path& target_root,
                   const std::filesystem::path& path) -> std::filesystem::path
{
    auto relative = path.lexically_relative(source_root);
    if (relative.empty()) {
        // Путь вне source_root: кладём по имени файла
        relative = path.filename();
    }
    return (target_root / relative).lexically_normal();
}

auto copy_file_buffered(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    std::size_t buffer_size
) -> infra::Result<std::uint64_t>
{
    auto in = FileHandle::open_read(src);
    if (!in) {
        return std::unexpected(std::move(in.error()));
    }
    auto out = FileHandle::create_truncate(dst);
    if (!out) {
        return std::unexpected(std::move(out.error()));
    }

    std::vector<char> buffer(buffer_size == 0 ? infra::kDefaultBufferSize : buffer_size);
    std::uint64_t copied = 0;
    for (;;) {
        const ssize_t n = ::read(in->get(), buffer.data(), buffer.size());
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::make_io_error(infra::ErrorCode::FileCopyFailed,
                                                        "Failed to read", src.string(), last_error()));
        }
        if (auto ec = write_all(out->get(), buffer.data(), static_cast<std::size_t>(n))) {
            return std::unexpected(infra::make_io_error(infra::ErrorCode::FileCopyFailed,
                                                        "Failed to write", dst.string(), ec));
        }
        copied += static_cast<std::uint64_t>(n);
    }

    if (auto ec = out->close()) {
        return std::unexpected(infra::make_io_error(infra::ErrorCode::FileCopyFailed,
                                                    "Failed to close", dst.string(), ec));
    }
    return copied;
}

} // namespace treecp::adapters::fs
