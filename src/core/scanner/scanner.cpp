#include "scanner.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <system_error>

namespace treecp::core {

namespace fs = std::filesystem;

auto scan(const fs::path& root) -> infra::Result<ScanResult>
{
    std::error_code ec;
    const auto root_status = fs::status(root, ec);
    if (ec || !fs::exists(root_status)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ScanFailed,
            fmt::format("Source does not exist: {}", root.string())));
    }
    if (!fs::is_directory(root_status)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ScanFailed,
            fmt::format("Source must be a directory: {}", root.string())));
    }

    ScanResult result;
    fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
    if (ec) {
        return std::unexpected(infra::make_io_error(infra::ErrorCode::ScanFailed,
            "Cannot read directory", root.string(), ec));
    }

    for (const fs::recursive_directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec) {
            return std::unexpected(infra::make_io_error(infra::ErrorCode::ScanFailed,
                "Cannot read directory entry under", root.string(), ec));
        }

        const auto& entry = *it;
        const auto status = entry.symlink_status(ec);
        if (ec) {
            return std::unexpected(infra::make_io_error(infra::ErrorCode::ScanFailed,
                "Cannot stat", entry.path().string(), ec));
        }

        if (fs::is_directory(status)) {
            result.directories.push_back(entry.path());
        } else if (fs::is_regular_file(status)) {
            const auto size = entry.file_size(ec);
            if (ec) {
                return std::unexpected(infra::make_io_error(infra::ErrorCode::ScanFailed,
                    "Cannot get size of", entry.path().string(), ec));
            }
            ++result.file_count;
            result.total_bytes += size;
            result.files.push_back(entry.path());
        } else {
            spdlog::debug("Skipping non-regular entry: {}", entry.path().string());
        }
    }
    // increment() на последнем элементе тоже может вернуть ошибку
    if (ec) {
        return std::unexpected(infra::make_io_error(infra::ErrorCode::ScanFailed,
            "Cannot read directory entry under", root.string(), ec));
    }

    spdlog::debug("Scanned {}: {} files, {} folders, {} bytes",
                  root.string(), result.file_count, result.directories.size(), result.total_bytes);
    return result;
}

} // namespace treecp::core
