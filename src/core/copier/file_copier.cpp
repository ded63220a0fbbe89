#include "file_copier.hpp"
#include <utility>
#include "infra/error_handler/error.hpp"

namespace treecp::core {

auto copy_files(const std::filesystem::path& source_root,
                const std::filesystem::path& target_root,
                std::span<const std::filesystem::path> chunk,
                infra::ProgressMonitor& monitor,
                std::size_t buffer_size) -> CopyChunkStats
{
    CopyChunkStats stats;
    for (const auto& file : chunk) {
        const auto dst = adapters::fs::map_to_target(source_root, target_root, file);

        auto res = adapters::fs::copy_file_buffered(file, dst, buffer_size);
        if (res) {
            ++stats.copied;
            stats.bytes += *res;
            monitor.update(1, *res);
        } else {
            ++stats.failed;
            (void)infra::log_and_return(std::move(res.error()));
            monitor.update(1, 0); // учитываем файл как обработанный
        }
    }
    return stats;
}

} // namespace treecp::core
