#include "folder_replicator.hpp"
#include <system_error>
#include "adapters/fs.hpp"
#include "infra/error_handler/error.hpp"

namespace treecp::core {

auto replicate_folders(const std::filesystem::path& source_root,
                       const std::filesystem::path& target_root,
                       std::span<const std::filesystem::path> chunk) -> ReplicationStats
{
    ReplicationStats stats;
    for (const auto& folder : chunk) {
        const auto dst = adapters::fs::map_to_target(source_root, target_root, folder);

        std::error_code ec;
        std::filesystem::create_directories(dst, ec);
        if (ec) {
            ++stats.failed;
            (void)infra::log_and_return(infra::make_io_error(
                infra::ErrorCode::DirectoryCreateFailed, "Error creating directory", dst.string(), ec));
            continue;
        }
        ++stats.created;
    }
    return stats;
}

} // namespace treecp::core
