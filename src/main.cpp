#include <chrono>
#include <exception>
#include <filesystem>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/copy_engine/copy_engine.hpp"

using ARGS = treecp::args_parser::CLIArgs;
using STATS = treecp::core::CopyStatsSnapshot;

constexpr auto load_from_cli = treecp::infra::config_from_cli;
constexpr auto args_parser = treecp::args_parser::parse_args;

static auto
print_summary(const STATS& stats)
-> void {
    spdlog::info("Files copied: {} / {} ({})",
                 stats.files_copied, stats.file_count,
                 treecp::infra::format_bytes(stats.bytes_copied));
    spdlog::info("Folders created: {} / {}", stats.folders_created, stats.folder_count);
    if (stats.has_errors()) {
        spdlog::warn("Errors: {} file(s), {} folder(s)", stats.file_errors, stats.folder_errors);
    }
}

int main(int argc, char** argv)
{
    const auto start_time = std::chrono::steady_clock::now();
    const auto print_elapsed = [&start_time] {
        fmt::print("\nTotal elapsed time: {}\n\n",
                   treecp::infra::format_duration(std::chrono::steady_clock::now() - start_time));
    };

    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        int exit_code = 0;
        auto args_opt = args_parser(argc, argv, exit_code);
        if (!args_opt) {
            return exit_code; // --help или ошибка
        }
        const ARGS& args = *args_opt;

        // 1. Загрузить из файла
        std::optional<std::filesystem::path> config_path;
        if (args.config_path) {
            config_path = *args.config_path;
        }
        auto config_res = treecp::infra::load_config_from_file(config_path);
        if (!config_res) {
            const auto code = config_res.error().to_exit_code();
            (void)treecp::infra::log_and_return(std::move(config_res.error()));
            return code;
        }
        auto config = *config_res;

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args));

        if (config.log_level) {
            auto level = treecp::infra::parse_log_level(*config.log_level);
            if (!level) {
                const auto code = level.error().to_exit_code();
                (void)treecp::infra::log_and_return(std::move(level.error()));
                return code;
            }
            spdlog::set_level(*level);
        }
        if (config.quiet && spdlog::get_level() < spdlog::level::warn) {
            spdlog::set_level(spdlog::level::warn);
        }

        spdlog::debug("Copying {} -> {} with {} thread(s)", args.source, args.target, *config.threads);

        treecp::infra::ProgressMonitor monitor(config.progress, config.quiet, config.progress_interval());
        treecp::core::CopyEngine engine(config, monitor);

        auto result = engine.run(args.source, args.target);
        if (!result) {
            const auto code = result.error().to_exit_code();
            (void)treecp::infra::log_and_return(std::move(result.error()));
            print_elapsed();
            return code;
        }

        print_summary(*result);
        print_elapsed();
        return result->has_errors() ? 2 : 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        print_elapsed();
        return 1;
    }
}
