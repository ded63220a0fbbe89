#include "args_parser.hpp"
#include <CLI/CLI.hpp>

namespace treecp::args_parser {

std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int& exit_code)
{
    CLIArgs args;
    CLI::App app{"treecp - parallel recursive directory copy"};
    app.set_version_flag("--version", "treecp 0.1.0");

    app.add_option("-s,--source", args.source, "Source directory path")
        ->required()
        ->check(CLI::ExistingDirectory);
    app.add_option("-t,--target", args.target, "Target directory path")
        ->required();
    app.add_option("--mt,-j,--threads", args.threads, "Number of threads to use")
        ->required()
        ->check(CLI::PositiveNumber);
    app.add_option("--config", args.config_path, "YAML config file")
        ->check(CLI::ExistingFile);
    app.add_option("--buffer-size", args.buffer_size, "Copy buffer size in bytes")
        ->check(CLI::PositiveNumber);
    app.add_option("--log-level", args.log_level, "trace|debug|info|warn|error|critical|off")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));
    bool no_progress = false;
    app.add_flag("--no-progress", no_progress, "Disable the progress bar");
    app.add_flag("-q,--quiet", args.quiet, "Only print warnings and errors");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // --help и --version тоже приходят сюда, с кодом 0
        exit_code = app.exit(e) == 0 ? 0 : 1;
        return std::nullopt;
    }

    args.progress = !no_progress;
    exit_code = 0;
    return args;
}

} // namespace treecp::args_parser
