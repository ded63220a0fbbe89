#pragma once

#include <string>
#include <cstdint>
#include <optional>

namespace treecp::args_parser {

struct CLIArgs
{
    std::string source;                      // -s, --source
    std::string target;                      // -t, --target
    std::optional<std::uint32_t> threads;    // --mt, -j, --threads=N
    std::optional<std::string> config_path;  // --config=FILE
    std::optional<std::size_t> buffer_size;  // --buffer-size=BYTES
    std::optional<std::string> log_level;    // --log-level=LEVEL
    bool progress{true};                     // --no-progress
    bool quiet{false};                       // -q, --quiet
};

/// Parses command-line arguments and returns a CLIArgs struct.
/// Returns std::nullopt after printing help or a usage error; exit_code
/// receives the code main should return in that case.
std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int& exit_code);

} // namespace treecp::args_parser
