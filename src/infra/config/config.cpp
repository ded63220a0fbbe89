#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <string>
#include <vector>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace treecp::infra {

namespace {

auto get_config_paths() -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> paths;

    // 1. Локальный файл
    paths.emplace_back(".treecp.yaml");

    // 2. Глобальный файл
    const char* config_home = std::getenv("XDG_CONFIG_HOME");
    if (config_home && std::filesystem::exists(config_home)) {
        paths.push_back(std::filesystem::path(config_home) / "treecp" / "config.yaml");
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            paths.push_back(std::filesystem::path(home) / ".config" / "treecp" / "config.yaml");
        }
    }

    return paths;
}

auto parse_node(const YAML::Node& config, std::string_view origin) -> Result<Config> {
    Config cfg{};
    try {
        if (config.IsNull()) {
            return cfg;
        }
        if (!config.IsMap()) {
            return std::unexpected(make_error(ErrorCode::ConfigError,
                fmt::format("{}: top-level YAML node must be a map", origin)));
        }

        if (config["threads"]) cfg.threads = config["threads"].as<std::uint32_t>();
        if (config["pool_size"]) cfg.pool_size = config["pool_size"].as<std::uint32_t>();
        if (config["queue_capacity"]) cfg.queue_capacity = config["queue_capacity"].as<std::size_t>();
        if (config["submit_backoff_ms"]) cfg.submit_backoff_ms = config["submit_backoff_ms"].as<std::uint32_t>();
        if (config["buffer_size"]) cfg.buffer_size = config["buffer_size"].as<std::size_t>();

        if (config["progress"]) cfg.progress = config["progress"].as<bool>();
        if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
        if (config["progress_interval_ms"]) cfg.progress_interval_ms = config["progress_interval_ms"].as<std::uint32_t>();
        if (config["log_level"]) cfg.log_level = config["log_level"].as<std::string>();
    } catch (const YAML::Exception& e) {
        return std::unexpected(make_error(ErrorCode::ConfigError,
            fmt::format("Failed to parse {}: {}", origin, e.what())));
    }

    if (cfg.threads && *cfg.threads == 0) {
        return std::unexpected(make_error(ErrorCode::ConfigError,
            fmt::format("{}: threads must be positive", origin)));
    }
    if (cfg.pool_size && *cfg.pool_size == 0) {
        return std::unexpected(make_error(ErrorCode::ConfigError,
            fmt::format("{}: pool_size must be positive", origin)));
    }
    if (cfg.buffer_size && *cfg.buffer_size == 0) {
        return std::unexpected(make_error(ErrorCode::ConfigError,
            fmt::format("{}: buffer_size must be positive", origin)));
    }
    if (cfg.log_level) {
        if (auto level = parse_log_level(*cfg.log_level); !level) {
            return std::unexpected(std::move(level.error()));
        }
    }
    return cfg;
}

auto load_file(const std::filesystem::path& path) -> Result<Config> {
    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return std::unexpected(make_error(ErrorCode::ConfigError,
            fmt::format("Failed to parse {}: {}", path.string(), e.what())));
    }

    auto cfg = parse_node(node, path.string());
    if (cfg) {
        spdlog::debug("Loaded config from {}", path.string());
    }
    return cfg;
}

} // namespace

void Config::merge_with(const Config& other) {
    if (other.threads) threads = other.threads;
    if (other.pool_size) pool_size = other.pool_size;
    if (other.queue_capacity) queue_capacity = other.queue_capacity;
    if (other.submit_backoff_ms) submit_backoff_ms = other.submit_backoff_ms;
    if (other.buffer_size) buffer_size = other.buffer_size;
    if (other.progress_interval_ms) progress_interval_ms = other.progress_interval_ms;
    if (other.log_level) log_level = other.log_level;
    if (!other.progress) progress = false; // CLI может отключить
    if (other.quiet) quiet = true;
}

auto load_config_from_file(const std::optional<std::filesystem::path>& explicit_path) -> Result<Config> {
    if (explicit_path) {
        if (!std::filesystem::exists(*explicit_path)) {
            return std::unexpected(make_error(ErrorCode::ConfigError,
                fmt::format("Config file not found: {}", explicit_path->string())));
        }
        return load_file(*explicit_path);
    }

    for (const auto& path : get_config_paths()) {
        if (!std::filesystem::exists(path)) continue;
        return load_file(path);
    }

    // Файл не найден: возвращаем пустой конфиг (не ошибка!)
    return Config{};
}

auto load_config_from_string(std::string_view yaml) -> Result<Config> {
    YAML::Node node;
    try {
        node = YAML::Load(std::string(yaml));
    } catch (const YAML::Exception& e) {
        return std::unexpected(make_error(ErrorCode::ConfigError,
            fmt::format("Failed to parse config: {}", e.what())));
    }
    return parse_node(node, "<string>");
}

auto config_from_cli(const args_parser::CLIArgs& args) -> Config {
    Config cfg{};
    cfg.threads = args.threads;
    cfg.buffer_size = args.buffer_size;
    cfg.progress = args.progress;
    cfg.quiet = args.quiet;
    cfg.log_level = args.log_level;
    return cfg;
}

auto parse_log_level(std::string_view name) -> Result<spdlog::level::level_enum> {
    const auto level = spdlog::level::from_str(std::string(name));
    // from_str возвращает off для неизвестных имён
    if (level == spdlog::level::off && name != "off") {
        return std::unexpected(make_error(ErrorCode::ConfigError,
            fmt::format("Unknown log level: {}", name)));
    }
    return level;
}

} // namespace treecp::infra
