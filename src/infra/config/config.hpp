#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <cstdint>
#include <chrono>
#include <expected>
#include <filesystem>
#include <spdlog/common.h>
#include "../error_handler/error.hpp"

namespace treecp::args_parser {
    struct CLIArgs;
}

namespace treecp::infra {

inline constexpr std::size_t kDefaultBufferSize = 32 * 1024;
inline constexpr std::size_t kDefaultQueueCapacity = 0;
inline constexpr std::uint32_t kDefaultSubmitBackoffMs = 1000;
inline constexpr std::uint32_t kDefaultProgressIntervalMs = 100;

struct Config {
    // Workers
    std::optional<std::uint32_t> threads;
    std::optional<std::uint32_t> pool_size;         // по умолчанию = threads
    std::optional<std::size_t> queue_capacity;      // 0 = передача только свободному воркеру
    std::optional<std::uint32_t> submit_backoff_ms; // пауза перед синхронным выполнением

    // I/O
    std::optional<std::size_t> buffer_size;   // bytes

    // Output
    bool progress = true;
    bool quiet = false;
    std::optional<std::uint32_t> progress_interval_ms;
    std::optional<std::string> log_level;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);

    [[nodiscard]] auto effective_pool_size() const -> std::uint32_t {
        return pool_size.value_or(threads.value_or(1));
    }
    [[nodiscard]] auto effective_buffer_size() const -> std::size_t {
        return buffer_size.value_or(kDefaultBufferSize);
    }
    [[nodiscard]] auto submit_backoff() const -> std::chrono::milliseconds {
        return std::chrono::milliseconds(submit_backoff_ms.value_or(kDefaultSubmitBackoffMs));
    }
    [[nodiscard]] auto progress_interval() const -> std::chrono::milliseconds {
        return std::chrono::milliseconds(progress_interval_ms.value_or(kDefaultProgressIntervalMs));
    }
};

/// Загружает конфигурацию из файла YAML.
/// Если explicit_path задан, читается только он (если файла нет, это ошибка).
/// Иначе ищет файл в порядке:
///   1. ./.treecp.yaml
///   2. $XDG_CONFIG_HOME/treecp/config.yaml или ~/.config/treecp/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file(const std::optional<std::filesystem::path>& explicit_path = std::nullopt)
    -> Result<Config>;

[[nodiscard]] auto load_config_from_string(std::string_view yaml) -> Result<Config>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const args_parser::CLIArgs& args) -> Config;

/// "trace", "debug", "info", "warn", "error", "critical", "off"
[[nodiscard]] auto parse_log_level(std::string_view name) -> Result<spdlog::level::level_enum>;

} // namespace treecp::infra
