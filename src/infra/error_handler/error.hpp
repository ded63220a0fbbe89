#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace treecp::infra {

enum class ErrorCode {
    // Фатальные ошибки (запуск прерывается)
    ScanFailed,
    InvalidArgument,
    ConfigError,

    // Ошибки отдельных записей (логируем и идём дальше)
    DirectoryCreateFailed,
    FileOpenFailed,
    FileCreateFailed,
    FileCopyFailed,

    // Пул потоков
    QueueFull,      // ← восстанавливается синхронным выполнением
    PoolStopped,

    Unknown,
};

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    // Конструктор с автоматическим захватом location
    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;

    [[nodiscard]] auto is_transient() const -> bool {
        return code == ErrorCode::QueueFull;
    }
};

// Псевдонимы для удобства
template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Ошибка ввода-вывода: "<context> <path>: <strerror>"
[[nodiscard]] auto make_io_error(
    ErrorCode code,
    std::string_view context,
    std::string_view path,
    const std::error_code& ec,
    const std::source_location& loc = std::source_location::current()
) -> Error;

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace treecp::infra
