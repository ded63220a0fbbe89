#include "error.hpp"
#include <fmt/core.h>
#include <cstdlib>

namespace treecp::infra {

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::ScanFailed:
        case ErrorCode::InvalidArgument:
        case ErrorCode::ConfigError:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    if (is_fatal()) return EXIT_FAILURE;
    switch (code) {
        case ErrorCode::DirectoryCreateFailed:
        case ErrorCode::FileOpenFailed:
        case ErrorCode::FileCreateFailed:
        case ErrorCode::FileCopyFailed:
            return 2; // частичный результат
        default:
            return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error make_io_error(ErrorCode code, std::string_view context, std::string_view path,
                    const std::error_code& ec, const std::source_location& loc) {
    return Error{code, fmt::format("{} {}: {}", context, path, ec.message()), loc};
}

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::ScanFailed:            return "ScanFailed";
        case ErrorCode::InvalidArgument:       return "InvalidArgument";
        case ErrorCode::ConfigError:           return "ConfigError";
        case ErrorCode::DirectoryCreateFailed: return "DirectoryCreateFailed";
        case ErrorCode::FileOpenFailed:        return "FileOpenFailed";
        case ErrorCode::FileCreateFailed:      return "FileCreateFailed";
        case ErrorCode::FileCopyFailed:        return "FileCopyFailed";
        case ErrorCode::QueueFull:             return "QueueFull";
        case ErrorCode::PoolStopped:           return "PoolStopped";
        case ErrorCode::Unknown:               break;
    }
    return "Unknown";
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace treecp::infra
