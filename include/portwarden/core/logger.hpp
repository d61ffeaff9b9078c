#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace portwarden {

/// Process-wide spdlog logger shared by the CLI, the scanner and the
/// lifecycle manager.
///
/// Levels are named the way the config file and --log-level spell them:
/// trace, debug, info, warn, error, critical, off.
class Logger {
public:
    /// Creates (or re-attaches to) the named color console logger.
    static void init(std::string_view name = "portwarden", std::string_view level = "info");
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    /// Unknown names fall back to info.
    static void set_level(std::string_view level);
    static void flush();

    [[nodiscard]] static auto parse_level(std::string_view level)
        -> std::optional<spdlog::level::level_enum>;
    [[nodiscard]] static auto is_valid_level(std::string_view level) -> bool;
};

} // namespace portwarden

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::portwarden::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::portwarden::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::portwarden::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::portwarden::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::portwarden::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::portwarden::Logger::get(), __VA_ARGS__)
