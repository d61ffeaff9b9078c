#include "portwarden/core/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace portwarden {

namespace {
    std::shared_ptr<spdlog::logger> g_logger;
}

void Logger::init(std::string_view name, std::string_view level) {
    // Re-initialising with a name already registered (e.g. a second CLI
    // subcommand in-process) must not throw from spdlog's registry.
    if (auto existing = spdlog::get(std::string(name))) {
        g_logger = std::move(existing);
    } else {
        g_logger = spdlog::stdout_color_mt(std::string(name));
    }
    g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
    set_level(level);
}

auto Logger::get() -> std::shared_ptr<spdlog::logger>& {
    if (!g_logger) {
        init();
    }
    return g_logger;
}

auto Logger::parse_level(std::string_view level) -> std::optional<spdlog::level::level_enum> {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return std::nullopt;
}

auto Logger::is_valid_level(std::string_view level) -> bool {
    return parse_level(level).has_value();
}

void Logger::set_level(std::string_view level) {
    get()->set_level(parse_level(level).value_or(spdlog::level::info));
}

void Logger::flush() {
    if (g_logger) g_logger->flush();
}

} // namespace portwarden
