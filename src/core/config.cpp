#include "portwarden/core/config.hpp"
#include "portwarden/core/logger.hpp"

#include <cstdlib>
#include <fstream>

namespace portwarden {

namespace {

auto parse_port_env(const char* name) -> std::optional<uint16_t> {
    auto* val = std::getenv(name);
    if (!val) return std::nullopt;
    try {
        auto parsed = std::stoi(val);
        if (parsed < 0 || parsed > 65535) {
            LOG_WARN("Config: {}={} is outside 0-65535, ignoring", name, val);
            return std::nullopt;
        }
        return static_cast<uint16_t>(parsed);
    } catch (const std::exception&) {
        LOG_WARN("Config: {}={} is not a number, ignoring", name, val);
        return std::nullopt;
    }
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        return j.get<Config>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

void apply_env_overrides(Config& config) {
    if (auto port = parse_port_env("PORTWARDEN_PORT_START")) {
        config.server.port_start = *port;
    }
    if (auto port = parse_port_env("PORTWARDEN_PORT_END")) {
        config.server.port_end = *port;
    }
    if (auto* val = std::getenv("PORTWARDEN_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("PORTWARDEN_DATA_DIR")) {
        config.data_dir = val;
    }
}

auto load_config_from_env() -> Config {
    Config config;
    apply_env_overrides(config);
    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto default_data_dir() -> std::filesystem::path {
    if (auto* val = std::getenv("PORTWARDEN_DATA_DIR")) {
        return val;
    }
    auto home = std::filesystem::path(std::getenv("HOME") ? std::getenv("HOME") : "/tmp");
    return home / ".portwarden";
}

auto resolve_data_dir(const Config& config) -> std::filesystem::path {
    if (config.data_dir && !config.data_dir->empty()) {
        return *config.data_dir;
    }
    return default_data_dir();
}

auto validate_config(const Config& config) -> VoidResult {
    if (config.server.port_start > config.server.port_end) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig,
            "Port range start exceeds end",
            std::to_string(config.server.port_start) + "-" +
                std::to_string(config.server.port_end)));
    }
    if (config.scanner.concurrency < 1) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig,
            "Scanner concurrency must be at least 1",
            std::to_string(config.scanner.concurrency)));
    }
    if (config.scanner.retries < 0) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig,
            "Scanner retries must not be negative",
            std::to_string(config.scanner.retries)));
    }
    if (config.scanner.timeout_ms <= 0) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig,
            "Probe timeout must be positive",
            std::to_string(config.scanner.timeout_ms)));
    }
    if (config.scanner.cache_ttl_ms < 0) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig,
            "Cache TTL must not be negative",
            std::to_string(config.scanner.cache_ttl_ms)));
    }
    if (!Logger::is_valid_level(config.log_level)) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "Unknown log level", config.log_level));
    }
    return {};
}

} // namespace portwarden
