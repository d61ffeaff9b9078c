#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "portwarden/core/error.hpp"
#include "portwarden/core/types.hpp"

// std::optional serializer for nlohmann/json so NLOHMANN_DEFINE macros
// accept optional fields.
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace portwarden {

struct ServerConfig {
    uint16_t port_start = 9960;
    uint16_t port_end = 9990;
    std::vector<uint16_t> preferred_ports = {9960, 9970, 9980, 9990, 8080, 3000};
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ServerConfig, port_start, port_end, preferred_ports)

struct ScannerConfig {
    int timeout_ms = 400;
    int concurrency = 8;
    int retries = 1;
    int cache_ttl_ms = 30000;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ScannerConfig, timeout_ms, concurrency, retries, cache_ttl_ms)

struct Config {
    ServerConfig server;
    ScannerConfig scanner;
    std::string log_level = "info";
    std::optional<std::string> data_dir;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, server, scanner, log_level, data_dir)

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;
auto default_config() -> Config;
auto default_data_dir() -> std::filesystem::path;

/// Overlays PORTWARDEN_* environment variables onto an existing config.
void apply_env_overrides(Config& config);

/// Checks ranges and scanner parameters; the first problem found is returned.
auto validate_config(const Config& config) -> VoidResult;

/// Resolves the directory holding persisted state (config.data_dir or default).
auto resolve_data_dir(const Config& config) -> std::filesystem::path;

} // namespace portwarden
