#include "portwarden/infra/port_state_store.hpp"
#include "portwarden/core/logger.hpp"
#include "portwarden/core/types.hpp"

#include <fstream>

namespace portwarden::infra {

JsonFilePortStateStore::JsonFilePortStateStore(std::filesystem::path dir)
    : dir_(std::move(dir))
    , path_(dir_ / kFileName)
{
}

auto JsonFilePortStateStore::load() const -> std::optional<uint16_t> {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return std::nullopt;
    }

    std::ifstream in(path_);
    if (!in.is_open()) {
        LOG_WARN("Cannot open port state file: {}", path_.string());
        return std::nullopt;
    }

    try {
        auto j = json::parse(in);
        if (!j.contains(kKey) || !j[kKey].is_number_unsigned()) {
            return std::nullopt;
        }
        auto value = j[kKey].get<uint64_t>();
        if (value == 0 || value > 65535) {
            LOG_WARN("Ignoring out-of-range persisted port {}", value);
            return std::nullopt;
        }
        LOG_INFO("Found last successful port in storage: {}", value);
        return static_cast<uint16_t>(value);
    } catch (const json::exception& e) {
        LOG_WARN("Failed to parse port state {}: {}", path_.string(), e.what());
        return std::nullopt;
    }
}

auto JsonFilePortStateStore::save(uint16_t port) -> VoidResult {
    auto tmp_path = std::filesystem::path(path_.string() + ".tmp");

    try {
        std::filesystem::create_directories(dir_);

        json j = {{kKey, port}};
        std::ofstream out(tmp_path);
        if (!out.is_open()) {
            return std::unexpected(make_error(
                ErrorCode::IoError,
                "Failed to open temp file for port state",
                tmp_path.string()));
        }
        out << j.dump(2);
        out.close();

        std::filesystem::rename(tmp_path, path_);
        LOG_INFO("Saved successful port {} to storage", port);
        return {};
    } catch (const std::exception& e) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        return std::unexpected(make_error(
            ErrorCode::IoError,
            "Failed to write port state",
            e.what()));
    }
}

auto JsonFilePortStateStore::clear() -> VoidResult {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        return std::unexpected(make_error(
            ErrorCode::IoError,
            "Failed to remove port state",
            ec.message()));
    }
    LOG_INFO("Cleared persisted port state");
    return {};
}

} // namespace portwarden::infra
