#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

#include "portwarden/core/error.hpp"

namespace portwarden::infra {

/// Durable storage for the last port the server successfully listened on.
class PortStateStore {
public:
    virtual ~PortStateStore() = default;

    [[nodiscard]] virtual auto load() const -> std::optional<uint16_t> = 0;
    virtual auto save(uint16_t port) -> VoidResult = 0;
    virtual auto clear() -> VoidResult = 0;
};

/// Keeps the value in memory only; used by tests and ephemeral runs.
class MemoryPortStateStore : public PortStateStore {
public:
    MemoryPortStateStore() = default;
    explicit MemoryPortStateStore(uint16_t port) : port_(port) {}

    [[nodiscard]] auto load() const -> std::optional<uint16_t> override { return port_; }
    auto save(uint16_t port) -> VoidResult override {
        port_ = port;
        return {};
    }
    auto clear() -> VoidResult override {
        port_.reset();
        return {};
    }

private:
    std::optional<uint16_t> port_;
};

/// Persists `{"last_successful_port": N}` as a JSON file.
///
/// Writes go to a sibling .tmp file first and are renamed into place so a
/// crash never leaves a truncated document behind. A missing or unreadable
/// file loads as "no port".
class JsonFilePortStateStore : public PortStateStore {
public:
    static constexpr const char* kFileName = "port-state.json";
    static constexpr const char* kKey = "last_successful_port";

    /// Construct with the directory holding the state file.
    explicit JsonFilePortStateStore(std::filesystem::path dir);

    [[nodiscard]] auto load() const -> std::optional<uint16_t> override;
    auto save(uint16_t port) -> VoidResult override;
    auto clear() -> VoidResult override;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path dir_;
    std::filesystem::path path_;
};

} // namespace portwarden::infra
