#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace portwarden {

using json = nlohmann::json;
using Clock = std::chrono::steady_clock;
using Timestamp = std::chrono::time_point<Clock>;
using Millis = std::chrono::milliseconds;

/// Source of "now" for TTL bookkeeping. Tests swap in a manual clock.
using NowFn = std::function<Timestamp()>;

inline auto steady_now() -> Timestamp { return Clock::now(); }

/// Lifecycle state of the managed listening server.
enum class ServerStatus {
    Starting,
    Running,
    Error,
    Stopped,
};

NLOHMANN_JSON_SERIALIZE_ENUM(ServerStatus, {
    {ServerStatus::Starting, "starting"},
    {ServerStatus::Running, "running"},
    {ServerStatus::Error, "error"},
    {ServerStatus::Stopped, "stopped"},
})

[[nodiscard]] inline auto to_string(ServerStatus status) -> std::string {
    switch (status) {
        case ServerStatus::Starting: return "starting";
        case ServerStatus::Running: return "running";
        case ServerStatus::Error: return "error";
        case ServerStatus::Stopped: return "stopped";
    }
    return "unknown";
}

/// One notification delivered to the status sink.
struct StatusEvent {
    ServerStatus status = ServerStatus::Stopped;
    std::optional<uint16_t> port;
    std::optional<std::string> message;
};

void to_json(json& j, const StatusEvent& e);
void from_json(const json& j, StatusEvent& e);

/// One-way, best-effort notification channel toward the host.
using StatusSink = std::function<void(const StatusEvent&)>;

} // namespace portwarden
