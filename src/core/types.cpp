#include "portwarden/core/types.hpp"

namespace portwarden {

void to_json(json& j, const StatusEvent& e) {
    j = json{{"status", e.status}};
    if (e.port) {
        j["port"] = *e.port;
    }
    if (e.message) {
        j["message"] = *e.message;
    }
}

void from_json(const json& j, StatusEvent& e) {
    e.status = j.value("status", ServerStatus::Stopped);
    if (j.contains("port") && j["port"].is_number_unsigned()) {
        e.port = j["port"].get<uint16_t>();
    }
    if (j.contains("message") && j["message"].is_string()) {
        e.message = j["message"].get<std::string>();
    }
}

} // namespace portwarden
