#include "delta/ws_frames.hpp"

#include <nlohmann/json.hpp>

namespace delta {

std::string build_auth_frame(const Credentials& credentials, const std::string& timestamp) {
    nlohmann::json msg;
    msg["type"] = "auth";
    msg["payload"] = {
        {"api-key", credentials.api_key},
        {"signature", ClientBase::sign(credentials.api_secret, "GET", timestamp, "/live")},
        {"timestamp", timestamp}
    };
    return msg.dump();
}

std::string build_subscribe_frame(const std::string& channel,
                                  const std::vector<std::string>& symbols) {
    nlohmann::json entry;
    entry["name"] = channel;
    entry["symbols"] = symbols;

    nlohmann::json msg;
    msg["type"] = "subscribe";
    msg["payload"]["channels"] = nlohmann::json::array({entry});
    return msg.dump();
}

std::string build_enable_heartbeat_frame() {
    return nlohmann::json{{"type", "enable_heartbeat"}}.dump();
}

} // namespace delta
