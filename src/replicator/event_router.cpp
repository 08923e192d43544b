#include "replicator/event_router.hpp"

#include "replicator/account_event.hpp"

#include <iostream>
#include <utility>

namespace replicator {

namespace {

std::string string_field(const nlohmann::json& message, const char* key) {
    const auto it = message.find(key);
    if (it == message.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

} // namespace

const char* to_string(FrameKind kind) noexcept {
    switch (kind) {
        case FrameKind::Malformed:
            return "malformed";
        case FrameKind::AuthSuccess:
            return "auth_success";
        case FrameKind::Heartbeat:
            return "heartbeat";
        case FrameKind::TradeFill:
            return "trade_fill";
        case FrameKind::OrderUpdate:
            return "order_update";
        case FrameKind::Other:
            break;
    }
    return "other";
}

EventRouter::EventRouter(EventLog& log, AccountEventHandler handler)
    : log_(log),
      handler_(std::move(handler)) {}

const nlohmann::json& EventRouter::select_payload(const nlohmann::json& frame,
                                                  std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        const auto it = frame.find(key);
        if (it == frame.end()) {
            continue;
        }
        if ((it->is_object() || it->is_array()) && !it->empty()) {
            return *it;
        }
    }
    return frame;
}

FrameKind EventRouter::route(const std::string& frame) {
    auto message = nlohmann::json::parse(frame, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        log_.event("parse_error", {{"raw", frame}});
        return FrameKind::Malformed;
    }

    const auto type = string_field(message, "type");
    if (type == "success" && string_field(message, "message") == "Authenticated") {
        return FrameKind::AuthSuccess;
    }
    if (type == "heartbeat") {
        return FrameKind::Heartbeat;
    }

    log_.event("message", message);

    try {
        if (type == "user_trades" || type == "usertrades") {
            dispatch(select_payload(message, {"payload", "data", "trades", "usertrades"}), EventKind::TradeFill);
            return FrameKind::TradeFill;
        }
        if (type == "orders") {
            dispatch(select_payload(message, {"payload", "data", "orders"}), EventKind::OrderUpdate);
            return FrameKind::OrderUpdate;
        }
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "[Router] Dropping " << type << " frame: " << ex.what() << std::endl;
        log_.event("parse_error", {{"raw", frame}, {"error", ex.what()}});
        return FrameKind::Malformed;
    }

    return FrameKind::Other;
}

void EventRouter::dispatch(const nlohmann::json& payload, EventKind kind) {
    auto handle_one = [&](const nlohmann::json& entry) {
        if (!entry.is_object()) {
            return;
        }
        const auto event = kind == EventKind::TradeFill ? trade_fill_from_json(entry)
                                                        : order_update_from_json(entry);
        ++dispatched_;
        if (handler_) {
            handler_(event);
        }
    };

    if (payload.is_array()) {
        for (const auto& entry : payload) {
            handle_one(entry);
        }
    } else {
        handle_one(payload);
    }
}

} // namespace replicator
