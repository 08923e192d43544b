#pragma once

#include "replicator/event_log.hpp"
#include "replicator/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <string>

namespace replicator {

enum class FrameKind {
    Malformed,
    AuthSuccess,
    Heartbeat,
    TradeFill,
    OrderUpdate,
    Other
};

const char* to_string(FrameKind kind) noexcept;

using AccountEventHandler = std::function<void(const AccountEvent& event)>;

// Classifies inbound socket frames and hands account events to the handler.
// Control frames (auth success, heartbeat) are only classified; the caller
// acts on them.
class EventRouter {
public:
    EventRouter(EventLog& log, AccountEventHandler handler);

    // Never throws on bad input.
    FrameKind route(const std::string& frame);

    std::size_t dispatched() const noexcept { return dispatched_; }

    // First key whose value is a non-empty object/array, or the frame itself.
    static const nlohmann::json& select_payload(const nlohmann::json& frame,
                                                std::initializer_list<const char*> keys);

private:
    void dispatch(const nlohmann::json& payload, EventKind kind);

    EventLog& log_;
    AccountEventHandler handler_;
    std::size_t dispatched_ = 0;
};

} // namespace replicator
