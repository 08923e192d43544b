#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace replicator {

enum class Side { Buy, Sell, Unknown };

enum class EventKind { TradeFill, OrderUpdate };

const char* to_string(Side side) noexcept;
const char* to_string(EventKind kind) noexcept;

// Normalized view of a user_trades or orders payload entry.
struct AccountEvent {
    EventKind kind = EventKind::TradeFill;
    std::optional<std::string> symbol;      // upper-cased
    std::optional<long long> product_id;
    Side side = Side::Unknown;
    // TradeFill: fill size. OrderUpdate: cumulative filled size.
    std::optional<long long> quantity;
    std::optional<std::string> price;
    std::optional<std::string> fill_id;
    std::optional<std::string> trade_id;
    std::optional<std::string> order_id;
    std::string client_order_id;            // client_order_id, client_id or text
    std::string text;
    std::string state;                      // lower-cased order state
    std::optional<long long> unfilled_size;

    bool is_terminal() const noexcept {
        return state == "closed" || (unfilled_size && *unfilled_size == 0);
    }
};

struct TopUpJob {
    std::string audit_id;
    std::optional<std::string> symbol;
    std::optional<long long> product_id;
    Side side = Side::Unknown;
    long long size = 0;
    std::optional<std::string> price;
};

nlohmann::json to_json(const TopUpJob& job);

} // namespace replicator
