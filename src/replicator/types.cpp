#include "replicator/types.hpp"

namespace replicator {

const char* to_string(Side side) noexcept {
    switch (side) {
        case Side::Buy:
            return "buy";
        case Side::Sell:
            return "sell";
        case Side::Unknown:
            break;
    }
    return "unknown";
}

const char* to_string(EventKind kind) noexcept {
    return kind == EventKind::TradeFill ? "trade_fill" : "order_update";
}

nlohmann::json to_json(const TopUpJob& job) {
    nlohmann::json out;
    out["audit_id"] = job.audit_id;
    out["symbol"] = job.symbol ? nlohmann::json(*job.symbol) : nlohmann::json(nullptr);
    out["product_id"] = job.product_id ? nlohmann::json(*job.product_id) : nlohmann::json(nullptr);
    out["side"] = to_string(job.side);
    out["size"] = job.size;
    out["price"] = job.price ? nlohmann::json(*job.price) : nlohmann::json(nullptr);
    return out;
}

} // namespace replicator
