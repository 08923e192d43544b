#include "replicator/decision_engine.hpp"

#include "delta/util.hpp"

#include <iostream>
#include <utility>

namespace replicator {
namespace {

constexpr std::size_t kAuditSuffixLength = 8;

template <typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

Decision skip(std::string reason, nlohmann::json context) {
    Decision decision;
    decision.reason = std::move(reason);
    decision.context = std::move(context);
    return decision;
}

} // namespace

DecisionEngine::DecisionEngine(DecisionSettings settings,
                               DedupStore& dedup,
                               FillCumulativeTracker& tracker,
                               const CapLedger& ledger,
                               OrderQueue& queue,
                               EventLog& log)
    : settings_(std::move(settings)),
      dedup_(dedup),
      tracker_(tracker),
      ledger_(ledger),
      queue_(queue),
      log_(log) {
    for (const auto& symbol : settings_.allow_symbols) {
        const auto upper = delta::to_upper_copy(delta::trim(symbol));
        if (upper == "ALL") {
            allow_all_ = true;
        } else if (!upper.empty()) {
            allowed_.insert(upper);
        }
    }
}

bool DecisionEngine::is_allowed_symbol(const std::optional<std::string>& symbol) const {
    if (allow_all_) {
        return true;
    }
    return symbol && allowed_.count(delta::to_upper_copy(*symbol)) != 0;
}

bool DecisionEngine::looks_like_ours(const AccountEvent& event) const {
    const auto& prefix = settings_.self_tag_prefix;
    if (prefix.empty()) {
        return false;
    }
    return delta::starts_with(event.client_order_id, prefix) || delta::starts_with(event.text, prefix);
}

Decision DecisionEngine::decide(const AccountEvent& event) {
    return event.kind == EventKind::TradeFill ? decide_trade_fill(event) : decide_order_update(event);
}

Decision DecisionEngine::decide_trade_fill(const AccountEvent& event) {
    if (event.fill_id && dedup_.seen_fill(*event.fill_id)) {
        return skip("dup_fill_id", {{"fill_id", *event.fill_id}});
    }

    std::string audit_id = event.trade_id ? *event.trade_id : "ut_" + delta::random_hex(kAuditSuffixLength);
    if (event.trade_id && dedup_.seen_trade(*event.trade_id)) {
        return skip("dup_trade_id", {{"audit_id", audit_id}});
    }

    if (looks_like_ours(event)) {
        return skip("own_fill", {{"audit_id", audit_id}, {"client_order_id", event.client_order_id}});
    }

    if (!is_allowed_symbol(event.symbol)) {
        return skip("symbol_not_allowed", {{"audit_id", audit_id}, {"symbol", optional_json(event.symbol)}});
    }

    if (!event.quantity || *event.quantity <= 0) {
        return skip("missing_or_invalid_qty", {{"audit_id", audit_id}});
    }

    nlohmann::json context{{"audit_id", audit_id}, {"qty", *event.quantity}, {"multiplier", settings_.multiplier}};
    return size_and_admit(event, std::move(audit_id), *event.quantity, std::move(context));
}

Decision DecisionEngine::decide_order_update(const AccountEvent& event) {
    if (event.fill_id && dedup_.seen_fill(*event.fill_id)) {
        return skip("dup_fill_id_order", {{"fill_id", *event.fill_id}});
    }

    if (looks_like_ours(event)) {
        return skip("own_order_update", {{"client_order_id", event.client_order_id}});
    }

    if (!event.order_id) {
        return skip("missing_order_id", nlohmann::json::object());
    }
    const std::string& order_id = *event.order_id;
    std::string audit_id = "ord_" + order_id;

    if (!is_allowed_symbol(event.symbol)) {
        if (event.is_terminal()) {
            tracker_.forget(order_id);
        }
        return skip("symbol_not_allowed", {{"audit_id", audit_id}, {"symbol", optional_json(event.symbol)}});
    }

    if (!event.quantity) {
        if (event.is_terminal()) {
            tracker_.forget(order_id);
        }
        return skip("missing_or_invalid_cum", {{"audit_id", audit_id}});
    }

    const long long cumulative = *event.quantity;
    const long long previous = tracker_.previous(order_id);
    tracker_.store(order_id, cumulative);
    if (event.is_terminal()) {
        tracker_.forget(order_id);
    }

    if (cumulative <= previous) {
        return skip("no_new_fill_delta", {{"audit_id", audit_id}, {"cum", cumulative}, {"prev", previous}});
    }

    const long long delta = cumulative - previous;
    nlohmann::json context{{"audit_id", audit_id}, {"delta", delta}, {"multiplier", settings_.multiplier}};
    return size_and_admit(event, std::move(audit_id), delta, std::move(context));
}

Decision DecisionEngine::size_and_admit(const AccountEvent& event,
                                        std::string audit_id,
                                        long long quantity,
                                        nlohmann::json context) {
    const long long add = compute_topup_size(settings_.multiplier, quantity, ledger_.limits().max_per_trade);
    if (add <= 0) {
        return skip("zero_topup", std::move(context));
    }

    if (!ledger_.admits(event.symbol, add)) {
        return skip("symbol_cap_exceeded",
                    {{"audit_id", audit_id}, {"symbol", optional_json(event.symbol)}, {"add", add}});
    }

    Decision decision;
    decision.job = TopUpJob{std::move(audit_id), event.symbol, event.product_id, event.side, add, event.price};
    decision.context = to_json(*decision.job);
    return decision;
}

bool DecisionEngine::handle(const AccountEvent& event) {
    auto decision = decide(event);
    if (!decision.admitted()) {
        log_.skip(decision.reason, std::move(decision.context));
        return false;
    }

    if (!queue_.try_push(*decision.job)) {
        std::cerr << "[Engine] Order queue full, dropping top-up " << decision.job->audit_id << std::endl;
        log_.skip("queue_full", std::move(decision.context));
        return false;
    }

    log_.action("enqueue_topup", std::move(decision.context));
    return true;
}

} // namespace replicator
