#pragma once

#include "replicator/cap_ledger.hpp"
#include "replicator/dedup_store.hpp"
#include "replicator/event_log.hpp"
#include "replicator/fill_tracker.hpp"
#include "replicator/order_queue.hpp"
#include "replicator/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace replicator {

struct DecisionSettings {
    double multiplier = 2.0;
    std::vector<std::string> allow_symbols{"ALL"};
    std::string self_tag_prefix = "BOTMULT_";
};

// Either a job to enqueue or the reason it was skipped.
struct Decision {
    std::optional<TopUpJob> job;
    std::string reason;
    nlohmann::json context = nlohmann::json::object();

    bool admitted() const noexcept { return job.has_value(); }
};

// Admission checks for one account event: dedup, self-origin, allow-list,
// quantity/delta, sizing, symbol cap. Runs on the ingestion thread only.
class DecisionEngine {
public:
    DecisionEngine(DecisionSettings settings,
                   DedupStore& dedup,
                   FillCumulativeTracker& tracker,
                   const CapLedger& ledger,
                   OrderQueue& queue,
                   EventLog& log);

    Decision decide(const AccountEvent& event);

    // decide() + logging + non-blocking enqueue. True when a job was queued.
    bool handle(const AccountEvent& event);

    bool is_allowed_symbol(const std::optional<std::string>& symbol) const;
    bool looks_like_ours(const AccountEvent& event) const;

    const DecisionSettings& settings() const noexcept { return settings_; }

private:
    Decision decide_trade_fill(const AccountEvent& event);
    Decision decide_order_update(const AccountEvent& event);
    Decision size_and_admit(const AccountEvent& event,
                            std::string audit_id,
                            long long quantity,
                            nlohmann::json context);

    DecisionSettings settings_;
    std::set<std::string> allowed_;
    bool allow_all_ = false;
    DedupStore& dedup_;
    FillCumulativeTracker& tracker_;
    const CapLedger& ledger_;
    OrderQueue& queue_;
    EventLog& log_;
};

} // namespace replicator
