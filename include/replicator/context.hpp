#pragma once

#include "replicator/cap_ledger.hpp"
#include "replicator/config.hpp"
#include "replicator/dedup_store.hpp"
#include "replicator/event_log.hpp"
#include "replicator/fill_tracker.hpp"
#include "replicator/order_queue.hpp"
#include "replicator/shutdown.hpp"

namespace replicator {

// Process-wide replication state. Built once before either thread starts and
// outlives both.
struct ReplicationContext {
    explicit ReplicationContext(const BotConfig& config);

    ReplicationContext(const ReplicationContext&) = delete;
    ReplicationContext& operator=(const ReplicationContext&) = delete;

    EventLog log;
    ShutdownCoordinator shutdown;
    DedupStore dedup;
    CapLedger ledger;
    FillCumulativeTracker tracker;
    OrderQueue queue;
};

} // namespace replicator
