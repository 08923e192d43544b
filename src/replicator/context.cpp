#include "replicator/context.hpp"

namespace replicator {

ReplicationContext::ReplicationContext(const BotConfig& config)
    : log(config.event_log_config()),
      dedup(config.dedup_settings()),
      ledger(config.cap_limits()),
      queue(static_cast<std::size_t>(config.order_queue_capacity)) {
    // Wakes the worker if it is blocked on pop().
    shutdown.add_stop_hook([this] { queue.force_push(std::nullopt); });
}

} // namespace replicator
