#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

namespace replicator {

// Last cumulative filled size per order, for deriving deltas from the orders
// channel. Ingestion thread only.
class FillCumulativeTracker {
public:
    long long previous(const std::string& order_id) const {
        const auto it = cumulative_.find(order_id);
        return it == cumulative_.end() ? 0 : it->second;
    }

    void store(const std::string& order_id, long long cumulative) { cumulative_[order_id] = cumulative; }

    void forget(const std::string& order_id) { cumulative_.erase(order_id); }

    bool tracks(const std::string& order_id) const { return cumulative_.count(order_id) != 0; }

    std::size_t size() const noexcept { return cumulative_.size(); }

private:
    std::unordered_map<std::string, long long> cumulative_;
};

} // namespace replicator
