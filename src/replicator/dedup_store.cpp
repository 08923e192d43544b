#include "replicator/dedup_store.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace replicator {

TtlSet::TtlSet(std::size_t capacity, std::chrono::seconds ttl)
    : capacity_(capacity),
      ttl_(ttl) {
    if (capacity_ == 0) {
        throw std::invalid_argument("TtlSet capacity must be positive");
    }
    index_.reserve(std::min<std::size_t>(capacity_, 4096));
}

void TtlSet::purge_expired(Clock::time_point now) {
    while (!order_.empty() && order_.front().expires_at <= now) {
        index_.erase(order_.front().id);
        order_.pop_front();
    }
}

TtlSet::Clock::time_point TtlSet::expiry_for(Clock::time_point now) const {
    const auto headroom = std::chrono::duration_cast<std::chrono::seconds>(Clock::time_point::max() - now);
    if (ttl_ >= headroom) {
        return Clock::time_point::max();
    }
    return now + ttl_;
}

bool TtlSet::contains(const std::string& id, Clock::time_point now) {
    purge_expired(now);
    return index_.find(id) != index_.end();
}

bool TtlSet::check_and_insert(const std::string& id, Clock::time_point now) {
    purge_expired(now);

    bool present = false;
    const auto it = index_.find(id);
    if (it != index_.end()) {
        present = true;
        order_.erase(it->second);
        index_.erase(it);
    }

    while (index_.size() >= capacity_) {
        index_.erase(order_.front().id);
        order_.pop_front();
    }

    order_.push_back(Entry{id, expiry_for(now)});
    index_.emplace(id, std::prev(order_.end()));
    return present;
}

DedupStore::DedupStore(const DedupSettings& settings)
    : fills_(settings.fill_capacity, settings.fill_ttl),
      trades_(settings.trade_capacity, settings.trade_ttl) {}

} // namespace replicator
