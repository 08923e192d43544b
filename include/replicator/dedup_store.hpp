#pragma once

#include <chrono>
#include <cstddef>
#include <list>
#include <string>
#include <unordered_map>

namespace replicator {

// Insertion-ordered membership set with a per-entry TTL and a hard size cap.
// Expired entries are purged from the front on every access; at capacity the
// oldest entry is evicted regardless of TTL. Not synchronized: only the
// ingestion thread touches it.
class TtlSet {
public:
    using Clock = std::chrono::steady_clock;

    TtlSet(std::size_t capacity, std::chrono::seconds ttl);

    // True when `id` was already present (and unexpired). Either way the id is
    // (re)inserted as the newest entry with a fresh TTL.
    bool check_and_insert(const std::string& id, Clock::time_point now = Clock::now());

    bool contains(const std::string& id, Clock::time_point now = Clock::now());

    std::size_t size() const noexcept { return index_.size(); }
    std::size_t capacity() const noexcept { return capacity_; }

private:
    struct Entry {
        std::string id;
        Clock::time_point expires_at;
    };

    void purge_expired(Clock::time_point now);
    // Saturates at time_point::max() instead of overflowing.
    Clock::time_point expiry_for(Clock::time_point now) const;

    std::size_t capacity_;
    std::chrono::seconds ttl_;
    std::list<Entry> order_;
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
};

struct DedupSettings {
    std::size_t fill_capacity = 200000;
    std::chrono::seconds fill_ttl{86400};
    std::size_t trade_capacity = 200000;
    std::chrono::seconds trade_ttl{86400};
};

class DedupStore {
public:
    explicit DedupStore(const DedupSettings& settings = {});

    bool seen_fill(const std::string& fill_id, TtlSet::Clock::time_point now = TtlSet::Clock::now()) {
        return fills_.check_and_insert(fill_id, now);
    }

    bool seen_trade(const std::string& trade_id, TtlSet::Clock::time_point now = TtlSet::Clock::now()) {
        return trades_.check_and_insert(trade_id, now);
    }

    const TtlSet& fills() const noexcept { return fills_; }
    const TtlSet& trades() const noexcept { return trades_; }

private:
    TtlSet fills_;
    TtlSet trades_;
};

} // namespace replicator
