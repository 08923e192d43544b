#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace replicator {

struct CapLimits {
    long long max_per_trade = 1000000;
    long long max_per_symbol = 10000000;
};

// Contracts replicated per symbol this session. Only ever grows, and only
// after a confirmed submission; venue-side cancels do not give budget back.
class CapLedger {
public:
    explicit CapLedger(CapLimits limits = {});

    // Symbols we could not identify are not tracked and always admitted.
    bool admits(const std::optional<std::string>& symbol, long long add) const;

    void record(const std::optional<std::string>& symbol, long long add);

    long long used(const std::string& symbol) const;

    long long clamp_per_trade(long long size) const noexcept;

    const CapLimits& limits() const noexcept { return limits_; }

private:
    CapLimits limits_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, long long> used_;
};

// (multiplier - 1) x quantity, rounded half-to-even and clamped to
// [0, max_per_trade]. Always 0 for multipliers at or below 1.
long long compute_topup_size(double multiplier, long long quantity, long long max_per_trade);

} // namespace replicator
