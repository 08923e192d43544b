#include "replicator/cap_ledger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace replicator {

CapLedger::CapLedger(CapLimits limits)
    : limits_(limits) {}

bool CapLedger::admits(const std::optional<std::string>& symbol, long long add) const {
    if (!symbol) {
        return true;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = used_.find(*symbol);
    const long long used = it == used_.end() ? 0 : it->second;
    return used + add <= limits_.max_per_symbol;
}

void CapLedger::record(const std::optional<std::string>& symbol, long long add) {
    if (!symbol || add <= 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    used_[*symbol] += add;
}

long long CapLedger::used(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = used_.find(symbol);
    return it == used_.end() ? 0 : it->second;
}

long long CapLedger::clamp_per_trade(long long size) const noexcept {
    return std::clamp(size, 0LL, std::max(0LL, limits_.max_per_trade));
}

long long compute_topup_size(double multiplier, long long quantity, long long max_per_trade) {
    if (!(multiplier > 1.0) || quantity <= 0) {
        return 0;
    }
    const double raw = (multiplier - 1.0) * static_cast<double>(quantity);
    if (!std::isfinite(raw) || raw >= static_cast<double>(std::numeric_limits<long long>::max())) {
        return std::max(0LL, max_per_trade);
    }
    // nearbyint honours the current rounding mode; the default is ties-to-even.
    const auto add = static_cast<long long>(std::nearbyint(raw));
    return std::clamp(add, 0LL, std::max(0LL, max_per_trade));
}

} // namespace replicator
