/// @file src/utilization/utilization_ledger.cpp
/// @brief UtilizationLedger rollover and views.

#include "mvault/utilization.hpp"

namespace mvault::utilization {

RolloverOutcome UtilizationLedger::rollover(const Address& account, Epoch current,
                                            bool distribution_enabled) {
    RolloverOutcome outcome;

    // Global bucket: seeded by the first action of anyone in `current`.
    if (!global_.contains(current)) {
        Int256 carried = 0;
        std::optional<Epoch> previous;

        auto it = global_.lower_bound(current);
        if (it != global_.begin()) {
            --it;
            previous = it->first;
            carried  = it->second;
        }

        global_.emplace(current, carried);
        distribution_snapshot_[current] = distribution_enabled;
        outcome.global_seeded = true;

        if (previous && !settled_.contains(*previous)) {
            settled_.insert(*previous);
            outcome.settle_epoch = previous;
        }
    }

    // Personal bucket.
    auto last = last_active_.find(account);
    if (last == last_active_.end()) {
        last_active_.emplace(account, current);
        return outcome;
    }
    if (last->second >= current) {
        return outcome;
    }

    auto& buckets = personal_[account];
    if (!buckets.contains(current)) {
        auto prev = buckets.find(last->second);
        buckets.emplace(current, prev == buckets.end() ? Int256(0) : prev->second);
        outcome.personal_seeded = true;
    }
    last->second = current;
    return outcome;
}

void UtilizationLedger::add(const Address& account, Epoch epoch, const Int256& delta) {
    global_[epoch] += delta;
    personal_[account][epoch] += delta;
}

Int256 UtilizationLedger::total_utilization(Epoch epoch) const {
    auto it = global_.find(epoch);
    return it == global_.end() ? Int256(0) : it->second;
}

Int256 UtilizationLedger::user_utilization(const Address& account, Epoch epoch) const {
    auto acct = personal_.find(account);
    if (acct == personal_.end()) {
        return 0;
    }
    auto it = acct->second.find(epoch);
    return it == acct->second.end() ? Int256(0) : it->second;
}

std::optional<Epoch> UtilizationLedger::last_active_epoch(const Address& account) const {
    auto it = last_active_.find(account);
    if (it == last_active_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<bool> UtilizationLedger::distribution_snapshot(Epoch epoch) const {
    auto it = distribution_snapshot_.find(epoch);
    if (it == distribution_snapshot_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool UtilizationLedger::is_seeded(Epoch epoch) const {
    return global_.contains(epoch);
}

bool UtilizationLedger::is_settled(Epoch epoch) const {
    return settled_.contains(epoch);
}

std::optional<Epoch> UtilizationLedger::latest_seeded_epoch() const {
    if (global_.empty()) {
        return std::nullopt;
    }
    return global_.rbegin()->first;
}

} // namespace mvault::utilization
