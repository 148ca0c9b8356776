#pragma once

/// @file include/mvault/utilization.hpp
/// @brief Epoch-bucketed utilization with lazy rollover.
///
/// # Module: Utilization Ledger
///
/// ## Responsibility
/// Track net signed flow (deposits minus redemptions) per epoch, both
/// system-wide and per account, without any scheduled tick. The first
/// action in a new epoch performs the carry-forward:
///
///   - global: the first action by *anyone* seeds the epoch's bucket from the
///     most recently seeded epoch and snapshots the fee-distribution flag
///   - personal: an account's first action in a later epoch seeds its bucket
///     from the account's last active epoch
///
/// ## Guarantees
/// - "Seeded" is bucket presence, so a bucket netting to zero is never
///   re-seeded
/// - Each epoch's global bucket is seeded exactly once
/// - Each seeded epoch is reported for settlement exactly once, by the
///   seeding of the next epoch
/// - `last_active_epoch` never moves backwards
///
/// ## NOT Responsible For
/// - Moving protocol fees (the caller settles the reported epoch)

#include "mvault/types.hpp"

#include <map>
#include <optional>
#include <set>

namespace mvault::utilization {

/// What one rollover call did.
struct RolloverOutcome {
    bool global_seeded   = false;  ///< This call seeded the current global bucket
    bool personal_seeded = false;  ///< This call carried the account's bucket forward

    /// Earlier epoch whose accumulated protocol fees are now due.
    std::optional<Epoch> settle_epoch;
};

class UtilizationLedger {
public:
    /// Perform the lazy carry-forward for `account` acting in `current`.
    /// `distribution_enabled` is snapshotted if this call seeds the epoch.
    RolloverOutcome rollover(const Address& account, Epoch current,
                             bool distribution_enabled);

    /// Apply `delta` to the global and personal buckets of `epoch`.
    void add(const Address& account, Epoch epoch, const Int256& delta);

    // ─── Views ────────────────────────────────────────────────────────────────

    [[nodiscard]] Int256 total_utilization(Epoch epoch) const;
    [[nodiscard]] Int256 user_utilization(const Address& account, Epoch epoch) const;

    [[nodiscard]] std::optional<Epoch> last_active_epoch(const Address& account) const;

    /// Fee-distribution flag captured when `epoch` was seeded.
    [[nodiscard]] std::optional<bool> distribution_snapshot(Epoch epoch) const;

    [[nodiscard]] bool is_seeded(Epoch epoch) const;
    [[nodiscard]] bool is_settled(Epoch epoch) const;

    /// Most recently seeded epoch, if any.
    [[nodiscard]] std::optional<Epoch> latest_seeded_epoch() const;

private:
    std::map<Epoch, Int256>                    global_;
    std::map<Address, std::map<Epoch, Int256>> personal_;
    std::map<Address, Epoch>                   last_active_;
    std::map<Epoch, bool>                      distribution_snapshot_;
    std::set<Epoch>                            settled_;
};

} // namespace mvault::utilization
