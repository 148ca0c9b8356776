#pragma once

/// @file include/mvault/curve.hpp
/// @brief Bonding-curve capability interface and id-keyed registry.
///
/// # Module: Curve Adapter
///
/// ## Responsibility
/// Define the pricing boundary between the ledger and a bonding curve.
/// The ledger never evaluates a curve itself; every share/asset conversion
/// goes through `CurveRegistry`, which dispatches by curve id to an owned
/// `CurveProvider`.
///
/// ## Guarantees
/// - Curve ids are sequential and 1-based in registration order
/// - Any call with an unregistered id throws `LedgerError(InvalidCurveId)`
/// - Providers are pure: identical inputs yield identical outputs
///
/// ## NOT Responsible For
/// - Curve math (providers are supplied by the embedding application)

#include "mvault/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace mvault::curve {

// ─── CurveProvider ────────────────────────────────────────────────────────────

/// One bonding curve. All quantities are base units.
class CurveProvider {
public:
    virtual ~CurveProvider() = default;

    /// Shares issued for depositing `assets` into a vault at `totals`.
    [[nodiscard]] virtual Uint256 preview_deposit(const Uint256& assets,
                                                  const VaultTotals& totals) const = 0;

    /// Assets released for redeeming `shares` from a vault at `totals`.
    [[nodiscard]] virtual Uint256 preview_redeem(const Uint256& shares,
                                                 const VaultTotals& totals) const = 0;

    /// Assets required to mint exactly `shares`.
    [[nodiscard]] virtual Uint256 preview_mint(const Uint256& shares,
                                               const VaultTotals& totals) const = 0;

    /// Shares that must be burned to withdraw exactly `assets`.
    [[nodiscard]] virtual Uint256 preview_withdraw(const Uint256& assets,
                                                   const VaultTotals& totals) const = 0;

    [[nodiscard]] virtual Uint256 convert_to_shares(const Uint256& assets,
                                                    const VaultTotals& totals) const = 0;

    [[nodiscard]] virtual Uint256 convert_to_assets(const Uint256& shares,
                                                    const VaultTotals& totals) const = 0;

    /// Marginal price of one base unit of shares at `totals`.
    [[nodiscard]] virtual Uint256 current_price(const VaultTotals& totals) const = 0;

    /// Largest total asset balance a vault on this curve may hold.
    [[nodiscard]] virtual Uint256 max_assets() const = 0;

    /// Largest total share supply a vault on this curve may reach.
    [[nodiscard]] virtual Uint256 max_shares() const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

// ─── CurveRegistry ────────────────────────────────────────────────────────────

/// Owns curve providers and dispatches calls by curve id.
class CurveRegistry {
public:
    CurveRegistry() = default;

    CurveRegistry(const CurveRegistry&)            = delete;
    CurveRegistry& operator=(const CurveRegistry&) = delete;
    CurveRegistry(CurveRegistry&&)                 = default;
    CurveRegistry& operator=(CurveRegistry&&)      = default;

    /// Register `provider` and return its id (1 for the first curve).
    /// Throws std::invalid_argument if `provider` is null.
    CurveId add_curve(std::unique_ptr<CurveProvider> provider);

    /// Number of registered curves.
    [[nodiscard]] std::size_t count() const noexcept { return curves_.size(); }

    [[nodiscard]] bool is_valid(CurveId id) const noexcept {
        return id >= 1 && id <= curves_.size();
    }

    /// Provider for `id`. Throws `LedgerError(InvalidCurveId)` if unknown.
    [[nodiscard]] const CurveProvider& at(CurveId id) const;

    // ─── Forwarding calls ─────────────────────────────────────────────────────

    [[nodiscard]] Uint256 preview_deposit(CurveId id, const Uint256& assets,
                                          const VaultTotals& totals) const;
    [[nodiscard]] Uint256 preview_redeem(CurveId id, const Uint256& shares,
                                         const VaultTotals& totals) const;
    [[nodiscard]] Uint256 preview_mint(CurveId id, const Uint256& shares,
                                       const VaultTotals& totals) const;
    [[nodiscard]] Uint256 preview_withdraw(CurveId id, const Uint256& assets,
                                           const VaultTotals& totals) const;
    [[nodiscard]] Uint256 convert_to_shares(CurveId id, const Uint256& assets,
                                            const VaultTotals& totals) const;
    [[nodiscard]] Uint256 convert_to_assets(CurveId id, const Uint256& shares,
                                            const VaultTotals& totals) const;
    [[nodiscard]] Uint256 current_price(CurveId id, const VaultTotals& totals) const;
    [[nodiscard]] Uint256 max_assets(CurveId id) const;
    [[nodiscard]] Uint256 max_shares(CurveId id) const;

private:
    std::vector<std::unique_ptr<CurveProvider>> curves_;
};

} // namespace mvault::curve
