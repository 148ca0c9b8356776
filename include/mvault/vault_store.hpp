#pragma once

/// @file include/mvault/vault_store.hpp
/// @brief Per-(term, curve) asset/share ledger.
///
/// # Module: Vault Store
///
/// ## Responsibility
/// Hold total assets, total shares and per-account share balances for every
/// (term, curve) vault, and expose the only three primitives that mutate
/// them: `mint`, `burn` and `set_totals`.
///
/// ## Guarantees
/// - `burn` never underflows a balance; it throws `InsufficientBalance`
/// - `set_totals` returns the derived share price but never stores it
/// - The store is a plain value: copying it snapshots the whole ledger
///
/// ## NOT Responsible For
/// - Keeping `sum(balances) == total_shares` (callers pair every totals
///   update with the matching mint or burn)

#include "mvault/types.hpp"
#include "mvault/curve.hpp"

#include <map>
#include <optional>

namespace mvault::vault {

// ─── Vault ────────────────────────────────────────────────────────────────────

/// State of one (term, curve) vault.
struct Vault {
    Uint256 total_assets;
    Uint256 total_shares;
    std::map<Address, Uint256> balances;  ///< Zero balances are erased
};

/// Composite key of a vault.
struct VaultKey {
    TermId  term;
    CurveId curve = 0;

    auto operator<=>(const VaultKey&) const = default;
};

/// Observability signal produced by every totals update.
struct PriceSignal {
    TermId  term;
    CurveId curve = 0;
    Uint256 share_price;
    Uint256 total_assets;
    Uint256 total_shares;
};

// ─── VaultStore ───────────────────────────────────────────────────────────────

class VaultStore {
public:
    /// Credit `amount` shares to `account`. Unconditional.
    void mint(const Address& account, const TermId& term, CurveId curve,
              const Uint256& amount);

    /// Debit `amount` shares from `account`.
    /// Throws `LedgerError(InsufficientBalance)` if the balance is smaller.
    void burn(const Address& account, const TermId& term, CurveId curve,
              const Uint256& amount);

    /// Overwrite the vault totals and derive the current share price:
    ///   - 0 when `shares == 0`
    ///   - `convert_to_assets(ONE_SHARE)` when `shares >= ONE_SHARE`
    ///   - the curve's marginal `current_price` otherwise
    PriceSignal set_totals(const TermId& term, CurveId curve,
                           const Uint256& assets, const Uint256& shares,
                           const curve::CurveRegistry& curves);

    /// Share price a vault at `totals` reports on `curve` (see set_totals).
    [[nodiscard]] static Uint256 share_price(const VaultTotals& totals, CurveId curve,
                                             const curve::CurveRegistry& curves);

    // ─── Views ────────────────────────────────────────────────────────────────

    /// Totals of the vault, `nullopt` if it was never written.
    [[nodiscard]] std::optional<VaultTotals> totals(const TermId& term, CurveId curve) const;

    /// Totals of the vault, (0, 0) if it was never written.
    [[nodiscard]] VaultTotals totals_or_empty(const TermId& term, CurveId curve) const;

    [[nodiscard]] Uint256 balance_of(const Address& account, const TermId& term,
                                     CurveId curve) const;

    /// True once the vault has been initialised (non-zero share supply).
    [[nodiscard]] bool exists(const TermId& term, CurveId curve) const;

    /// Sum of every holder balance; equals `total_shares` in a consistent store.
    [[nodiscard]] Uint256 holders_balance_sum(const TermId& term, CurveId curve) const;

    [[nodiscard]] std::size_t vault_count() const noexcept { return vaults_.size(); }

    /// Read-only access to every vault, ordered by key.
    [[nodiscard]] const std::map<VaultKey, Vault>& vaults() const noexcept { return vaults_; }

private:
    [[nodiscard]] const Vault* find(const TermId& term, CurveId curve) const;

    std::map<VaultKey, Vault> vaults_;
};

} // namespace mvault::vault
