#pragma once

/// @file include/mvault/fees.hpp
/// @brief Fee-and-share computation shared by every deposit and redeem path.
///
/// # Module: Fee Engine
///
/// ## Responsibility
/// Turn a raw deposit (assets) or redemption (shares) into the complete
/// `FeesBreakdown`: every fee component, the net amount for the
/// counterparty, the shares minted or burned and the change to the vault's
/// total assets. No other code computes a fee.
///
/// ## Deposit
///   protocol   = ⌈raw × protocol_fee / denom⌉
///   wallet     = ⌈raw × atom_wallet_deposit_fee / denom⌉      (atoms)
///   fraction   = ⌈raw × atom_deposit_fraction_for_triple / denom⌉ (triples, counters)
///   entry      = ⌈raw × entry_fee / denom⌉, or 0 while total_shares ≤ min_share
///   net        = raw − protocol − wallet − fraction − entry
///   shares     = curve.preview_deposit(net, totals)
/// An underlying-atom leg pays the entry fee only.
///
/// ## Redeem
///   raw        = curve.preview_redeem(shares, totals)
///   paused     → no fees at all
///   protocol   = ⌈raw × protocol_fee / denom⌉
///   exit       = ⌈raw × exit_fee / denom⌉, or 0 if total_shares − shares ≤ min_share
///   payout     = raw − protocol − exit
///
/// ## Guarantees
/// - Every fee rounds up (in favour of the vault and protocol)
/// - At most one of entry/exit is non-zero
/// - At most one of wallet/fraction is non-zero
/// - On the default curve the entry or exit fee stays in the vault; on other
///   curves `assets_delta` excludes it so the caller can route it to the
///   term's default-curve vault
///
/// ## NOT Responsible For
/// - Applying the breakdown to any state

#include "mvault/types.hpp"
#include "mvault/config.hpp"
#include "mvault/curve.hpp"

namespace mvault::fees {

// ─── Arithmetic ───────────────────────────────────────────────────────────────

/// ⌊a × b / d⌋ with a 512-bit intermediate. Throws std::overflow_error if the
/// result does not fit 256 bits, std::domain_error if `d == 0`.
[[nodiscard]] Uint256 mul_div(const Uint256& a, const Uint256& b, const Uint256& d);

/// ⌈a × b / d⌉ with a 512-bit intermediate.
[[nodiscard]] Uint256 mul_div_up(const Uint256& a, const Uint256& b, const Uint256& d);

// ─── Request / Breakdown ──────────────────────────────────────────────────────

enum class Direction : std::uint8_t {
    Deposit,
    Redeem,
};

/// Input to `FeeEngine::compute`.
struct FeeRequest {
    Direction direction = Direction::Deposit;

    /// Assets deposited (Deposit) or shares redeemed (Redeem).
    Uint256 amount;

    VaultType vault_type = VaultType::Atom;
    CurveId   curve      = constants::DEFAULT_CURVE_ID;

    /// Deposit is a triple's fraction pushed into one of its atoms.
    bool underlying_atom_leg = false;
};

/// Every number produced by one deposit or redemption.
struct FeesBreakdown {
    Uint256 raw_assets;           ///< Gross assets entering (deposit) or leaving (redeem)
    Uint256 shares;               ///< Shares minted (deposit) or burned (redeem)
    Uint256 assets_for_receiver;  ///< Net assets priced into shares, or the redeem payout
    Uint256 assets_delta;         ///< Change to the vault's total assets
    Uint256 entry_fee;
    Uint256 exit_fee;
    Uint256 protocol_fee;
    Uint256 atom_wallet_fee;
    Uint256 atom_deposit_fraction;

    bool operator==(const FeesBreakdown&) const = default;
};

// ─── FeeEngine ────────────────────────────────────────────────────────────────

class FeeEngine {
public:
    /// Both references must outlive the engine.
    FeeEngine(const ConfigSnapshot& config, const curve::CurveRegistry& curves) noexcept
        : config_(config), curves_(curves) {}

    /// Compute the breakdown for `request` against the vault's current totals.
    ///
    /// # Errors
    /// - `LedgerError(FeesExceedAssets)` if deposit fees exceed the raw amount
    /// - `LedgerError(InvalidCurveId)` if the curve is not registered
    [[nodiscard]] FeesBreakdown compute(const FeeRequest& request,
                                        const VaultTotals& totals,
                                        bool paused) const;

    // ─── Fee views ────────────────────────────────────────────────────────────

    [[nodiscard]] Uint256 entry_fee_amount(const Uint256& assets) const;
    [[nodiscard]] Uint256 exit_fee_amount(const Uint256& assets) const;
    [[nodiscard]] Uint256 protocol_fee_amount(const Uint256& assets) const;
    [[nodiscard]] Uint256 atom_wallet_deposit_fee_amount(const Uint256& assets) const;
    [[nodiscard]] Uint256 atom_deposit_fraction_amount(const Uint256& assets) const;

    [[nodiscard]] bool is_default_curve(CurveId curve) const noexcept {
        return curve == config_.bonding_curve.default_curve_id;
    }

private:
    [[nodiscard]] Uint256 fee_on_raw(const Uint256& amount, const Uint256& rate) const;

    [[nodiscard]] FeesBreakdown compute_deposit(const FeeRequest& request,
                                                const VaultTotals& totals) const;
    [[nodiscard]] FeesBreakdown compute_redeem(const FeeRequest& request,
                                               const VaultTotals& totals,
                                               bool paused) const;

    const ConfigSnapshot&        config_;
    const curve::CurveRegistry&  curves_;
};

} // namespace mvault::fees
