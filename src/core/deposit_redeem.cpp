/// @file src/core/deposit_redeem.cpp
/// @brief Steady-state deposits and redemptions, single and batched.

#include "mvault/multivault.hpp"
#include "mvault/format.hpp"

#include "transaction.hpp"

#include <fmt/core.h>

namespace mvault::core {

namespace {

void require_batch_shape(std::size_t terms, std::size_t curves,
                         std::size_t amounts, std::size_t bounds) {
    if (terms == 0) {
        throw LedgerError(ErrorCode::EmptyArray, "batch is empty");
    }
    if (curves != terms || amounts != terms || bounds != terms) {
        throw LedgerError(ErrorCode::ArraysLengthMismatch,
                          fmt::format("lengths {}/{}/{}/{} differ",
                                      terms, curves, amounts, bounds));
    }
}

} // anonymous namespace

// ─── Public entry points ──────────────────────────────────────────────────────

Uint256 MultiVault::deposit(const Address& sender, const Address& receiver,
                            const TermId& term, CurveId curve,
                            const Uint256& assets, const Uint256& min_shares) {
    return transact("deposit", [&](Transaction& tx) {
        require_not_paused(tx.staged);
        roll_utilization(tx, sender);
        const Uint256 shares = apply_deposit(tx, FlowArgs{sender, receiver, term, curve,
                                                          assets, min_shares});
        add_utilization(tx, sender, Int256(assets));
        tx.charge(sender, assets);
        return shares;
    });
}

std::vector<Uint256> MultiVault::deposit_batch(const Address& sender, const Address& receiver,
                                               std::span<const TermId> terms,
                                               std::span<const CurveId> curves,
                                               std::span<const Uint256> assets,
                                               std::span<const Uint256> min_shares) {
    return transact("deposit_batch", [&](Transaction& tx) {
        require_not_paused(tx.staged);
        require_batch_shape(terms.size(), curves.size(), assets.size(), min_shares.size());
        roll_utilization(tx, sender);

        std::vector<Uint256> shares;
        shares.reserve(terms.size());
        Uint256 total = 0;
        for (std::size_t i = 0; i < terms.size(); ++i) {
            shares.push_back(apply_deposit(tx, FlowArgs{sender, receiver, terms[i], curves[i],
                                                        assets[i], min_shares[i]}));
            total += assets[i];
        }

        add_utilization(tx, sender, Int256(total));
        tx.charge(sender, total);
        return shares;
    });
}

Uint256 MultiVault::redeem(const Address& sender, const Address& receiver,
                           const TermId& term, CurveId curve,
                           const Uint256& shares, const Uint256& min_assets) {
    return transact("redeem", [&](Transaction& tx) {
        roll_utilization(tx, receiver);
        const auto breakdown = apply_redeem(tx, FlowArgs{sender, receiver, term, curve,
                                                         shares, min_assets});
        add_utilization(tx, receiver, -Int256(breakdown.raw_assets));
        tx.pay(receiver, breakdown.assets_for_receiver);
        return breakdown.assets_for_receiver;
    });
}

std::vector<Uint256> MultiVault::redeem_batch(const Address& sender, const Address& receiver,
                                              std::span<const TermId> terms,
                                              std::span<const CurveId> curves,
                                              std::span<const Uint256> shares,
                                              std::span<const Uint256> min_assets) {
    return transact("redeem_batch", [&](Transaction& tx) {
        require_batch_shape(terms.size(), curves.size(), shares.size(), min_assets.size());
        roll_utilization(tx, receiver);

        std::vector<Uint256> payouts;
        payouts.reserve(terms.size());
        Uint256 total_payout = 0;
        Uint256 total_raw    = 0;
        for (std::size_t i = 0; i < terms.size(); ++i) {
            const auto breakdown = apply_redeem(tx, FlowArgs{sender, receiver, terms[i],
                                                             curves[i], shares[i],
                                                             min_assets[i]});
            payouts.push_back(breakdown.assets_for_receiver);
            total_payout += breakdown.assets_for_receiver;
            total_raw    += breakdown.raw_assets;
        }

        add_utilization(tx, receiver, -Int256(total_raw));
        tx.pay(receiver, total_payout);
        return payouts;
    });
}

// ─── Deposit ──────────────────────────────────────────────────────────────────

Uint256 MultiVault::apply_deposit(Transaction& tx, const FlowArgs& args) {
    State& s = tx.staged;
    const ConfigSnapshot& cfg = s.config;

    const VaultType type = require_term(s, args.term);
    require_curve(args.curve);

    if (args.amount == 0) {
        throw LedgerError(ErrorCode::ZeroAmount, "deposit of zero assets");
    }
    if (args.amount < cfg.general.min_deposit) {
        throw LedgerError(ErrorCode::DepositBelowMinimum,
                          fmt::format("{} is below the minimum deposit {}",
                                      args.amount, cfg.general.min_deposit));
    }

    require_approval(s, args.receiver, args.sender, ApprovalType::Deposit);

    const bool default_curve = args.curve == cfg.bonding_curve.default_curve_id;
    if (default_curve && type != VaultType::Atom) {
        const TermId mirror = *mirror_of(s, args.term);
        if (s.vaults.balance_of(args.receiver, mirror, args.curve) != 0) {
            throw LedgerError(ErrorCode::HasCounterStake,
                              fmt::format("{} holds shares of the opposing vault {}",
                                          args.receiver, mirror));
        }
    }

    // First deposit on this curve pays the ghost shares of the vault and,
    // for triples, of its mirror.
    const Uint256 ghost = ghost_cost(s, args.term, args.curve, type);
    if (ghost != 0) {
        if (args.amount <= ghost) {
            throw LedgerError(ErrorCode::DepositTooSmallForGhostShares,
                              fmt::format("{} does not cover ghost cost {}", args.amount, ghost));
        }
        if (!s.vaults.exists(args.term, args.curve)) {
            open_ghost_vault(tx, args.term, args.curve, type);
        }
        if (type != VaultType::Atom) {
            const TermId mirror = *mirror_of(s, args.term);
            if (!s.vaults.exists(mirror, args.curve)) {
                const VaultType mirror_type = type == VaultType::Triple
                                            ? VaultType::CounterTriple
                                            : VaultType::Triple;
                open_ghost_vault(tx, mirror, args.curve, mirror_type);
            }
        }
    }

    const VaultTotals before = s.vaults.totals_or_empty(args.term, args.curve);
    const auto breakdown = tx.fee_engine(curves_).compute(
        fees::FeeRequest{
            .direction  = fees::Direction::Deposit,
            .amount     = args.amount - ghost,
            .vault_type = type,
            .curve      = args.curve,
        },
        before, false);

    if (breakdown.shares == 0) {
        throw LedgerError(ErrorCode::ZeroSharesOut,
                          fmt::format("{} assets buy no shares of {}", args.amount, args.term));
    }
    if (breakdown.shares < args.bound) {
        throw LedgerError(ErrorCode::SlippageExceeded,
                          fmt::format("{} shares below minimum {}", breakdown.shares, args.bound));
    }

    const VaultTotals after{before.total_assets + breakdown.assets_delta,
                            before.total_shares + breakdown.shares};
    if (after.total_assets > curves_.max_assets(args.curve)) {
        throw LedgerError(ErrorCode::ExceedsCurveMaxAssets,
                          fmt::format("{} exceeds curve {} max assets",
                                      after.total_assets, args.curve));
    }

    const auto signal = s.vaults.set_totals(args.term, args.curve, after.total_assets,
                                            after.total_shares, curves_);
    s.vaults.mint(args.receiver, args.term, args.curve, breakdown.shares);

    emit_price(tx, signal, type);
    tx.emit(Deposited{
        .sender     = args.sender,
        .receiver   = args.receiver,
        .term       = args.term,
        .curve      = args.curve,
        .vault_type = type,
        .before     = before,
        .after      = after,
        .fees       = breakdown,
    });

    apply_deposit_fees(tx, args.sender, args.receiver, args.term, args.curve, breakdown);
    return breakdown.shares;
}

void MultiVault::apply_deposit_fees(Transaction& tx, const Address& sender,
                                    const Address& receiver, const TermId& term,
                                    CurveId curve, const fees::FeesBreakdown& breakdown) {
    const ConfigSnapshot& cfg = tx.staged.config;

    accrue_protocol_fee(tx, sender, breakdown.protocol_fee);

    if (breakdown.atom_wallet_fee != 0) {
        accrue_atom_wallet_fee(tx, term, sender, breakdown.atom_wallet_fee);
    }

    // Off the default curve the entry fee belongs to the term's pro-rata vault.
    if (curve != cfg.bonding_curve.default_curve_id && breakdown.entry_fee != 0) {
        bump_assets(tx, term, cfg.bonding_curve.default_curve_id, breakdown.entry_fee);
    }

    if (breakdown.atom_deposit_fraction != 0) {
        fan_out_fraction(tx, sender, receiver, term, breakdown.atom_deposit_fraction);
    }
}

// ─── Redeem ───────────────────────────────────────────────────────────────────

fees::FeesBreakdown MultiVault::apply_redeem(Transaction& tx, const FlowArgs& args) {
    State& s = tx.staged;
    const ConfigSnapshot& cfg = s.config;

    const VaultType type = require_term(s, args.term);
    require_curve(args.curve);

    if (args.amount == 0) {
        throw LedgerError(ErrorCode::ZeroAmount, "redeem of zero shares");
    }

    require_approval(s, args.receiver, args.sender, ApprovalType::Redemption);

    const Uint256 balance = s.vaults.balance_of(args.receiver, args.term, args.curve);
    if (args.amount > balance) {
        throw LedgerError(ErrorCode::InsufficientBalance,
                          fmt::format("{} holds {} shares, {} requested",
                                      args.receiver, balance, args.amount));
    }

    const VaultTotals before = s.vaults.totals_or_empty(args.term, args.curve);
    const Uint256 remaining = before.total_shares - args.amount;
    if (remaining < cfg.general.min_share) {
        throw LedgerError(ErrorCode::RemainingSharesBelowMinimum,
                          fmt::format("{} shares would remain, floor is {}",
                                      remaining, cfg.general.min_share));
    }

    const auto breakdown = tx.fee_engine(curves_).compute(
        fees::FeeRequest{
            .direction  = fees::Direction::Redeem,
            .amount     = args.amount,
            .vault_type = type,
            .curve      = args.curve,
        },
        before, s.paused);

    if (breakdown.assets_for_receiver == 0) {
        throw LedgerError(ErrorCode::ZeroAssetsOut,
                          fmt::format("{} shares of {} redeem for nothing",
                                      args.amount, args.term));
    }
    if (breakdown.assets_for_receiver < args.bound) {
        throw LedgerError(ErrorCode::SlippageExceeded,
                          fmt::format("{} assets below minimum {}",
                                      breakdown.assets_for_receiver, args.bound));
    }

    const VaultTotals after{before.total_assets - breakdown.assets_delta, remaining};

    s.vaults.burn(args.receiver, args.term, args.curve, args.amount);
    const auto signal = s.vaults.set_totals(args.term, args.curve, after.total_assets,
                                            after.total_shares, curves_);

    emit_price(tx, signal, type);
    tx.emit(Redeemed{
        .sender     = args.sender,
        .receiver   = args.receiver,
        .term       = args.term,
        .curve      = args.curve,
        .vault_type = type,
        .before     = before,
        .after      = after,
        .fees       = breakdown,
    });

    accrue_protocol_fee(tx, args.receiver, breakdown.protocol_fee);
    if (args.curve != cfg.bonding_curve.default_curve_id && breakdown.exit_fee != 0) {
        bump_assets(tx, args.term, cfg.bonding_curve.default_curve_id, breakdown.exit_fee);
    }
    return breakdown;
}

} // namespace mvault::core
