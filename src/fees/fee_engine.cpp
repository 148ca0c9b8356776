/// @file src/fees/fee_engine.cpp
/// @brief FeeEngine implementation.

#include "mvault/fees.hpp"
#include "mvault/error.hpp"
#include "mvault/format.hpp"

#include <fmt/core.h>

#include <limits>
#include <stdexcept>

namespace mvault::fees {

// ─── Arithmetic ───────────────────────────────────────────────────────────────

namespace {

using Uint512 = boost::multiprecision::checked_uint512_t;

[[nodiscard]] Uint256 narrow(const Uint512& wide) {
    static const Uint512 MAX = Uint512(std::numeric_limits<Uint256>::max());
    if (wide > MAX) {
        throw std::overflow_error("mul_div: result exceeds 256 bits");
    }
    return static_cast<Uint256>(wide);
}

} // anonymous namespace

Uint256 mul_div(const Uint256& a, const Uint256& b, const Uint256& d) {
    if (d == 0) {
        throw std::domain_error("mul_div: zero denominator");
    }
    return narrow(Uint512(a) * Uint512(b) / Uint512(d));
}

Uint256 mul_div_up(const Uint256& a, const Uint256& b, const Uint256& d) {
    if (d == 0) {
        throw std::domain_error("mul_div_up: zero denominator");
    }
    const Uint512 product = Uint512(a) * Uint512(b);
    const Uint512 wide_d  = Uint512(d);
    Uint512 quotient = product / wide_d;
    if (product % wide_d != 0) {
        ++quotient;
    }
    return narrow(quotient);
}

// ─── FeeEngine ────────────────────────────────────────────────────────────────

Uint256 FeeEngine::fee_on_raw(const Uint256& amount, const Uint256& rate) const {
    return mul_div_up(amount, rate, config_.general.fee_denominator);
}

FeesBreakdown FeeEngine::compute(const FeeRequest& request,
                                 const VaultTotals& totals,
                                 bool paused) const {
    if (request.direction == Direction::Deposit) {
        return compute_deposit(request, totals);
    }
    return compute_redeem(request, totals, paused);
}

FeesBreakdown FeeEngine::compute_deposit(const FeeRequest& request,
                                         const VaultTotals& totals) const {
    FeesBreakdown out;
    out.raw_assets = request.amount;

    const Uint256& raw = request.amount;
    const bool effectively_empty = totals.total_shares <= config_.general.min_share;

    if (!effectively_empty) {
        out.entry_fee = entry_fee_amount(raw);
    }

    if (!request.underlying_atom_leg) {
        out.protocol_fee = protocol_fee_amount(raw);
        if (request.vault_type == VaultType::Atom) {
            out.atom_wallet_fee = atom_wallet_deposit_fee_amount(raw);
        } else {
            out.atom_deposit_fraction = atom_deposit_fraction_amount(raw);
        }
    }

    const Uint256 total_fees = out.protocol_fee + out.entry_fee
                             + out.atom_wallet_fee + out.atom_deposit_fraction;
    if (total_fees > raw) {
        throw LedgerError(ErrorCode::FeesExceedAssets,
                          fmt::format("fees {} exceed deposit {}", total_fees, raw));
    }

    out.assets_for_receiver = raw - total_fees;
    out.shares = curves_.preview_deposit(request.curve, out.assets_for_receiver, totals);
    out.assets_delta = is_default_curve(request.curve)
                     ? out.assets_for_receiver + out.entry_fee
                     : out.assets_for_receiver;
    return out;
}

FeesBreakdown FeeEngine::compute_redeem(const FeeRequest& request,
                                        const VaultTotals& totals,
                                        bool paused) const {
    FeesBreakdown out;
    out.shares     = request.amount;
    out.raw_assets = curves_.preview_redeem(request.curve, request.amount, totals);

    const Uint256& raw = out.raw_assets;

    if (paused) {
        out.assets_for_receiver = raw;
        out.assets_delta        = raw;
        return out;
    }

    out.protocol_fee = protocol_fee_amount(raw);

    const Uint256 remaining = totals.total_shares > request.amount
                            ? Uint256(totals.total_shares - request.amount)
                            : Uint256(0);
    if (remaining > config_.general.min_share) {
        out.exit_fee = exit_fee_amount(raw);
    }

    const Uint256 total_fees = out.protocol_fee + out.exit_fee;
    if (total_fees > raw) {
        throw LedgerError(ErrorCode::FeesExceedAssets,
                          fmt::format("fees {} exceed redeemed assets {}", total_fees, raw));
    }

    out.assets_for_receiver = raw - total_fees;
    out.assets_delta = is_default_curve(request.curve)
                     ? Uint256(raw - out.exit_fee)
                     : raw;
    return out;
}

// ─── Fee views ────────────────────────────────────────────────────────────────

Uint256 FeeEngine::entry_fee_amount(const Uint256& assets) const {
    return fee_on_raw(assets, config_.vault_fees.entry_fee);
}

Uint256 FeeEngine::exit_fee_amount(const Uint256& assets) const {
    return fee_on_raw(assets, config_.vault_fees.exit_fee);
}

Uint256 FeeEngine::protocol_fee_amount(const Uint256& assets) const {
    return fee_on_raw(assets, config_.vault_fees.protocol_fee);
}

Uint256 FeeEngine::atom_wallet_deposit_fee_amount(const Uint256& assets) const {
    return fee_on_raw(assets, config_.atom.atom_wallet_deposit_fee);
}

Uint256 FeeEngine::atom_deposit_fraction_amount(const Uint256& assets) const {
    return fee_on_raw(assets, config_.triple.atom_deposit_fraction_for_triple);
}

} // namespace mvault::fees
