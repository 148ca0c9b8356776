/**
 * @file  prop_fee_rounding.cpp
 * @brief Property: every fee rounds up and never exceeds the amount it is taken from
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_fee_rounding
 *
 * Basis:
 *   fee = ⌈raw × rate / denom⌉, so fee × denom ≥ raw × rate and
 *   (fee − 1) × denom < raw × rate.  ⌈x⌉ − ⌊x⌋ ∈ {0, 1}.
 *
 * A violation would indicate:
 *   • A floor where a ceiling belongs (fees leak to the depositor)
 *   • A payout larger than the redeemed assets
 */

#include <rapidcheck.h>

#include "common/test_doubles.hpp"
#include "mvault/error.hpp"
#include "mvault/fees.hpp"

#include <cstdint>
#include <memory>

using namespace mvault;
using namespace mvault::fees;

static ConfigSnapshot make_config(std::uint64_t entry, std::uint64_t exit_rate,
                                  std::uint64_t protocol, std::uint64_t wallet) {
    ConfigSnapshot cfg;
    cfg.general.admin             = Address::from_u64(1);
    cfg.general.protocol_multisig = Address::from_u64(2);
    cfg.general.trust_bonding     = Address::from_u64(3);
    cfg.general.min_share         = 1'000;
    cfg.vault_fees.entry_fee      = entry;
    cfg.vault_fees.exit_fee       = exit_rate;
    cfg.vault_fees.protocol_fee   = protocol;
    cfg.atom.atom_wallet_deposit_fee = wallet;
    return cfg;
}

int main() {
    // ── Property 1: ⌈a·b/d⌉ − ⌊a·b/d⌋ ∈ {0, 1} ─────────────────────────────────
    rc::check(
        "mul_div_up exceeds mul_div by at most one",
        [](std::uint64_t a, std::uint64_t b) {
            const auto d = *rc::gen::inRange<std::uint64_t>(1, UINT64_MAX);
            const Uint256 down = mul_div(a, b, d);
            const Uint256 up   = mul_div_up(a, b, d);
            RC_ASSERT(up >= down);
            RC_ASSERT(up - down <= 1);
            RC_ASSERT(up * Uint256(d) >= Uint256(a) * Uint256(b));
        });

    // ── Property 2: deposit fees round up and fit inside the deposit ─────────
    rc::check(
        "deposit fees are ceilings and never exceed the raw amount",
        []() {
            const auto entry    = *rc::gen::inRange<std::uint64_t>(0, 2'500);
            const auto protocol = *rc::gen::inRange<std::uint64_t>(0, 2'500);
            const auto wallet   = *rc::gen::inRange<std::uint64_t>(0, 2'500);
            const auto raw      = *rc::gen::inRange<std::uint64_t>(1, 1'000'000'000'000ULL);
            const auto assets   = *rc::gen::inRange<std::uint64_t>(1'001, 1'000'000'000ULL);

            const ConfigSnapshot cfg = make_config(entry, 0, protocol, wallet);
            curve::CurveRegistry curves;
            curves.add_curve(std::make_unique<test::ProRataCurve>());
            const FeeEngine engine(cfg, curves);

            FeesBreakdown b;
            try {
                b = engine.compute(FeeRequest{Direction::Deposit, raw, VaultType::Atom, 1, false},
                                   VaultTotals{assets, assets}, false);
            } catch (const LedgerError& e) {
                RC_ASSERT(e.code() == ErrorCode::FeesExceedAssets);
                return;
            }

            const Uint256 denom = cfg.general.fee_denominator;
            RC_ASSERT(b.entry_fee * denom >= Uint256(raw) * entry);
            RC_ASSERT(b.protocol_fee * denom >= Uint256(raw) * protocol);
            RC_ASSERT(b.atom_wallet_fee * denom >= Uint256(raw) * wallet);
            RC_ASSERT(b.entry_fee + b.protocol_fee + b.atom_wallet_fee + b.assets_for_receiver
                      == Uint256(raw));
        });

    // ── Property 3: redeem payout never exceeds the redeemed assets ──────────
    rc::check(
        "redeem payout plus fees equals raw assets",
        []() {
            const auto exit_rate = *rc::gen::inRange<std::uint64_t>(0, 5'000);
            const auto protocol  = *rc::gen::inRange<std::uint64_t>(0, 5'000);
            const auto total     = *rc::gen::inRange<std::uint64_t>(2'000, 1'000'000'000ULL);
            const auto shares    = *rc::gen::inRange<std::uint64_t>(1, total - 1'000);
            const bool paused    = *rc::gen::arbitrary<bool>();

            const ConfigSnapshot cfg = make_config(0, exit_rate, protocol, 0);
            curve::CurveRegistry curves;
            curves.add_curve(std::make_unique<test::ProRataCurve>());
            const FeeEngine engine(cfg, curves);

            FeesBreakdown b;
            try {
                b = engine.compute(FeeRequest{Direction::Redeem, shares, VaultType::Atom, 1, false},
                                   VaultTotals{total, total}, paused);
            } catch (const LedgerError& e) {
                // Ceilings on a tiny redemption can outgrow it; never while paused
                RC_ASSERT(!paused);
                RC_ASSERT(e.code() == ErrorCode::FeesExceedAssets);
                return;
            }

            RC_ASSERT(b.assets_for_receiver <= b.raw_assets);
            RC_ASSERT(b.assets_for_receiver + b.protocol_fee + b.exit_fee == b.raw_assets);
            if (paused) {
                RC_ASSERT(b.protocol_fee == 0);
                RC_ASSERT(b.exit_fee == 0);
            }
        });

    return 0;
}
