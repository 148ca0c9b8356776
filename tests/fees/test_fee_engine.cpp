#include <gtest/gtest.h>
#include "common/test_doubles.hpp"
#include "mvault/error.hpp"
#include "mvault/fees.hpp"

#include <limits>
#include <memory>
#include <stdexcept>

using namespace mvault;
using namespace mvault::fees;
using mvault::test::ProRataCurve;

static ConfigSnapshot make_config() {
    ConfigSnapshot cfg;
    cfg.general.admin             = Address::from_u64(1);
    cfg.general.protocol_multisig = Address::from_u64(2);
    cfg.general.trust_bonding     = Address::from_u64(3);
    cfg.general.fee_denominator   = 10'000;
    cfg.general.min_share         = 1'000;
    cfg.atom.atom_wallet_deposit_fee            = 100;
    cfg.triple.atom_deposit_fraction_for_triple = 900;
    cfg.vault_fees.entry_fee    = 100;
    cfg.vault_fees.exit_fee     = 100;
    cfg.vault_fees.protocol_fee = 100;
    return cfg;
}

class FeeEngineTest : public ::testing::Test {
protected:
    FeeEngineTest() {
        curves.add_curve(std::make_unique<ProRataCurve>("pro-rata"));
        curves.add_curve(std::make_unique<ProRataCurve>("alt"));
    }

    FeesBreakdown deposit(const Uint256& assets, VaultTotals totals,
                          VaultType type = VaultType::Atom, CurveId curve = 1,
                          bool leg = false) const {
        return FeeEngine(config, curves).compute(
            FeeRequest{Direction::Deposit, assets, type, curve, leg}, totals, false);
    }

    FeesBreakdown redeem(const Uint256& shares, VaultTotals totals, CurveId curve = 1,
                         bool paused = false) const {
        return FeeEngine(config, curves).compute(
            FeeRequest{Direction::Redeem, shares, VaultType::Atom, curve, false},
            totals, paused);
    }

    ConfigSnapshot       config = make_config();
    curve::CurveRegistry curves;
};

// ─── mul_div ──────────────────────────────────────────────────────────────────

TEST(FeeMath_MulDiv, FloorsAndCeils) {
    EXPECT_EQ(mul_div(7, 3, 2), 10);
    EXPECT_EQ(mul_div_up(7, 3, 2), 11);
    EXPECT_EQ(mul_div_up(8, 3, 2), 12);
}

TEST(FeeMath_MulDiv, ZeroDenominator_ThrowsDomainError) {
    EXPECT_THROW((void)mul_div(1, 1, 0), std::domain_error);
    EXPECT_THROW((void)mul_div_up(1, 1, 0), std::domain_error);
}

TEST(FeeMath_MulDiv, WideIntermediate_DoesNotOverflow) {
    const Uint256 max = std::numeric_limits<Uint256>::max();
    EXPECT_EQ(mul_div(max, max, max), max);
}

TEST(FeeMath_MulDiv, ResultAbove256Bits_ThrowsOverflow) {
    const Uint256 max = std::numeric_limits<Uint256>::max();
    EXPECT_THROW((void)mul_div(max, 2, 1), std::overflow_error);
}

// ─── Deposit ──────────────────────────────────────────────────────────────────

TEST_F(FeeEngineTest, Deposit_EmptyAtomVault_EntryFeeWaived) {
    const auto b = deposit(1'000'000, VaultTotals{0, 0});
    EXPECT_EQ(b.entry_fee, 0);
    EXPECT_EQ(b.protocol_fee, 10'000);
    EXPECT_EQ(b.atom_wallet_fee, 10'000);
    EXPECT_EQ(b.atom_deposit_fraction, 0);
    EXPECT_EQ(b.assets_for_receiver, 980'000);
    EXPECT_EQ(b.shares, 980'000);
    EXPECT_EQ(b.assets_delta, 980'000);
}

TEST_F(FeeEngineTest, Deposit_GhostOnlyVault_EntryFeeWaived) {
    const auto b = deposit(10'000, VaultTotals{1'000, 1'000});
    EXPECT_EQ(b.entry_fee, 0);
}

TEST_F(FeeEngineTest, Deposit_PopulatedAtomVault_AllFeesCharged) {
    const auto b = deposit(100'000, VaultTotals{981'000, 981'000});
    EXPECT_EQ(b.entry_fee, 1'000);
    EXPECT_EQ(b.protocol_fee, 1'000);
    EXPECT_EQ(b.atom_wallet_fee, 1'000);
    EXPECT_EQ(b.shares, 97'000);
    EXPECT_EQ(b.assets_delta, 98'000);
}

TEST_F(FeeEngineTest, Deposit_Triple_ChargesFractionNotWalletFee) {
    const auto b = deposit(100'000, VaultTotals{1'000, 1'000}, VaultType::Triple);
    EXPECT_EQ(b.atom_wallet_fee, 0);
    EXPECT_EQ(b.atom_deposit_fraction, 9'000);
    EXPECT_EQ(b.protocol_fee, 1'000);
    EXPECT_EQ(b.shares, 90'000);
}

TEST_F(FeeEngineTest, Deposit_CounterTriple_ChargesFraction) {
    const auto b = deposit(100'000, VaultTotals{1'000, 1'000}, VaultType::CounterTriple);
    EXPECT_EQ(b.atom_deposit_fraction, 9'000);
}

TEST_F(FeeEngineTest, Deposit_UnderlyingAtomLeg_PaysEntryFeeOnly) {
    const auto b = deposit(30'000, VaultTotals{981'000, 981'000}, VaultType::Atom, 1, true);
    EXPECT_EQ(b.entry_fee, 300);
    EXPECT_EQ(b.protocol_fee, 0);
    EXPECT_EQ(b.atom_wallet_fee, 0);
    EXPECT_EQ(b.shares, 29'700);
    EXPECT_EQ(b.assets_delta, 30'000);
}

TEST_F(FeeEngineTest, Deposit_NonDefaultCurve_DeltaExcludesEntryFee) {
    const auto b = deposit(10'000, VaultTotals{98'020, 98'020}, VaultType::Atom, 2);
    EXPECT_EQ(b.entry_fee, 100);
    EXPECT_EQ(b.assets_for_receiver, 9'700);
    EXPECT_EQ(b.assets_delta, 9'700);
}

TEST_F(FeeEngineTest, Deposit_FeesRoundUp) {
    const auto b = deposit(150, VaultTotals{0, 0});
    // 150 × 1 % = 1.5 → 2
    EXPECT_EQ(b.protocol_fee, 2);
    EXPECT_EQ(b.atom_wallet_fee, 2);
}

TEST_F(FeeEngineTest, Deposit_FeesAboveAmount_ThrowsFeesExceedAssets) {
    try {
        (void)deposit(1, VaultTotals{0, 0});
        FAIL() << "expected LedgerError";
    } catch (const LedgerError& e) {
        EXPECT_EQ(e.code(), ErrorCode::FeesExceedAssets);
    }
}

TEST_F(FeeEngineTest, Deposit_UnknownCurve_ThrowsInvalidCurveId) {
    try {
        (void)deposit(1'000, VaultTotals{0, 0}, VaultType::Atom, 9);
        FAIL() << "expected LedgerError";
    } catch (const LedgerError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidCurveId);
    }
}

// ─── Redeem ───────────────────────────────────────────────────────────────────

TEST_F(FeeEngineTest, Redeem_DefaultCurve_ExitFeeStaysInVault) {
    const auto b = redeem(10'000, VaultTotals{100'000, 100'000});
    EXPECT_EQ(b.raw_assets, 10'000);
    EXPECT_EQ(b.protocol_fee, 100);
    EXPECT_EQ(b.exit_fee, 100);
    EXPECT_EQ(b.assets_for_receiver, 9'800);
    EXPECT_EQ(b.assets_delta, 9'900);
}

TEST_F(FeeEngineTest, Redeem_NonDefaultCurve_DeltaIsRaw) {
    const auto b = redeem(10'000, VaultTotals{100'000, 100'000}, 2);
    EXPECT_EQ(b.exit_fee, 100);
    EXPECT_EQ(b.assets_delta, 10'000);
}

TEST_F(FeeEngineTest, Redeem_LeavingOnlyMinShare_ExitFeeWaived) {
    const auto b = redeem(980'000, VaultTotals{981'000, 981'000});
    EXPECT_EQ(b.exit_fee, 0);
    EXPECT_EQ(b.protocol_fee, 9'800);
    EXPECT_EQ(b.assets_for_receiver, 970'200);
}

TEST_F(FeeEngineTest, Redeem_Paused_NoFees) {
    const auto b = redeem(10'000, VaultTotals{100'000, 100'000}, 1, true);
    EXPECT_EQ(b.protocol_fee, 0);
    EXPECT_EQ(b.exit_fee, 0);
    EXPECT_EQ(b.assets_for_receiver, 10'000);
    EXPECT_EQ(b.assets_delta, 10'000);
}

// ─── Views ────────────────────────────────────────────────────────────────────

TEST_F(FeeEngineTest, FeeViews_RoundUp) {
    const FeeEngine engine(config, curves);
    EXPECT_EQ(engine.entry_fee_amount(1), 1);
    EXPECT_EQ(engine.exit_fee_amount(10'000), 100);
    EXPECT_EQ(engine.protocol_fee_amount(10'001), 101);
    EXPECT_EQ(engine.atom_wallet_deposit_fee_amount(0), 0);
    EXPECT_EQ(engine.atom_deposit_fraction_amount(1'000), 90);
    EXPECT_TRUE(engine.is_default_curve(1));
    EXPECT_FALSE(engine.is_default_curve(2));
}
