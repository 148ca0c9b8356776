#include <gtest/gtest.h>
#include "mvault/utilization.hpp"

using namespace mvault;
using namespace mvault::utilization;

static const Address ALICE = Address::from_u64(0xA1);
static const Address BOB   = Address::from_u64(0xB2);

// ─── Global bucket ────────────────────────────────────────────────────────────

TEST(Utilization_Rollover, FirstEverAction_SeedsWithoutSettlement) {
    UtilizationLedger ledger;
    const auto out = ledger.rollover(ALICE, 1, true);
    EXPECT_TRUE(out.global_seeded);
    EXPECT_FALSE(out.personal_seeded);
    EXPECT_FALSE(out.settle_epoch.has_value());
    EXPECT_TRUE(ledger.is_seeded(1));
    EXPECT_EQ(ledger.total_utilization(1), 0);
    EXPECT_EQ(ledger.last_active_epoch(ALICE), Epoch{1});
}

TEST(Utilization_Rollover, SameEpoch_SecondCallIsNoop) {
    UtilizationLedger ledger;
    ledger.rollover(ALICE, 1, true);
    const auto out = ledger.rollover(BOB, 1, true);
    EXPECT_FALSE(out.global_seeded);
    EXPECT_FALSE(out.settle_epoch.has_value());
}

TEST(Utilization_Rollover, NextEpoch_CarriesTotalAndSettlesPrevious) {
    UtilizationLedger ledger;
    ledger.rollover(ALICE, 1, true);
    ledger.add(ALICE, 1, 500);

    const auto out = ledger.rollover(BOB, 2, true);
    EXPECT_TRUE(out.global_seeded);
    ASSERT_TRUE(out.settle_epoch.has_value());
    EXPECT_EQ(*out.settle_epoch, 1u);
    EXPECT_EQ(ledger.total_utilization(2), 500);
    EXPECT_TRUE(ledger.is_settled(1));
}

TEST(Utilization_Rollover, SkippedEpochs_CarryFromLatestSeeded) {
    UtilizationLedger ledger;
    ledger.rollover(ALICE, 1, true);
    ledger.add(ALICE, 1, 700);

    const auto out = ledger.rollover(ALICE, 5, true);
    EXPECT_EQ(out.settle_epoch, Epoch{1});
    EXPECT_EQ(ledger.total_utilization(5), 700);
    EXPECT_FALSE(ledger.is_seeded(3));
    EXPECT_EQ(ledger.latest_seeded_epoch(), Epoch{5});
}

TEST(Utilization_Rollover, BucketNettingToZero_IsNotReseeded) {
    UtilizationLedger ledger;
    ledger.rollover(ALICE, 1, true);
    ledger.rollover(ALICE, 2, true);
    ledger.add(ALICE, 2, 100);
    ledger.add(ALICE, 2, -100);
    EXPECT_EQ(ledger.total_utilization(2), 0);

    const auto out = ledger.rollover(BOB, 2, true);
    EXPECT_FALSE(out.global_seeded);
    EXPECT_EQ(ledger.total_utilization(2), 0);
}

TEST(Utilization_Rollover, EachEpochSettledOnce) {
    UtilizationLedger ledger;
    ledger.rollover(ALICE, 1, true);
    EXPECT_EQ(ledger.rollover(ALICE, 2, true).settle_epoch, Epoch{1});
    EXPECT_FALSE(ledger.rollover(BOB, 2, true).settle_epoch.has_value());
    EXPECT_EQ(ledger.rollover(BOB, 3, true).settle_epoch, Epoch{2});
}

TEST(Utilization_Rollover, DistributionFlag_SnapshottedAtSeeding) {
    UtilizationLedger ledger;
    ledger.rollover(ALICE, 1, false);
    ledger.rollover(BOB, 1, true);
    ledger.rollover(ALICE, 2, true);
    EXPECT_EQ(ledger.distribution_snapshot(1), false);
    EXPECT_EQ(ledger.distribution_snapshot(2), true);
    EXPECT_FALSE(ledger.distribution_snapshot(3).has_value());
}

// ─── Personal bucket ──────────────────────────────────────────────────────────

TEST(Utilization_Personal, LaterEpoch_CarriesLastActiveBucket) {
    UtilizationLedger ledger;
    ledger.rollover(ALICE, 1, true);
    ledger.add(ALICE, 1, 1'000);

    const auto out = ledger.rollover(ALICE, 3, true);
    EXPECT_TRUE(out.personal_seeded);
    EXPECT_EQ(ledger.user_utilization(ALICE, 3), 1'000);
    EXPECT_EQ(ledger.user_utilization(ALICE, 2), 0);
    EXPECT_EQ(ledger.last_active_epoch(ALICE), Epoch{3});
}

TEST(Utilization_Personal, IsIndependentPerAccount) {
    UtilizationLedger ledger;
    ledger.rollover(ALICE, 1, true);
    ledger.add(ALICE, 1, 1'000);
    ledger.rollover(BOB, 2, true);
    ledger.add(BOB, 2, 50);

    EXPECT_EQ(ledger.user_utilization(BOB, 2), 50);
    EXPECT_EQ(ledger.user_utilization(ALICE, 2), 0);
    EXPECT_EQ(ledger.total_utilization(2), 1'050);
}

TEST(Utilization_Personal, EarlierEpoch_DoesNotMovePointerBack) {
    UtilizationLedger ledger;
    ledger.rollover(ALICE, 3, true);
    const auto out = ledger.rollover(ALICE, 2, true);
    EXPECT_FALSE(out.personal_seeded);
    EXPECT_EQ(ledger.last_active_epoch(ALICE), Epoch{3});
}

TEST(Utilization_Add, NegativeDelta_GoesBelowZero) {
    UtilizationLedger ledger;
    ledger.rollover(ALICE, 1, true);
    ledger.add(ALICE, 1, -250);
    EXPECT_EQ(ledger.total_utilization(1), -250);
    EXPECT_EQ(ledger.user_utilization(ALICE, 1), -250);
}
