#include <gtest/gtest.h>
#include "common/ledger_fixture.hpp"

using namespace mvault;
using namespace mvault::test;

class ApprovalTest : public LedgerFixture {
protected:
    void SetUp() override { atom = make_atom("alice"); }

    TermId atom;
};

TEST_F(ApprovalTest, DepositForOther_WithoutApproval_ThrowsSenderNotApproved) {
    expect_ledger_error([&] { return ledger().deposit(BOB, CAROL, atom, DEFAULT_CURVE, 10'000, 0); },
                        ErrorCode::SenderNotApproved);
}

TEST_F(ApprovalTest, DepositForOther_WithDepositApproval_CreditsReceiverChargesSender) {
    ledger().approve(CAROL, BOB, ApprovalType::Deposit);
    const Uint256 shares = ledger().deposit(BOB, CAROL, atom, DEFAULT_CURVE, 10'000, 0);

    EXPECT_EQ(ledger().get_shares(CAROL, atom, DEFAULT_CURVE), shares);
    EXPECT_EQ(ledger().get_shares(BOB, atom, DEFAULT_CURVE), 0);
    EXPECT_EQ(custody.balance(BOB), Uint256(STARTING_FUNDS - 10'000));
    EXPECT_EQ(custody.balance(CAROL), Uint256(STARTING_FUNDS));
}

TEST_F(ApprovalTest, DepositApproval_DoesNotGrantRedemption) {
    ledger().approve(ALICE, BOB, ApprovalType::Deposit);
    expect_ledger_error([&] { return ledger().redeem(BOB, ALICE, atom, DEFAULT_CURVE, 1'000, 0); },
                        ErrorCode::SenderNotApproved);
}

TEST_F(ApprovalTest, BothApproval_RedeemsOwnerSharesToOwner) {
    ledger().approve(ALICE, BOB, ApprovalType::Both);
    const Uint256 before = custody.balance(ALICE);
    const Uint256 assets = ledger().redeem(BOB, ALICE, atom, DEFAULT_CURVE, 10'000, 0);

    EXPECT_EQ(ledger().get_shares(ALICE, atom, DEFAULT_CURVE), 970'000);
    EXPECT_EQ(custody.balance(ALICE), before + assets);
    EXPECT_EQ(custody.balance(BOB), Uint256(STARTING_FUNDS));
}

TEST_F(ApprovalTest, ApproveNone_Revokes) {
    ledger().approve(ALICE, BOB, ApprovalType::Redemption);
    EXPECT_EQ(ledger().approval(ALICE, BOB), ApprovalType::Redemption);
    ledger().approve(ALICE, BOB, ApprovalType::None);
    EXPECT_EQ(ledger().approval(ALICE, BOB), ApprovalType::None);
    expect_ledger_error([&] { return ledger().redeem(BOB, ALICE, atom, DEFAULT_CURVE, 1'000, 0); },
                        ErrorCode::SenderNotApproved);
}

TEST_F(ApprovalTest, Approval_IsDirectional) {
    ledger().approve(ALICE, BOB, ApprovalType::Both);
    EXPECT_EQ(ledger().approval(BOB, ALICE), ApprovalType::None);
}

TEST_F(ApprovalTest, ApproveSelf_ThrowsCannotApproveSelf) {
    expect_ledger_error([&] { return ledger().approve(ALICE, ALICE, ApprovalType::Both); },
                        ErrorCode::CannotApproveSelf);
}

TEST_F(ApprovalTest, Approve_EmitsEvent) {
    ledger().approve(ALICE, BOB, ApprovalType::Deposit);
    const auto* e = std::get_if<ApprovalTypeUpdated>(&ledger().events().back());
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->owner, ALICE);
    EXPECT_EQ(e->delegate, BOB);
    EXPECT_EQ(e->approval, ApprovalType::Deposit);
}

// ─── Atom wallet fees ─────────────────────────────────────────────────────────

TEST_F(ApprovalTest, ClaimWalletFees_PaysWalletAndResets) {
    const Address wallet = wallets.compute_atom_wallet_addr(atom);
    const Uint256 claimed = ledger().claim_atom_wallet_deposit_fees(wallet, atom);

    EXPECT_EQ(claimed, 10'000);
    EXPECT_EQ(custody.balance(wallet), 10'000);
    EXPECT_EQ(ledger().accumulated_atom_wallet_deposit_fees(wallet), 0);
    EXPECT_EQ(accounted_assets(), custody.held);

    custody.pushes.clear();
    EXPECT_EQ(ledger().claim_atom_wallet_deposit_fees(wallet, atom), 0);
    EXPECT_TRUE(custody.pushes.empty());
}

TEST_F(ApprovalTest, ClaimWalletFees_NotWallet_ThrowsUnauthorized) {
    expect_ledger_error([&] { return ledger().claim_atom_wallet_deposit_fees(ALICE, atom); },
                        ErrorCode::Unauthorized);
}

TEST_F(ApprovalTest, ClaimWalletFees_UnknownAtom_ThrowsAtomDoesNotExist) {
    const TermId unknown = core::MultiVault::calculate_atom_id(bytes("unknown"));
    expect_ledger_error([&] { return ledger().claim_atom_wallet_deposit_fees(
                            wallets.compute_atom_wallet_addr(unknown), unknown); },
                        ErrorCode::AtomDoesNotExist);
}
