#include <gtest/gtest.h>
#include "common/ledger_fixture.hpp"

#include <string>
#include <vector>

using namespace mvault;
using namespace mvault::test;

class EventsTest : public LedgerFixture {};

static std::vector<std::string> names_of(const std::vector<Event>& events) {
    std::vector<std::string> names;
    for (const Event& e : events) {
        names.emplace_back(event_name(e));
    }
    return names;
}

TEST_F(EventsTest, CreateAtom_EmitsInOrder) {
    make_atom("alice");
    const std::vector<std::string> expected{
        "ProtocolFeeAccrued",
        "AtomCreated",
        "SharePriceChanged",
        "Deposited",
        "ProtocolFeeAccrued",
        "AtomWalletDepositFeeCollected",
        "UtilizationUpdated",
    };
    EXPECT_EQ(names_of(ledger().events()), expected);
}

TEST_F(EventsTest, AtomCreated_CarriesWalletAddress) {
    const TermId atom = make_atom("alice");
    const AtomCreated* created = nullptr;
    for (const Event& e : ledger().events()) {
        if (const auto* c = std::get_if<AtomCreated>(&e)) {
            created = c;
        }
    }
    ASSERT_NE(created, nullptr);
    EXPECT_EQ(created->term, atom);
    EXPECT_EQ(created->creator, ALICE);
    EXPECT_EQ(created->atom_wallet, wallets.compute_atom_wallet_addr(atom));
    EXPECT_EQ(created->data, bytes("alice"));
}

TEST_F(EventsTest, Subscribers_ReceiveEveryCommittedEvent) {
    std::size_t received = 0;
    ledger().subscribe([&received](const Event&) { ++received; });
    make_atom("alice");
    EXPECT_EQ(received, ledger().events().size());
}

TEST_F(EventsTest, RejectedCall_PublishesNothing) {
    std::size_t received = 0;
    ledger().subscribe([&received](const Event&) { ++received; });
    const Bytes data = bytes("too-cheap");
    expect_ledger_error([&] { return ledger().create_atom(ALICE, data, Uint256(1)); },
                        ErrorCode::InsufficientAssetsForCreation);
    EXPECT_EQ(received, 0u);
}

TEST_F(EventsTest, ToString_PrefixesEventName) {
    make_atom("alice");
    for (const Event& e : ledger().events()) {
        const std::string line = to_string(e);
        EXPECT_EQ(line.rfind(std::string(event_name(e)), 0), 0u) << line;
    }
}

TEST_F(EventsTest, ToString_RendersPauseAndAmounts) {
    ledger().pause(ADMIN);
    const std::string line = to_string(ledger().events().back());
    EXPECT_NE(line.find("paused=true"), std::string::npos) << line;
    EXPECT_NE(line.find(ADMIN.to_hex()), std::string::npos) << line;
}

TEST(ErrorCodes, EveryCodeHasNameAndKind) {
    EXPECT_EQ(to_string(ErrorCode::AtomExists), "AtomExists");
    EXPECT_EQ(error_kind(ErrorCode::AtomExists), ErrorKind::IdentityConflict);
    EXPECT_EQ(error_kind(ErrorCode::InvalidCurveId), ErrorKind::ReferentialIntegrity);
    EXPECT_EQ(error_kind(ErrorCode::SlippageExceeded), ErrorKind::EconomicValidity);
    EXPECT_EQ(error_kind(ErrorCode::Reentrancy), ErrorKind::PolicyViolation);
    EXPECT_EQ(error_kind(ErrorCode::EmptyArray), ErrorKind::StructuralValidation);

    const LedgerError err(ErrorCode::Paused, "detail");
    EXPECT_EQ(err.kind(), ErrorKind::PolicyViolation);
    EXPECT_NE(std::string(err.what()).find("detail"), std::string::npos);
}
