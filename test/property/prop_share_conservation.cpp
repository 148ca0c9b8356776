/**
 * @file  prop_share_conservation.cpp
 * @brief Property: ∀ operation sequences, shares and assets are conserved
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_share_conservation
 *
 * After every call, accepted or rejected:
 *   • sum(balances) == total_shares for every vault
 *   • custody holdings == Σ vault assets + unsettled protocol fees
 *                         + unclaimed atom-wallet fees
 *   • no vault that was ever initialised drops below min_share shares
 *
 * Fee rates are multiples of 3 bps on amounts in multiples of 10 000 so that
 * the triple fraction splits across the three atoms without remainder.
 */

#include <rapidcheck.h>

#include "common/test_doubles.hpp"
#include "mvault/error.hpp"
#include "mvault/multivault.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <vector>

using namespace mvault;
using namespace mvault::test;

namespace {

const Address ADMIN    = Address::from_u64(0xAD);
const Address MULTISIG = Address::from_u64(0x5AFE);
const Address BONDING  = Address::from_u64(0xB0D);
const std::array<Address, 3> ACTORS{Address::from_u64(1), Address::from_u64(2),
                                    Address::from_u64(3)};

ConfigSnapshot make_config() {
    ConfigSnapshot cfg;
    cfg.general.admin             = ADMIN;
    cfg.general.protocol_multisig = MULTISIG;
    cfg.general.trust_bonding     = BONDING;
    cfg.general.min_deposit       = 100;
    cfg.general.min_share         = 1'000;
    cfg.atom.atom_creation_protocol_fee               = 1'000;
    cfg.atom.atom_wallet_deposit_fee                  = 100;
    cfg.triple.triple_creation_protocol_fee           = 1'000;
    cfg.triple.total_atom_deposits_on_triple_creation = 3'000;
    cfg.triple.atom_deposit_fraction_for_triple       = 900;
    cfg.vault_fees.entry_fee    = 100;
    cfg.vault_fees.exit_fee     = 100;
    cfg.vault_fees.protocol_fee = 100;
    return cfg;
}

struct Op {
    Op(std::uint8_t k, std::uint8_t a, std::uint8_t t, std::uint8_t c, std::uint32_t u)
        : kind(k), actor(a), term(t), curve(c), units(u) {}

    std::uint8_t kind;    ///< 0 deposit, 1 redeem, 2 advance epoch
    std::uint8_t actor;
    std::uint8_t term;
    std::uint8_t curve;
    std::uint32_t units;  ///< Deposit amount in 10 000s, or shares in 1 000s
};

} // anonymous namespace

int main() {
    rc::check(
        "random deposit/redeem sequences conserve shares and assets",
        []() {
            const auto ops = *rc::gen::container<std::vector<Op>>(
                rc::gen::construct<Op>(rc::gen::inRange<std::uint8_t>(0, 3),
                                       rc::gen::inRange<std::uint8_t>(0, 3),
                                       rc::gen::inRange<std::uint8_t>(0, 5),
                                       rc::gen::inRange<std::uint8_t>(1, 3),
                                       rc::gen::inRange<std::uint32_t>(1, 200)));

            curve::CurveRegistry curves;
            curves.add_curve(std::make_unique<ProRataCurve>("pro-rata"));
            curves.add_curve(std::make_unique<ProRataCurve>("alt"));
            MockWalletFactory wallets;
            MockBondingSink   sink;
            MockCustody       custody;
            for (const Address& actor : ACTORS) {
                custody.fund(actor, Uint256(1'000'000'000'000ULL));
            }

            core::MultiVault mv(make_config(), core::Collaborators{curves, wallets, sink, custody});

            std::vector<TermId> atoms;
            for (const char* name : {"s", "p", "o"}) {
                const Bytes data(name, name + 1);
                atoms.push_back(mv.create_atom(ACTORS[0], data, Uint256(1'002'000)));
            }
            const TermId triple  = mv.create_triple(ACTORS[0], atoms[0], atoms[1], atoms[2],
                                                    Uint256(1'006'000));
            const TermId counter = core::MultiVault::calculate_counter_id(triple);
            const std::array<TermId, 5> terms{atoms[0], atoms[1], atoms[2], triple, counter};

            for (const Op& op : ops) {
                const Address& actor = ACTORS[op.actor];
                const TermId&  term  = terms[op.term];
                try {
                    if (op.kind == 0) {
                        mv.deposit(actor, actor, term, op.curve,
                                   Uint256(op.units) * 10'000, 0);
                    } else if (op.kind == 1) {
                        mv.redeem(actor, actor, term, op.curve,
                                  Uint256(op.units) * 1'000, 0);
                    } else {
                        ++sink.epoch;
                    }
                } catch (const LedgerError&) {
                    // Rejections are expected; the invariants must hold either way.
                }

                Uint256 accounted = 0;
                for (const auto& [key, v] : mv.vault_store().vaults()) {
                    RC_ASSERT(mv.vault_store().holders_balance_sum(key.term, key.curve)
                              == v.total_shares);
                    RC_ASSERT(v.total_shares >= mv.config().general.min_share);
                    accounted += v.total_assets;
                }
                for (Epoch e = 0; e <= sink.epoch; ++e) {
                    accounted += mv.accumulated_protocol_fees(e);
                }
                for (const TermId& atom : atoms) {
                    accounted += mv.accumulated_atom_wallet_deposit_fees(
                        wallets.compute_atom_wallet_addr(atom));
                }
                RC_ASSERT(accounted == custody.held);
            }
        });

    return 0;
}
