/**
 * @file  fuzz_multivault.cpp
 * @brief libFuzzer target driving MultiVault with arbitrary call sequences
 *
 * Build:
 *   cmake -DMVAULT_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_multivault
 *
 * Run for 60 seconds:
 *   ./fuzz_multivault -max_total_time=60
 *
 * Input layout: a stream of 8-byte records
 *   [op][actor][term][curve][amount:4 LE]
 * op % 8 selects deposit, redeem, create atom, create triple, approve,
 * claim, pause toggle or epoch advance.
 *
 * Safety invariants verified after every record:
 *   1. Only LedgerError escapes a call; nothing else is thrown.
 *   2. sum(balances) == total_shares for every vault.
 *   3. Custody holdings never fall below the assets the ledger accounts for.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "common/test_doubles.hpp"
#include "mvault/error.hpp"
#include "mvault/multivault.hpp"

using namespace mvault;
using namespace mvault::test;

namespace {

const Address ADMIN = Address::from_u64(0xAD);

ConfigSnapshot fuzz_config() {
    ConfigSnapshot cfg;
    cfg.general.admin             = ADMIN;
    cfg.general.protocol_multisig = Address::from_u64(0x5AFE);
    cfg.general.trust_bonding     = Address::from_u64(0xB0D);
    cfg.general.min_deposit       = 10;
    cfg.general.min_share         = 1'000;
    cfg.atom.atom_creation_protocol_fee               = 1'000;
    cfg.atom.atom_wallet_deposit_fee                  = 50;
    cfg.triple.triple_creation_protocol_fee           = 1'000;
    cfg.triple.total_atom_deposits_on_triple_creation = 3'000;
    cfg.triple.atom_deposit_fraction_for_triple       = 300;
    cfg.vault_fees.entry_fee    = 50;
    cfg.vault_fees.exit_fee     = 50;
    cfg.vault_fees.protocol_fee = 25;
    return cfg;
}

std::uint32_t read_u32(const uint8_t* p) {
    return static_cast<std::uint32_t>(p[0])
         | static_cast<std::uint32_t>(p[1]) << 8
         | static_cast<std::uint32_t>(p[2]) << 16
         | static_cast<std::uint32_t>(p[3]) << 24;
}

} // anonymous namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    curve::CurveRegistry curves;
    curves.add_curve(std::make_unique<ProRataCurve>("pro-rata"));
    curves.add_curve(std::make_unique<ProRataCurve>("alt", Uint256(1'000'000'000'000ULL)));
    MockWalletFactory wallets;
    MockBondingSink   sink;
    MockCustody       custody;

    const std::vector<Address> actors{Address::from_u64(1), Address::from_u64(2),
                                      Address::from_u64(3), ADMIN};
    for (const Address& a : actors) {
        custody.fund(a, Uint256(1'000'000'000'000'000ULL));
    }

    core::MultiVault mv(fuzz_config(), core::Collaborators{curves, wallets, sink, custody});
    std::vector<TermId> atoms;
    std::vector<TermId> terms;

    for (size_t off = 0; off + 8 <= size; off += 8) {
        const uint8_t* rec   = data + off;
        const Address& actor = actors[rec[1] % actors.size()];
        const CurveId  curve = 1 + rec[3] % 3;  // 3 is never registered
        const Uint256  amount(read_u32(rec + 4));
        const TermId*  term  = terms.empty() ? nullptr : &terms[rec[2] % terms.size()];

        try {
            switch (rec[0] % 8) {
                case 0:
                    if (term) mv.deposit(actor, actor, *term, curve, amount, 0);
                    break;
                case 1:
                    if (term) mv.redeem(actor, actor, *term, curve, amount, 0);
                    break;
                case 2: {
                    const Bytes payload(rec + 1, rec + 8);
                    const TermId id = mv.create_atom(actor, payload, amount);
                    atoms.push_back(id);
                    terms.push_back(id);
                    break;
                }
                case 3:
                    if (atoms.size() >= 3) {
                        const TermId id = mv.create_triple(
                            actor, atoms[rec[2] % atoms.size()], atoms[rec[3] % atoms.size()],
                            atoms[rec[4] % atoms.size()], amount);
                        terms.push_back(id);
                        terms.push_back(core::MultiVault::calculate_counter_id(id));
                    }
                    break;
                case 4:
                    mv.approve(actor, actors[rec[2] % actors.size()],
                               static_cast<ApprovalType>(rec[3] % 4));
                    break;
                case 5:
                    if (!atoms.empty()) {
                        const TermId& atom = atoms[rec[2] % atoms.size()];
                        mv.claim_atom_wallet_deposit_fees(wallets.compute_atom_wallet_addr(atom),
                                                          atom);
                    }
                    break;
                case 6:
                    if (mv.is_paused()) mv.unpause(ADMIN); else mv.pause(ADMIN);
                    break;
                default:
                    sink.epoch += 1 + rec[1] % 3;
                    break;
            }
        } catch (const LedgerError&) {
            // Invariant 1: rule violations are reported, never anything else.
        }

        // Invariant 2
        Uint256 vault_assets = 0;
        for (const auto& [key, v] : mv.vault_store().vaults()) {
            assert(mv.vault_store().holders_balance_sum(key.term, key.curve) == v.total_shares);
            vault_assets += v.total_assets;
        }
        // Invariant 3 (fan-out remainders may leave dust in custody)
        assert(custody.held >= vault_assets);
    }
    return 0;
}
