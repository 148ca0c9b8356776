/**
 * @file  bench/bench_fee_engine.cpp
 * @brief Google Benchmark suite for the fee engine and the ledger hot paths.
 *
 * Benchmarks
 * ----------
 *   BM_MulDiv / BM_MulDivUp       : 512-bit intermediate arithmetic
 *   BM_FeeEngine_Deposit / Redeem : full breakdown on a populated vault
 *   BM_Identity_TripleId          : three-atom SHA-256 derivation
 *   BM_MultiVault_DepositRedeem   : committed deposit + redeem round trip
 *
 * Build (CMake):
 *   cmake -DMVAULT_BUILD_BENCH=ON ..
 *   cmake --build build --target bench_fee_engine
 *   ./build/bench_fee_engine --benchmark_format=json
 */

#include "benchmark/benchmark.h"

#include "common/test_doubles.hpp"
#include "mvault/fees.hpp"
#include "mvault/identity.hpp"
#include "mvault/multivault.hpp"

#include <memory>

using namespace mvault;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static ConfigSnapshot bench_config() {
    ConfigSnapshot cfg;
    cfg.general.admin             = Address::from_u64(0xAD);
    cfg.general.protocol_multisig = Address::from_u64(0x5AFE);
    cfg.general.trust_bonding     = Address::from_u64(0xB0D);
    cfg.general.min_share         = 1'000;
    cfg.atom.atom_creation_protocol_fee = 1'000;
    cfg.atom.atom_wallet_deposit_fee    = 100;
    cfg.vault_fees.entry_fee    = 100;
    cfg.vault_fees.exit_fee     = 100;
    cfg.vault_fees.protocol_fee = 100;
    return cfg;
}

static curve::CurveRegistry bench_curves() {
    curve::CurveRegistry curves;
    curves.add_curve(std::make_unique<test::ProRataCurve>());
    return curves;
}

// ── Arithmetic ─────────────────────────────────────────────────────────────────

static void BM_MulDiv(benchmark::State& state) {
    const Uint256 a = Uint256(1) << 200;
    const Uint256 b = Uint256(123'456'789);
    const Uint256 d = Uint256(1) << 64;
    for (auto _ : state) {
        benchmark::DoNotOptimize(fees::mul_div(a, b, d));
    }
}
BENCHMARK(BM_MulDiv);

static void BM_MulDivUp(benchmark::State& state) {
    const Uint256 a = Uint256(1) << 200;
    const Uint256 b = Uint256(123'456'789);
    const Uint256 d = Uint256(10'000);
    for (auto _ : state) {
        benchmark::DoNotOptimize(fees::mul_div_up(a, b, d));
    }
}
BENCHMARK(BM_MulDivUp);

// ── Fee engine ─────────────────────────────────────────────────────────────────

static void BM_FeeEngine_Deposit(benchmark::State& state) {
    const ConfigSnapshot cfg = bench_config();
    const auto curves = bench_curves();
    const fees::FeeEngine engine(cfg, curves);
    const VaultTotals totals{Uint256(1'000'000'000), Uint256(990'000'000)};
    const fees::FeeRequest request{fees::Direction::Deposit, Uint256(1'000'000),
                                   VaultType::Atom, 1, false};
    for (auto _ : state) {
        benchmark::DoNotOptimize(engine.compute(request, totals, false));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_FeeEngine_Deposit);

static void BM_FeeEngine_Redeem(benchmark::State& state) {
    const ConfigSnapshot cfg = bench_config();
    const auto curves = bench_curves();
    const fees::FeeEngine engine(cfg, curves);
    const VaultTotals totals{Uint256(1'000'000'000), Uint256(990'000'000)};
    const fees::FeeRequest request{fees::Direction::Redeem, Uint256(1'000'000),
                                   VaultType::Atom, 1, false};
    for (auto _ : state) {
        benchmark::DoNotOptimize(engine.compute(request, totals, false));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_FeeEngine_Redeem);

// ── Identity ───────────────────────────────────────────────────────────────────

static void BM_Identity_TripleId(benchmark::State& state) {
    const TermId s = identity::Identity::atom_id("subject");
    const TermId p = identity::Identity::atom_id("predicate");
    const TermId o = identity::Identity::atom_id("object");
    for (auto _ : state) {
        benchmark::DoNotOptimize(identity::Identity::triple_id(s, p, o));
    }
}
BENCHMARK(BM_Identity_TripleId);

// ── Ledger ─────────────────────────────────────────────────────────────────────

static void BM_MultiVault_DepositRedeem(benchmark::State& state) {
    const auto curves = bench_curves();
    test::MockWalletFactory wallets;
    test::MockBondingSink   sink;
    test::MockCustody       custody;
    const Address user = Address::from_u64(1);
    custody.fund(user, Uint256(1) << 128);

    core::MultiVault mv(bench_config(), core::Collaborators{curves, wallets, sink, custody});
    const Bytes data{'b', 'e', 'n', 'c', 'h'};
    const TermId atom = mv.create_atom(user, data, Uint256(10'000'000));

    for (auto _ : state) {
        const Uint256 shares = mv.deposit(user, user, atom, 1, Uint256(100'000), 0);
        benchmark::DoNotOptimize(mv.redeem(user, user, atom, 1, shares, 0));
    }
    state.SetItemsProcessed(state.iterations() * 2);
}
BENCHMARK(BM_MultiVault_DepositRedeem);

BENCHMARK_MAIN();
