/// @file src/core/term_lifecycle.cpp
/// @brief Atom and triple creation, ghost vaults and fraction fan-out.

#include "mvault/multivault.hpp"
#include "mvault/format.hpp"

#include "transaction.hpp"

#include <fmt/core.h>

#include <initializer_list>

namespace mvault::core {

namespace {

void require_same_length(std::size_t expected, std::size_t actual) {
    if (expected == 0) {
        throw LedgerError(ErrorCode::EmptyArray, "batch is empty");
    }
    if (actual != expected) {
        throw LedgerError(ErrorCode::ArraysLengthMismatch,
                          fmt::format("expected {} entries, got {}", expected, actual));
    }
}

[[nodiscard]] Uint256 sum(std::span<const Uint256> values) {
    Uint256 total = 0;
    for (const Uint256& v : values) {
        total += v;
    }
    return total;
}

} // anonymous namespace

// ─── Public entry points ──────────────────────────────────────────────────────

TermId MultiVault::create_atom(const Address& creator, std::span<const std::uint8_t> data,
                               const Uint256& assets) {
    return transact("create_atom", [&](Transaction& tx) {
        require_not_paused(tx.staged);
        roll_utilization(tx, creator);
        TermId id = create_atom_in(tx, creator, data, assets);
        add_utilization(tx, creator, Int256(assets));
        tx.charge(creator, assets);
        return id;
    });
}

std::vector<TermId> MultiVault::create_atoms(const Address& creator,
                                             std::span<const Bytes> data,
                                             std::span<const Uint256> assets) {
    return transact("create_atoms", [&](Transaction& tx) {
        require_not_paused(tx.staged);
        require_same_length(data.size(), assets.size());
        roll_utilization(tx, creator);

        std::vector<TermId> ids;
        ids.reserve(data.size());
        for (std::size_t i = 0; i < data.size(); ++i) {
            ids.push_back(create_atom_in(tx, creator, data[i], assets[i]));
        }

        const Uint256 total = sum(assets);
        add_utilization(tx, creator, Int256(total));
        tx.charge(creator, total);
        return ids;
    });
}

TermId MultiVault::create_triple(const Address& creator, const TermId& subject,
                                 const TermId& predicate, const TermId& object,
                                 const Uint256& assets) {
    return transact("create_triple", [&](Transaction& tx) {
        require_not_paused(tx.staged);
        roll_utilization(tx, creator);
        TermId id = create_triple_in(tx, creator, subject, predicate, object, assets);
        add_utilization(tx, creator, Int256(assets));
        tx.charge(creator, assets);
        return id;
    });
}

std::vector<TermId> MultiVault::create_triples(const Address& creator,
                                               std::span<const TermId> subjects,
                                               std::span<const TermId> predicates,
                                               std::span<const TermId> objects,
                                               std::span<const Uint256> assets) {
    return transact("create_triples", [&](Transaction& tx) {
        require_not_paused(tx.staged);
        require_same_length(subjects.size(), predicates.size());
        require_same_length(subjects.size(), objects.size());
        require_same_length(subjects.size(), assets.size());
        roll_utilization(tx, creator);

        std::vector<TermId> ids;
        ids.reserve(subjects.size());
        for (std::size_t i = 0; i < subjects.size(); ++i) {
            ids.push_back(create_triple_in(tx, creator, subjects[i], predicates[i],
                                           objects[i], assets[i]));
        }

        const Uint256 total = sum(assets);
        add_utilization(tx, creator, Int256(total));
        tx.charge(creator, total);
        return ids;
    });
}

// ─── Creation ─────────────────────────────────────────────────────────────────

TermId MultiVault::create_atom_in(Transaction& tx, const Address& creator,
                                  std::span<const std::uint8_t> data, const Uint256& assets) {
    State& s = tx.staged;
    const ConfigSnapshot& cfg = s.config;

    if (data.size() > cfg.general.atom_data_max_length) {
        throw LedgerError(ErrorCode::AtomDataTooLong,
                          fmt::format("{} bytes exceeds the {} byte limit",
                                      data.size(), cfg.general.atom_data_max_length));
    }
    const Uint256 cost = cfg.atom_cost();
    if (assets < cost) {
        throw LedgerError(ErrorCode::InsufficientAssetsForCreation,
                          fmt::format("{} is below the atom cost {}", assets, cost));
    }

    const TermId id = identity::Identity::atom_id(data);
    if (s.atom_data.contains(id)) {
        throw LedgerError(ErrorCode::AtomExists, fmt::format("atom {}", id));
    }

    s.atom_data.emplace(id, Bytes(data.begin(), data.end()));
    ++s.total_terms;

    accrue_protocol_fee(tx, creator, cfg.atom.atom_creation_protocol_fee);
    tx.emit(AtomCreated{
        .creator     = creator,
        .term        = id,
        .data        = Bytes(data.begin(), data.end()),
        .atom_wallet = wallets_.compute_atom_wallet_addr(id),
    });

    creation_deposit(tx, creator, id, VaultType::Atom, assets - cost);
    return id;
}

TermId MultiVault::create_triple_in(Transaction& tx, const Address& creator,
                                    const TermId& subject, const TermId& predicate,
                                    const TermId& object, const Uint256& assets) {
    State& s = tx.staged;
    const ConfigSnapshot& cfg = s.config;

    for (const TermId* atom : {&subject, &predicate, &object}) {
        if (!s.atom_data.contains(*atom)) {
            throw LedgerError(ErrorCode::AtomDoesNotExist, fmt::format("atom {}", *atom));
        }
    }
    const Uint256 cost = cfg.triple_cost();
    if (assets < cost) {
        throw LedgerError(ErrorCode::InsufficientAssetsForCreation,
                          fmt::format("{} is below the triple cost {}", assets, cost));
    }

    const TermId id = identity::Identity::triple_id(subject, predicate, object);
    if (s.triples.contains(id)) {
        throw LedgerError(ErrorCode::TripleExists, fmt::format("triple {}", id));
    }
    const TermId counter = identity::Identity::counter_id(id);

    s.triples.emplace(id, TripleAtoms{subject, predicate, object});
    s.counter_to_triple.emplace(counter, id);
    ++s.total_terms;

    accrue_protocol_fee(tx, creator, cfg.triple.triple_creation_protocol_fee);
    tx.emit(TripleCreated{
        .creator   = creator,
        .term      = id,
        .subject   = subject,
        .predicate = predicate,
        .object    = object,
        .counter   = counter,
    });

    creation_deposit(tx, creator, id, VaultType::Triple, assets - cost);
    open_ghost_vault(tx, counter, cfg.bonding_curve.default_curve_id, VaultType::CounterTriple);

    // Static deposit: assets only, no shares minted, dust stays uncredited.
    const Uint256 per_atom = cfg.triple.total_atom_deposits_on_triple_creation
                           / Uint256(constants::TRIPLE_ARITY);
    if (per_atom != 0) {
        for (const TermId& atom : {subject, predicate, object}) {
            bump_assets(tx, atom, cfg.bonding_curve.default_curve_id, per_atom);
        }
    }
    return id;
}

void MultiVault::creation_deposit(Transaction& tx, const Address& receiver,
                                  const TermId& term, VaultType type, const Uint256& assets) {
    State& s = tx.staged;
    const Uint256& min_share = s.config.general.min_share;
    const CurveId  curve     = s.config.bonding_curve.default_curve_id;

    const VaultTotals before{0, 0};
    const auto breakdown = tx.fee_engine(curves_).compute(
        fees::FeeRequest{
            .direction  = fees::Direction::Deposit,
            .amount     = assets,
            .vault_type = type,
            .curve      = curve,
        },
        before, false);

    const VaultTotals after{breakdown.assets_delta + min_share, breakdown.shares + min_share};
    if (after.total_assets > curves_.max_assets(curve)) {
        throw LedgerError(ErrorCode::ExceedsCurveMaxAssets,
                          fmt::format("{} exceeds curve {} max assets", after.total_assets, curve));
    }

    const auto signal = s.vaults.set_totals(term, curve, after.total_assets,
                                            after.total_shares, curves_);
    s.vaults.mint(receiver, term, curve, breakdown.shares);
    s.vaults.mint(s.config.general.admin, term, curve, min_share);

    emit_price(tx, signal, type);
    tx.emit(Deposited{
        .sender     = receiver,
        .receiver   = receiver,
        .term       = term,
        .curve      = curve,
        .vault_type = type,
        .before     = before,
        .after      = after,
        .fees       = breakdown,
    });

    apply_deposit_fees(tx, receiver, receiver, term, curve, breakdown);
}

void MultiVault::open_ghost_vault(Transaction& tx, const TermId& term, CurveId curve,
                                  VaultType type) {
    State& s = tx.staged;
    const Uint256& min_share = s.config.general.min_share;

    // Assets already bumped into a share-less vault stay in its totals.
    const VaultTotals totals = s.vaults.totals_or_empty(term, curve);
    const auto signal = s.vaults.set_totals(term, curve, totals.total_assets + min_share,
                                            totals.total_shares + min_share, curves_);
    s.vaults.mint(s.config.general.admin, term, curve, min_share);
    emit_price(tx, signal, type);
}

void MultiVault::bump_assets(Transaction& tx, const TermId& term, CurveId curve,
                             const Uint256& amount) {
    State& s = tx.staged;
    const VaultTotals totals = s.vaults.totals_or_empty(term, curve);
    const auto signal = s.vaults.set_totals(term, curve, totals.total_assets + amount,
                                            totals.total_shares, curves_);
    emit_price(tx, signal, type_in(s, term).value_or(VaultType::Atom));
}

void MultiVault::fan_out_fraction(Transaction& tx, const Address& sender,
                                  const Address& receiver, const TermId& term,
                                  const Uint256& fraction) {
    State& s = tx.staged;

    TermId triple = term;
    if (auto it = s.counter_to_triple.find(term); it != s.counter_to_triple.end()) {
        triple = it->second;
    }
    const TripleAtoms atoms = s.triples.at(triple);

    const CurveId curve = s.config.bonding_curve.default_curve_id;
    const Uint256 per_atom = fraction / Uint256(constants::TRIPLE_ARITY);
    if (per_atom == 0) {
        return;
    }

    for (const TermId& atom : atoms) {
        const VaultTotals before = s.vaults.totals_or_empty(atom, curve);
        const auto breakdown = tx.fee_engine(curves_).compute(
            fees::FeeRequest{
                .direction           = fees::Direction::Deposit,
                .amount              = per_atom,
                .vault_type          = VaultType::Atom,
                .curve               = curve,
                .underlying_atom_leg = true,
            },
            before, false);

        const VaultTotals after{before.total_assets + breakdown.assets_delta,
                                before.total_shares + breakdown.shares};
        const auto signal = s.vaults.set_totals(atom, curve, after.total_assets,
                                                after.total_shares, curves_);
        s.vaults.mint(receiver, atom, curve, breakdown.shares);

        emit_price(tx, signal, VaultType::Atom);
        tx.emit(Deposited{
            .sender     = sender,
            .receiver   = receiver,
            .term       = atom,
            .curve      = curve,
            .vault_type = VaultType::Atom,
            .before     = before,
            .after      = after,
            .fees       = breakdown,
        });
    }
}

} // namespace mvault::core
