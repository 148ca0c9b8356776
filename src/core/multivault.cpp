/// @file src/core/multivault.cpp
/// @brief MultiVault construction, commit, admin calls and views.

#include "mvault/multivault.hpp"
#include "mvault/format.hpp"

#include "transaction.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <utility>

namespace mvault::core {

// ─── Construction ─────────────────────────────────────────────────────────────

MultiVault::MultiVault(ConfigSnapshot config, Collaborators collaborators)
    : curves_(collaborators.curves)
    , wallets_(collaborators.wallets)
    , sink_(collaborators.sink)
    , custody_(collaborators.custody) {
    if (auto problem = validate_config(config)) {
        throw LedgerError(ErrorCode::InvalidConfig, *problem);
    }
    if (!curves_.is_valid(config.bonding_curve.default_curve_id)) {
        throw LedgerError(ErrorCode::InvalidConfig,
                          fmt::format("default curve {} is not registered",
                                      config.bonding_curve.default_curve_id));
    }
    state_.config = std::move(config);
}

// ─── Commit ───────────────────────────────────────────────────────────────────

void MultiVault::commit(Transaction& tx, std::string_view operation) {
    if (tx.pull_amount != 0 && !custody_.pull(tx.payer, tx.pull_amount)) {
        throw LedgerError(ErrorCode::InsufficientFunds,
                          fmt::format("{} cannot cover {}", tx.payer, tx.pull_amount));
    }

    state_ = std::move(tx.staged);
    events_.insert(events_.end(), tx.events.begin(), tx.events.end());
    detail::log_line(state_.config.verbose, "{} committed: epoch={} events={} pulled={}",
                     operation, tx.epoch, tx.events.size(), tx.pull_amount);

    for (const Outbound& call : tx.outbound) {
        if (const auto* payout = std::get_if<Payout>(&call)) {
            custody_.push(payout->to, payout->amount);
        } else {
            const auto& notice = std::get<ClaimableNotice>(call);
            sink_.set_max_claimable_protocol_fees(notice.epoch, notice.amount);
        }
    }

    publish(tx.events);
}

void MultiVault::publish(const std::vector<Event>& events) {
    for (const Event& event : events) {
        for (const EventHandler& handler : handlers_) {
            handler(event);
        }
    }
}

void MultiVault::subscribe(EventHandler handler) {
    if (handler) {
        handlers_.push_back(std::move(handler));
    }
}

// ─── Checks ───────────────────────────────────────────────────────────────────

void MultiVault::require_not_paused(const State& state) const {
    if (state.paused) {
        throw LedgerError(ErrorCode::Paused, "ledger is paused");
    }
}

void MultiVault::require_admin(const State& state, const Address& caller) const {
    if (caller != state.config.general.admin) {
        throw LedgerError(ErrorCode::Unauthorized,
                          fmt::format("{} is not the admin", caller));
    }
}

VaultType MultiVault::require_term(const State& state, const TermId& id) const {
    auto type = type_in(state, id);
    if (!type) {
        throw LedgerError(ErrorCode::TermDoesNotExist, fmt::format("term {}", id));
    }
    return *type;
}

void MultiVault::require_curve(CurveId curve) const {
    if (!curves_.is_valid(curve)) {
        throw LedgerError(ErrorCode::InvalidCurveId, fmt::format("curve {}", curve));
    }
}

void MultiVault::require_approval(const State& state, const Address& owner,
                                  const Address& delegate, ApprovalType needed) const {
    if (owner == delegate) {
        return;
    }
    auto it = state.approvals.find(std::make_pair(owner, delegate));
    const ApprovalType granted = it == state.approvals.end() ? ApprovalType::None : it->second;
    if (!allows(granted, needed)) {
        throw LedgerError(ErrorCode::SenderNotApproved,
                          fmt::format("{} has not granted {} {} approval",
                                      owner, delegate, needed));
    }
}

std::optional<VaultType> MultiVault::type_in(const State& state, const TermId& id) {
    if (state.atom_data.contains(id)) {
        return VaultType::Atom;
    }
    if (state.triples.contains(id)) {
        return VaultType::Triple;
    }
    if (state.counter_to_triple.contains(id)) {
        return VaultType::CounterTriple;
    }
    return std::nullopt;
}

std::optional<TermId> MultiVault::mirror_of(const State& state, const TermId& id) {
    if (state.triples.contains(id)) {
        return identity::Identity::counter_id(id);
    }
    auto it = state.counter_to_triple.find(id);
    if (it != state.counter_to_triple.end()) {
        return it->second;
    }
    return std::nullopt;
}

Uint256 MultiVault::ghost_cost(const State& state, const TermId& term,
                               CurveId curve, VaultType type) const {
    const Uint256& min_share = state.config.general.min_share;
    Uint256 cost = 0;
    if (!state.vaults.exists(term, curve)) {
        cost += min_share;
    }
    if (type != VaultType::Atom) {
        auto mirror = mirror_of(state, term);
        if (mirror && !state.vaults.exists(*mirror, curve)) {
            cost += min_share;
        }
    }
    return cost;
}

void MultiVault::emit_price(Transaction& tx, const vault::PriceSignal& signal, VaultType type) {
    tx.emit(SharePriceChanged{
        .term         = signal.term,
        .curve        = signal.curve,
        .vault_type   = type,
        .share_price  = signal.share_price,
        .total_assets = signal.total_assets,
        .total_shares = signal.total_shares,
    });
}

// ─── Accounts & admin ─────────────────────────────────────────────────────────

void MultiVault::approve(const Address& owner, const Address& delegate,
                         ApprovalType approval) {
    transact("approve", [&](Transaction& tx) {
        if (owner == delegate) {
            throw LedgerError(ErrorCode::CannotApproveSelf,
                              fmt::format("{} cannot approve itself", owner));
        }
        if (approval == ApprovalType::None) {
            tx.staged.approvals.erase(std::make_pair(owner, delegate));
        } else {
            tx.staged.approvals[std::make_pair(owner, delegate)] = approval;
        }
        tx.emit(ApprovalTypeUpdated{owner, delegate, approval});
    });
}

Uint256 MultiVault::claim_atom_wallet_deposit_fees(const Address& caller, const TermId& atom) {
    return transact("claim_atom_wallet_deposit_fees", [&](Transaction& tx) {
        if (!tx.staged.atom_data.contains(atom)) {
            throw LedgerError(ErrorCode::AtomDoesNotExist, fmt::format("atom {}", atom));
        }
        const Address wallet = wallets_.compute_atom_wallet_addr(atom);
        if (caller != wallet) {
            throw LedgerError(ErrorCode::Unauthorized,
                              fmt::format("{} is not the wallet of {}", caller, atom));
        }

        Uint256 amount = 0;
        auto it = tx.staged.atom_wallet_fees.find(wallet);
        if (it != tx.staged.atom_wallet_fees.end()) {
            amount = it->second;
            tx.staged.atom_wallet_fees.erase(it);
        }

        tx.pay(wallet, amount);
        tx.emit(AtomWalletDepositFeesClaimed{atom, wallet, amount});
        return amount;
    });
}

void MultiVault::pause(const Address& caller) {
    transact("pause", [&](Transaction& tx) {
        require_admin(tx.staged, caller);
        tx.staged.paused = true;
        tx.emit(PausedChanged{true, caller});
    });
}

void MultiVault::unpause(const Address& caller) {
    transact("unpause", [&](Transaction& tx) {
        require_admin(tx.staged, caller);
        tx.staged.paused = false;
        tx.emit(PausedChanged{false, caller});
    });
}

void MultiVault::sync_config(const Address& caller, const ConfigSource& source) {
    transact("sync_config", [&](Transaction& tx) {
        require_admin(tx.staged, caller);

        ConfigSnapshot next = source.snapshot();
        if (auto problem = validate_config(next)) {
            throw LedgerError(ErrorCode::InvalidConfig, *problem);
        }
        if (!curves_.is_valid(next.bonding_curve.default_curve_id)) {
            throw LedgerError(ErrorCode::InvalidConfig,
                              fmt::format("default curve {} is not registered",
                                          next.bonding_curve.default_curve_id));
        }
        const std::uint64_t current = tx.staged.config.version;
        if (next.version <= current) {
            throw LedgerError(ErrorCode::StaleConfigVersion,
                              fmt::format("version {} is not newer than {}",
                                          next.version, current));
        }

        tx.staged.config = std::move(next);
        tx.emit(ConfigSynced{current, tx.staged.config.version});
    });
}

void MultiVault::transfer_shares(const Address& from, const Address& to,
                                 const TermId& term, CurveId curve,
                                 const Uint256& shares) {
    throw LedgerError(ErrorCode::TransfersDisabled,
                      fmt::format("{} -> {}: {} shares of {}/{}", from, to, shares, term, curve));
}

// ─── Cost & fee views ─────────────────────────────────────────────────────────

Uint256 MultiVault::atom_cost() const {
    return state_.config.atom_cost();
}

Uint256 MultiVault::triple_cost() const {
    return state_.config.triple_cost();
}

CreatePreview MultiVault::preview_create(const Uint256& assets, const Uint256& cost,
                                         VaultType type) const {
    if (assets < cost) {
        throw LedgerError(ErrorCode::InsufficientAssetsForCreation,
                          fmt::format("{} is below the creation cost {}", assets, cost));
    }
    const fees::FeeEngine engine(state_.config, curves_);
    const auto breakdown = engine.compute(
        fees::FeeRequest{
            .direction  = fees::Direction::Deposit,
            .amount     = assets - cost,
            .vault_type = type,
            .curve      = state_.config.bonding_curve.default_curve_id,
        },
        VaultTotals{0, 0}, false);

    return CreatePreview{
        .shares                  = breakdown.shares,
        .assets_after_fixed_fees = assets - cost,
        .assets_after_fees       = breakdown.assets_for_receiver,
    };
}

CreatePreview MultiVault::preview_atom_create(const Uint256& assets) const {
    return preview_create(assets, atom_cost(), VaultType::Atom);
}

CreatePreview MultiVault::preview_triple_create(const Uint256& assets) const {
    return preview_create(assets, triple_cost(), VaultType::Triple);
}

DepositPreview MultiVault::preview_deposit(const TermId& term, CurveId curve,
                                           const Uint256& assets) const {
    const VaultType type = require_term(state_, term);
    require_curve(curve);

    const Uint256 ghost = ghost_cost(state_, term, curve, type);
    VaultTotals totals = state_.vaults.totals_or_empty(term, curve);
    if (ghost != 0) {
        if (assets <= ghost) {
            throw LedgerError(ErrorCode::DepositTooSmallForGhostShares,
                              fmt::format("{} does not cover ghost cost {}", assets, ghost));
        }
        if (!state_.vaults.exists(term, curve)) {
            const Uint256& min_share = state_.config.general.min_share;
            totals = VaultTotals{totals.total_assets + min_share, totals.total_shares + min_share};
        }
    }

    const fees::FeeEngine engine(state_.config, curves_);
    const auto breakdown = engine.compute(
        fees::FeeRequest{
            .direction  = fees::Direction::Deposit,
            .amount     = assets - ghost,
            .vault_type = type,
            .curve      = curve,
        },
        totals, false);
    return DepositPreview{breakdown.shares, breakdown.assets_for_receiver};
}

RedeemPreview MultiVault::preview_redeem(const TermId& term, CurveId curve,
                                         const Uint256& shares) const {
    const VaultType type = require_term(state_, term);
    require_curve(curve);

    const fees::FeeEngine engine(state_.config, curves_);
    const auto breakdown = engine.compute(
        fees::FeeRequest{
            .direction  = fees::Direction::Redeem,
            .amount     = shares,
            .vault_type = type,
            .curve      = curve,
        },
        state_.vaults.totals_or_empty(term, curve), state_.paused);
    return RedeemPreview{breakdown.assets_for_receiver, shares};
}

Uint256 MultiVault::entry_fee_amount(const Uint256& assets) const {
    return fees::FeeEngine(state_.config, curves_).entry_fee_amount(assets);
}

Uint256 MultiVault::exit_fee_amount(const Uint256& assets) const {
    return fees::FeeEngine(state_.config, curves_).exit_fee_amount(assets);
}

Uint256 MultiVault::protocol_fee_amount(const Uint256& assets) const {
    return fees::FeeEngine(state_.config, curves_).protocol_fee_amount(assets);
}

Uint256 MultiVault::atom_wallet_deposit_fee_amount(const Uint256& assets) const {
    return fees::FeeEngine(state_.config, curves_).atom_wallet_deposit_fee_amount(assets);
}

Uint256 MultiVault::atom_deposit_fraction_amount(const Uint256& assets) const {
    return fees::FeeEngine(state_.config, curves_).atom_deposit_fraction_amount(assets);
}

// ─── Vault views ──────────────────────────────────────────────────────────────

Uint256 MultiVault::get_shares(const Address& account, const TermId& term,
                               CurveId curve) const {
    return state_.vaults.balance_of(account, term, curve);
}

Uint256 MultiVault::max_redeem(const Address& account, const TermId& term,
                               CurveId curve) const {
    const Uint256 balance = state_.vaults.balance_of(account, term, curve);
    const VaultTotals totals = state_.vaults.totals_or_empty(term, curve);
    const Uint256& min_share = state_.config.general.min_share;
    if (totals.total_shares <= min_share) {
        return 0;
    }
    return std::min(balance, Uint256(totals.total_shares - min_share));
}

VaultTotals MultiVault::vault(const TermId& term, CurveId curve) const {
    return state_.vaults.totals_or_empty(term, curve);
}

Uint256 MultiVault::current_share_price(const TermId& term, CurveId curve) const {
    require_curve(curve);
    return vault::VaultStore::share_price(state_.vaults.totals_or_empty(term, curve),
                                          curve, curves_);
}

Uint256 MultiVault::convert_to_shares(const TermId& term, CurveId curve,
                                      const Uint256& assets) const {
    return curves_.convert_to_shares(curve, assets, state_.vaults.totals_or_empty(term, curve));
}

Uint256 MultiVault::convert_to_assets(const TermId& term, CurveId curve,
                                      const Uint256& shares) const {
    return curves_.convert_to_assets(curve, shares, state_.vaults.totals_or_empty(term, curve));
}

// ─── Term views ───────────────────────────────────────────────────────────────

bool MultiVault::is_term_created(const TermId& id) const {
    return type_in(state_, id).has_value();
}

bool MultiVault::is_atom(const TermId& id) const {
    return state_.atom_data.contains(id);
}

bool MultiVault::is_triple(const TermId& id) const {
    return state_.triples.contains(id) || state_.counter_to_triple.contains(id);
}

bool MultiVault::is_counter_triple(const TermId& id) const {
    return state_.counter_to_triple.contains(id);
}

std::optional<VaultType> MultiVault::vault_type(const TermId& id) const {
    return type_in(state_, id);
}

std::optional<Bytes> MultiVault::atom_data(const TermId& id) const {
    auto it = state_.atom_data.find(id);
    if (it == state_.atom_data.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<TripleAtoms> MultiVault::triple_atoms(const TermId& id) const {
    TermId triple = id;
    if (auto counter = state_.counter_to_triple.find(id);
        counter != state_.counter_to_triple.end()) {
        triple = counter->second;
    }
    auto it = state_.triples.find(triple);
    if (it == state_.triples.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<TermId> MultiVault::triple_of_counter(const TermId& counter) const {
    auto it = state_.counter_to_triple.find(counter);
    if (it == state_.counter_to_triple.end()) {
        return std::nullopt;
    }
    return it->second;
}

TermId MultiVault::calculate_atom_id(std::span<const std::uint8_t> data) {
    return identity::Identity::atom_id(data);
}

TermId MultiVault::calculate_triple_id(const TermId& subject, const TermId& predicate,
                                       const TermId& object) {
    return identity::Identity::triple_id(subject, predicate, object);
}

TermId MultiVault::calculate_counter_id(const TermId& triple) {
    return identity::Identity::counter_id(triple);
}

// ─── Account & protocol views ─────────────────────────────────────────────────

ApprovalType MultiVault::approval(const Address& owner, const Address& delegate) const {
    auto it = state_.approvals.find(std::make_pair(owner, delegate));
    return it == state_.approvals.end() ? ApprovalType::None : it->second;
}

Uint256 MultiVault::accumulated_protocol_fees(Epoch epoch) const {
    auto it = state_.protocol_fees.find(epoch);
    return it == state_.protocol_fees.end() ? Uint256(0) : it->second;
}

Uint256 MultiVault::accumulated_atom_wallet_deposit_fees(const Address& wallet) const {
    auto it = state_.atom_wallet_fees.find(wallet);
    return it == state_.atom_wallet_fees.end() ? Uint256(0) : it->second;
}

Int256 MultiVault::total_utilization(Epoch epoch) const {
    return state_.utilization.total_utilization(epoch);
}

Int256 MultiVault::user_utilization(const Address& account, Epoch epoch) const {
    return state_.utilization.user_utilization(account, epoch);
}

std::optional<Epoch> MultiVault::last_active_epoch(const Address& account) const {
    return state_.utilization.last_active_epoch(account);
}

} // namespace mvault::core
