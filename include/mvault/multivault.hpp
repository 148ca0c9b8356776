#pragma once

/// @file include/mvault/multivault.hpp
/// @brief Ledger entry points: term creation, deposits, redemptions, views.
///
/// # Module: MultiVault
///
/// ## Responsibility
/// Compose identity, vault store, fee engine and utilization ledger into
/// the public surface of the ledger:
///   create_atom(s) / create_triple(s) → deposit / redeem (+ batches)
///   → approvals, atom-wallet fee claims, pause, config sync → views
///
/// ## Usage
/// ```cpp
/// curve::CurveRegistry curves;
/// curves.add_curve(std::make_unique<MyProRataCurve>());
/// core::MultiVault mv(config, {curves, wallets, sink, custody});
/// auto atom   = mv.create_atom(alice, data, mv.atom_cost() + 1'000'000);
/// auto shares = mv.deposit(bob, bob, atom, 1, 500'000, 0);
/// ```
///
/// ## Guarantees
/// - All-or-nothing: a call that throws leaves no trace (state, events,
///   pulls or pushes)
/// - Non-reentrant: a call made while another is in flight, including from
///   a collaborator callback, throws `LedgerError(Reentrancy)`
/// - Value leaves the ledger (custody pushes, sink notifications) only after
///   the call's state is committed
/// - `sum(balances) == total_shares` for every vault after every call
/// - Every initialised vault keeps `total_shares >= min_share`
///
/// ## NOT Responsible For
/// - Curve math, wallet derivation, epoch clocking or asset custody
///   (see collaborators.hpp and curve.hpp)

#include "mvault/collaborators.hpp"
#include "mvault/config.hpp"
#include "mvault/curve.hpp"
#include "mvault/events.hpp"
#include "mvault/fees.hpp"
#include "mvault/identity.hpp"
#include "mvault/types.hpp"
#include "mvault/utilization.hpp"
#include "mvault/vault_store.hpp"

#include <array>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace mvault::core {

// ─── Collaborators ────────────────────────────────────────────────────────────

/// External services wired into a MultiVault. All must outlive it.
struct Collaborators {
    const curve::CurveRegistry& curves;
    const WalletFactory&        wallets;
    BondingSink&                sink;
    AssetCustody&               custody;
};

// ─── Previews ─────────────────────────────────────────────────────────────────

struct CreatePreview {
    Uint256 shares;                   ///< Shares the creator would receive
    Uint256 assets_after_fixed_fees;  ///< Assets left after the static creation cost
    Uint256 assets_after_fees;        ///< Assets priced into shares
};

struct DepositPreview {
    Uint256 shares;
    Uint256 assets_after_fees;
};

struct RedeemPreview {
    Uint256 assets_after_fees;
    Uint256 shares_used;
};

using TripleAtoms = std::array<TermId, 3>;

// ─── MultiVault ───────────────────────────────────────────────────────────────

class MultiVault {
public:
    using EventHandler = std::function<void(const Event&)>;

    /// Throws `LedgerError(InvalidConfig)` if `config` fails validation or
    /// names an unregistered default curve.
    MultiVault(ConfigSnapshot config, Collaborators collaborators);

    MultiVault(const MultiVault&)            = delete;
    MultiVault& operator=(const MultiVault&) = delete;

    // ─── Term creation ────────────────────────────────────────────────────────

    /// Create an atom, paying `assets` (at least `atom_cost()`) from `creator`.
    TermId create_atom(const Address& creator, std::span<const std::uint8_t> data,
                       const Uint256& assets);

    /// Create several atoms with one aggregate pull.
    std::vector<TermId> create_atoms(const Address& creator,
                                     std::span<const Bytes> data,
                                     std::span<const Uint256> assets);

    /// Create the triple (subject, predicate, object) and its counter vault,
    /// paying `assets` (at least `triple_cost()`) from `creator`.
    TermId create_triple(const Address& creator, const TermId& subject,
                         const TermId& predicate, const TermId& object,
                         const Uint256& assets);

    std::vector<TermId> create_triples(const Address& creator,
                                       std::span<const TermId> subjects,
                                       std::span<const TermId> predicates,
                                       std::span<const TermId> objects,
                                       std::span<const Uint256> assets);

    // ─── Deposit / redeem ─────────────────────────────────────────────────────

    /// Deposit `assets` paid by `sender`; shares go to `receiver`.
    /// @return Shares minted to `receiver`.
    Uint256 deposit(const Address& sender, const Address& receiver,
                    const TermId& term, CurveId curve,
                    const Uint256& assets, const Uint256& min_shares);

    std::vector<Uint256> deposit_batch(const Address& sender, const Address& receiver,
                                       std::span<const TermId> terms,
                                       std::span<const CurveId> curves,
                                       std::span<const Uint256> assets,
                                       std::span<const Uint256> min_shares);

    /// Burn `shares` held by `receiver` and pay the proceeds to `receiver`.
    /// @return Assets paid out.
    Uint256 redeem(const Address& sender, const Address& receiver,
                   const TermId& term, CurveId curve,
                   const Uint256& shares, const Uint256& min_assets);

    std::vector<Uint256> redeem_batch(const Address& sender, const Address& receiver,
                                      std::span<const TermId> terms,
                                      std::span<const CurveId> curves,
                                      std::span<const Uint256> shares,
                                      std::span<const Uint256> min_assets);

    // ─── Accounts & admin ─────────────────────────────────────────────────────

    /// Set what `delegate` may do on behalf of `owner` (`None` revokes).
    void approve(const Address& owner, const Address& delegate, ApprovalType approval);

    /// Pay the atom wallet its accumulated deposit fees. `caller` must be
    /// the wallet derived for `atom`. @return Amount paid.
    Uint256 claim_atom_wallet_deposit_fees(const Address& caller, const TermId& atom);

    void pause(const Address& caller);
    void unpause(const Address& caller);

    /// Replace the configuration with a strictly newer, valid snapshot.
    void sync_config(const Address& caller, const ConfigSource& source);

    /// Share transfers are disabled; always throws `TransfersDisabled`.
    [[noreturn]] void transfer_shares(const Address& from, const Address& to,
                                      const TermId& term, CurveId curve,
                                      const Uint256& shares);

    /// Register a callback invoked for every committed event, in order.
    void subscribe(EventHandler handler);

    // ─── Cost & fee views ─────────────────────────────────────────────────────

    [[nodiscard]] Uint256 atom_cost() const;
    [[nodiscard]] Uint256 triple_cost() const;

    [[nodiscard]] CreatePreview  preview_atom_create(const Uint256& assets) const;
    [[nodiscard]] CreatePreview  preview_triple_create(const Uint256& assets) const;
    [[nodiscard]] DepositPreview preview_deposit(const TermId& term, CurveId curve,
                                                 const Uint256& assets) const;
    [[nodiscard]] RedeemPreview  preview_redeem(const TermId& term, CurveId curve,
                                                const Uint256& shares) const;

    [[nodiscard]] Uint256 entry_fee_amount(const Uint256& assets) const;
    [[nodiscard]] Uint256 exit_fee_amount(const Uint256& assets) const;
    [[nodiscard]] Uint256 protocol_fee_amount(const Uint256& assets) const;
    [[nodiscard]] Uint256 atom_wallet_deposit_fee_amount(const Uint256& assets) const;
    [[nodiscard]] Uint256 atom_deposit_fraction_amount(const Uint256& assets) const;

    // ─── Vault views ──────────────────────────────────────────────────────────

    [[nodiscard]] Uint256 get_shares(const Address& account, const TermId& term,
                                     CurveId curve) const;

    /// Largest redeemable share count that keeps the vault above its floor.
    [[nodiscard]] Uint256 max_redeem(const Address& account, const TermId& term,
                                     CurveId curve) const;

    [[nodiscard]] VaultTotals vault(const TermId& term, CurveId curve) const;
    [[nodiscard]] Uint256 current_share_price(const TermId& term, CurveId curve) const;
    [[nodiscard]] Uint256 convert_to_shares(const TermId& term, CurveId curve,
                                            const Uint256& assets) const;
    [[nodiscard]] Uint256 convert_to_assets(const TermId& term, CurveId curve,
                                            const Uint256& shares) const;

    /// Read-only access to the underlying store (invariant checks, tooling).
    [[nodiscard]] const vault::VaultStore& vault_store() const noexcept { return state_.vaults; }

    // ─── Term views ───────────────────────────────────────────────────────────

    [[nodiscard]] bool is_term_created(const TermId& id) const;
    [[nodiscard]] bool is_atom(const TermId& id) const;
    /// True for positive triples and their counters.
    [[nodiscard]] bool is_triple(const TermId& id) const;
    [[nodiscard]] bool is_counter_triple(const TermId& id) const;
    [[nodiscard]] std::optional<VaultType>   vault_type(const TermId& id) const;
    [[nodiscard]] std::optional<Bytes>       atom_data(const TermId& id) const;
    /// Atoms of a triple, or of the triple a counter mirrors.
    [[nodiscard]] std::optional<TripleAtoms> triple_atoms(const TermId& id) const;
    [[nodiscard]] std::optional<TermId>      triple_of_counter(const TermId& counter) const;
    [[nodiscard]] std::uint64_t total_terms_created() const noexcept { return state_.total_terms; }

    [[nodiscard]] static TermId calculate_atom_id(std::span<const std::uint8_t> data);
    [[nodiscard]] static TermId calculate_triple_id(const TermId& subject,
                                                    const TermId& predicate,
                                                    const TermId& object);
    [[nodiscard]] static TermId calculate_counter_id(const TermId& triple);

    // ─── Account & protocol views ─────────────────────────────────────────────

    [[nodiscard]] ApprovalType approval(const Address& owner, const Address& delegate) const;
    [[nodiscard]] bool is_paused() const noexcept { return state_.paused; }
    [[nodiscard]] const ConfigSnapshot& config() const noexcept { return state_.config; }
    [[nodiscard]] Epoch current_epoch() const { return sink_.current_epoch(); }

    [[nodiscard]] Uint256 accumulated_protocol_fees(Epoch epoch) const;
    [[nodiscard]] Uint256 accumulated_atom_wallet_deposit_fees(const Address& wallet) const;

    [[nodiscard]] Int256 total_utilization(Epoch epoch) const;
    [[nodiscard]] Int256 user_utilization(const Address& account, Epoch epoch) const;
    [[nodiscard]] std::optional<Epoch> last_active_epoch(const Address& account) const;
    [[nodiscard]] const utilization::UtilizationLedger& utilization() const noexcept {
        return state_.utilization;
    }

    /// Every event committed so far, in order.
    [[nodiscard]] const std::vector<Event>& events() const noexcept { return events_; }

private:
    // ─── State ────────────────────────────────────────────────────────────────

    /// Everything a call may change. Staged by copy, committed by move.
    struct State {
        ConfigSnapshot                                  config;
        vault::VaultStore                               vaults;
        std::map<TermId, Bytes>                         atom_data;
        std::map<TermId, TripleAtoms>                   triples;
        std::map<TermId, TermId>                        counter_to_triple;
        std::uint64_t                                   total_terms = 0;
        std::map<std::pair<Address, Address>, ApprovalType> approvals;
        std::map<Epoch, Uint256>                        protocol_fees;
        std::map<Address, Uint256>                      atom_wallet_fees;
        utilization::UtilizationLedger                  utilization;
        bool                                            paused = false;
    };

    struct Transaction;

    /// Arguments of one steady-state deposit or redemption.
    struct FlowArgs {
        Address sender;
        Address receiver;
        TermId  term;
        CurveId curve = 0;
        Uint256 amount;   ///< Assets (deposit) or shares (redeem)
        Uint256 bound;    ///< Minimum shares (deposit) or minimum assets (redeem)
    };

    /// Run `body` as one all-or-nothing call (see transaction.hpp).
    template <typename Body>
    auto transact(std::string_view operation, Body&& body);

    /// Pull, commit state and events, then run outbound calls and publish.
    void commit(Transaction& tx, std::string_view operation);

    // ─── Term lifecycle (term_lifecycle.cpp) ──────────────────────────────────

    TermId create_atom_in(Transaction& tx, const Address& creator,
                          std::span<const std::uint8_t> data, const Uint256& assets);
    TermId create_triple_in(Transaction& tx, const Address& creator,
                            const TermId& subject, const TermId& predicate,
                            const TermId& object, const Uint256& assets);
    void creation_deposit(Transaction& tx, const Address& receiver, const TermId& term,
                          VaultType type, const Uint256& assets);
    void open_ghost_vault(Transaction& tx, const TermId& term, CurveId curve,
                          VaultType type);
    void fan_out_fraction(Transaction& tx, const Address& sender, const Address& receiver,
                          const TermId& term, const Uint256& fraction);
    void bump_assets(Transaction& tx, const TermId& term, CurveId curve,
                     const Uint256& amount);

    // ─── Flows (deposit_redeem.cpp) ───────────────────────────────────────────

    Uint256 apply_deposit(Transaction& tx, const FlowArgs& args);
    fees::FeesBreakdown apply_redeem(Transaction& tx, const FlowArgs& args);
    void apply_deposit_fees(Transaction& tx, const Address& sender, const Address& receiver,
                            const TermId& term, CurveId curve,
                            const fees::FeesBreakdown& breakdown);

    // ─── Settlement & accounting (settlement.cpp) ─────────────────────────────

    void roll_utilization(Transaction& tx, const Address& account);
    void add_utilization(Transaction& tx, const Address& account, const Int256& delta);
    void settle_protocol_fees(Transaction& tx, Epoch epoch);
    void accrue_protocol_fee(Transaction& tx, const Address& sender, const Uint256& amount);
    void accrue_atom_wallet_fee(Transaction& tx, const TermId& atom, const Address& sender,
                                const Uint256& amount);

    // ─── Helpers (multivault.cpp) ─────────────────────────────────────────────

    void require_not_paused(const State& state) const;
    void require_admin(const State& state, const Address& caller) const;
    [[nodiscard]] VaultType require_term(const State& state, const TermId& id) const;
    void require_curve(CurveId curve) const;
    void require_approval(const State& state, const Address& owner,
                          const Address& delegate, ApprovalType needed) const;
    void emit_price(Transaction& tx, const vault::PriceSignal& signal, VaultType type);

    [[nodiscard]] static std::optional<VaultType> type_in(const State& state, const TermId& id);
    [[nodiscard]] static std::optional<TermId> mirror_of(const State& state, const TermId& id);

    /// Ghost cost of opening (term, curve) and, for triples, its mirror.
    [[nodiscard]] Uint256 ghost_cost(const State& state, const TermId& term,
                                     CurveId curve, VaultType type) const;

    [[nodiscard]] CreatePreview preview_create(const Uint256& assets, const Uint256& cost,
                                               VaultType type) const;

    void publish(const std::vector<Event>& events);

    // ─── Members ──────────────────────────────────────────────────────────────

    const curve::CurveRegistry& curves_;
    const WalletFactory&        wallets_;
    BondingSink&                sink_;
    AssetCustody&               custody_;

    State                       state_;
    std::vector<Event>          events_;
    std::vector<EventHandler>   handlers_;
    bool                        entered_ = false;
};

} // namespace mvault::core
