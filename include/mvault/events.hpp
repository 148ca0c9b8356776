#pragma once

/// @file include/mvault/events.hpp
/// @brief Structured notifications emitted by committed ledger calls.
///
/// # Module: Events
///
/// ## Responsibility
/// Describe every state change with enough detail (before/after totals and
/// the full fee breakdown) to rebuild the ledger from the event log alone.
/// Events of a call are published only after the call commits; a rejected
/// call emits nothing.

#include "mvault/types.hpp"
#include "mvault/fees.hpp"

#include <array>
#include <string>
#include <string_view>
#include <variant>

namespace mvault {

// ─── Term lifecycle ───────────────────────────────────────────────────────────

struct AtomCreated {
    Address creator;
    TermId  term;
    Bytes   data;
    Address atom_wallet;
};

struct TripleCreated {
    Address creator;
    TermId  term;
    TermId  subject;
    TermId  predicate;
    TermId  object;
    TermId  counter;
};

// ─── Vault flows ──────────────────────────────────────────────────────────────

struct Deposited {
    Address             sender;
    Address             receiver;
    TermId              term;
    CurveId             curve = 0;
    VaultType           vault_type = VaultType::Atom;
    VaultTotals         before;
    VaultTotals         after;
    fees::FeesBreakdown fees;
};

struct Redeemed {
    Address             sender;
    Address             receiver;
    TermId              term;
    CurveId             curve = 0;
    VaultType           vault_type = VaultType::Atom;
    VaultTotals         before;
    VaultTotals         after;
    fees::FeesBreakdown fees;
};

struct SharePriceChanged {
    TermId    term;
    CurveId   curve = 0;
    VaultType vault_type = VaultType::Atom;
    Uint256   share_price;
    Uint256   total_assets;
    Uint256   total_shares;
};

// ─── Fees ─────────────────────────────────────────────────────────────────────

struct ProtocolFeeAccrued {
    Epoch   epoch = 0;
    Address sender;
    Uint256 amount;
};

struct ProtocolFeeTransferred {
    Epoch   epoch = 0;
    Address destination;
    Uint256 amount;
};

struct AtomWalletDepositFeeCollected {
    TermId  term;
    Address sender;
    Address atom_wallet;
    Uint256 amount;
};

struct AtomWalletDepositFeesClaimed {
    TermId  term;
    Address atom_wallet;
    Uint256 amount;
};

// ─── Accounts & admin ─────────────────────────────────────────────────────────

struct ApprovalTypeUpdated {
    Address      owner;
    Address      delegate;
    ApprovalType approval = ApprovalType::None;
};

struct UtilizationUpdated {
    Address account;
    Epoch   epoch = 0;
    Int256  delta;
    Int256  total_utilization;
    Int256  user_utilization;
};

struct PausedChanged {
    bool    paused = false;
    Address by;
};

struct ConfigSynced {
    std::uint64_t old_version = 0;
    std::uint64_t new_version = 0;
};

// ─── Event ────────────────────────────────────────────────────────────────────

using Event = std::variant<AtomCreated,
                           TripleCreated,
                           Deposited,
                           Redeemed,
                           SharePriceChanged,
                           ProtocolFeeAccrued,
                           ProtocolFeeTransferred,
                           AtomWalletDepositFeeCollected,
                           AtomWalletDepositFeesClaimed,
                           ApprovalTypeUpdated,
                           UtilizationUpdated,
                           PausedChanged,
                           ConfigSynced>;

/// Stable name of the event's alternative, e.g. "Deposited".
[[nodiscard]] std::string_view event_name(const Event& event) noexcept;

/// One-line human-readable rendering.
[[nodiscard]] std::string to_string(const Event& event);

} // namespace mvault
