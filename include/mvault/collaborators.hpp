#pragma once

/// @file include/mvault/collaborators.hpp
/// @brief External services the ledger calls out to.
///
/// # Module: Collaborators
///
/// ## Responsibility
/// Declare the narrow interfaces through which the ledger reaches the world
/// outside its own state: deterministic atom-wallet addresses, the epoch
/// clock with its protocol-fee sink, and custody of the base asset.
///
/// ## Guarantees
/// - The ledger never hands a collaborator a reference into its own state
/// - Outbound calls that move value (`push`, `set_max_claimable_protocol_fees`)
///   happen only after the calling transaction has committed

#include "mvault/types.hpp"

namespace mvault {

/// Derives the deterministic receiving account of an atom.
class WalletFactory {
public:
    virtual ~WalletFactory() = default;

    [[nodiscard]] virtual Address compute_atom_wallet_addr(const TermId& atom) const = 0;
};

/// Epoch clock and protocol-fee distribution sink.
class BondingSink {
public:
    virtual ~BondingSink() = default;

    [[nodiscard]] virtual Epoch current_epoch() const = 0;

    /// Register the largest amount claimable for `epoch` before the fees
    /// for that epoch are transferred to the sink.
    virtual void set_max_claimable_protocol_fees(Epoch epoch, const Uint256& amount) = 0;
};

/// Holder of the base asset.
class AssetCustody {
public:
    virtual ~AssetCustody() = default;

    /// Take `amount` from `from` into the ledger.
    /// @return false if `from` cannot cover it; nothing moves in that case.
    [[nodiscard]] virtual bool pull(const Address& from, const Uint256& amount) = 0;

    /// Pay `amount` out of the ledger to `to`.
    virtual void push(const Address& to, const Uint256& amount) = 0;
};

} // namespace mvault
