/// @file src/core/settlement.cpp
/// @brief Utilization rollover, fee accrual and protocol-fee settlement.

#include "mvault/multivault.hpp"
#include "mvault/format.hpp"

#include "transaction.hpp"

namespace mvault::core {

void MultiVault::roll_utilization(Transaction& tx, const Address& account) {
    State& s = tx.staged;
    const auto outcome = s.utilization.rollover(
        account, tx.epoch, s.config.general.protocol_fee_distribution_enabled);

    if (outcome.global_seeded) {
        detail::log_line(s.config.verbose, "epoch {} seeded by {}", tx.epoch, account);
    }
    if (outcome.settle_epoch) {
        settle_protocol_fees(tx, *outcome.settle_epoch);
    }
}

void MultiVault::add_utilization(Transaction& tx, const Address& account, const Int256& delta) {
    State& s = tx.staged;
    s.utilization.add(account, tx.epoch, delta);
    tx.emit(UtilizationUpdated{
        .account           = account,
        .epoch             = tx.epoch,
        .delta             = delta,
        .total_utilization = s.utilization.total_utilization(tx.epoch),
        .user_utilization  = s.utilization.user_utilization(account, tx.epoch),
    });
}

void MultiVault::settle_protocol_fees(Transaction& tx, Epoch epoch) {
    State& s = tx.staged;

    auto it = s.protocol_fees.find(epoch);
    if (it == s.protocol_fees.end() || it->second == 0) {
        return;
    }
    const Uint256 amount = it->second;
    s.protocol_fees.erase(it);

    const bool distribute = s.utilization.distribution_snapshot(epoch).value_or(false);
    const Address destination = distribute ? s.config.general.trust_bonding
                                           : s.config.general.protocol_multisig;
    if (distribute) {
        tx.notify_claimable(epoch, amount);
    }
    tx.pay(destination, amount);
    tx.emit(ProtocolFeeTransferred{epoch, destination, amount});
}

void MultiVault::accrue_protocol_fee(Transaction& tx, const Address& sender,
                                     const Uint256& amount) {
    if (amount == 0) {
        return;
    }
    tx.staged.protocol_fees[tx.epoch] += amount;
    tx.emit(ProtocolFeeAccrued{tx.epoch, sender, amount});
}

void MultiVault::accrue_atom_wallet_fee(Transaction& tx, const TermId& atom,
                                        const Address& sender, const Uint256& amount) {
    const Address wallet = wallets_.compute_atom_wallet_addr(atom);
    tx.staged.atom_wallet_fees[wallet] += amount;
    tx.emit(AtomWalletDepositFeeCollected{atom, sender, wallet, amount});
}

} // namespace mvault::core
