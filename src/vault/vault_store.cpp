/// @file src/vault/vault_store.cpp
/// @brief VaultStore primitives and views.

#include "mvault/vault_store.hpp"
#include "mvault/constants.hpp"
#include "mvault/error.hpp"
#include "mvault/format.hpp"

#include <fmt/core.h>

namespace mvault::vault {

void VaultStore::mint(const Address& account, const TermId& term, CurveId curve,
                      const Uint256& amount) {
    if (amount == 0) {
        return;
    }
    Vault& v = vaults_[VaultKey{term, curve}];
    v.balances[account] += amount;
}

void VaultStore::burn(const Address& account, const TermId& term, CurveId curve,
                      const Uint256& amount) {
    const Uint256 balance = balance_of(account, term, curve);
    if (amount > balance) {
        throw LedgerError(ErrorCode::InsufficientBalance,
                          fmt::format("{} holds {} shares of {}/{}, burn of {} requested",
                                      account, balance, term, curve, amount));
    }
    if (amount == 0) {
        return;
    }

    Vault& v = vaults_.at(VaultKey{term, curve});
    auto it = v.balances.find(account);
    it->second -= amount;
    if (it->second == 0) {
        v.balances.erase(it);
    }
}

PriceSignal VaultStore::set_totals(const TermId& term, CurveId curve,
                                   const Uint256& assets, const Uint256& shares,
                                   const curve::CurveRegistry& curves) {
    Vault& v = vaults_[VaultKey{term, curve}];
    v.total_assets = assets;
    v.total_shares = shares;

    return PriceSignal{
        .term         = term,
        .curve        = curve,
        .share_price  = share_price(VaultTotals{assets, shares}, curve, curves),
        .total_assets = assets,
        .total_shares = shares,
    };
}

Uint256 VaultStore::share_price(const VaultTotals& totals, CurveId curve,
                                const curve::CurveRegistry& curves) {
    const Uint256 one_share(constants::ONE_SHARE);
    if (totals.total_shares == 0) {
        return 0;
    }
    if (totals.total_shares >= one_share) {
        return curves.convert_to_assets(curve, one_share, totals);
    }
    return curves.current_price(curve, totals);
}

const Vault* VaultStore::find(const TermId& term, CurveId curve) const {
    auto it = vaults_.find(VaultKey{term, curve});
    return it == vaults_.end() ? nullptr : &it->second;
}

std::optional<VaultTotals> VaultStore::totals(const TermId& term, CurveId curve) const {
    const Vault* v = find(term, curve);
    if (v == nullptr) {
        return std::nullopt;
    }
    return VaultTotals{v->total_assets, v->total_shares};
}

VaultTotals VaultStore::totals_or_empty(const TermId& term, CurveId curve) const {
    return totals(term, curve).value_or(VaultTotals{0, 0});
}

Uint256 VaultStore::balance_of(const Address& account, const TermId& term,
                               CurveId curve) const {
    const Vault* v = find(term, curve);
    if (v == nullptr) {
        return 0;
    }
    auto it = v->balances.find(account);
    return it == v->balances.end() ? Uint256(0) : it->second;
}

bool VaultStore::exists(const TermId& term, CurveId curve) const {
    const Vault* v = find(term, curve);
    return v != nullptr && v->total_shares != 0;
}

Uint256 VaultStore::holders_balance_sum(const TermId& term, CurveId curve) const {
    const Vault* v = find(term, curve);
    Uint256 sum = 0;
    if (v == nullptr) {
        return sum;
    }
    for (const auto& [account, balance] : v->balances) {
        sum += balance;
    }
    return sum;
}

} // namespace mvault::vault
