/// @file src/curve/curve_registry.cpp
/// @brief CurveRegistry dispatch.

#include "mvault/curve.hpp"
#include "mvault/error.hpp"

#include <fmt/core.h>

#include <stdexcept>

namespace mvault::curve {

CurveId CurveRegistry::add_curve(std::unique_ptr<CurveProvider> provider) {
    if (!provider) {
        throw std::invalid_argument("CurveRegistry::add_curve: null provider");
    }
    curves_.push_back(std::move(provider));
    return static_cast<CurveId>(curves_.size());
}

const CurveProvider& CurveRegistry::at(CurveId id) const {
    if (!is_valid(id)) {
        throw LedgerError(ErrorCode::InvalidCurveId,
                          fmt::format("curve {} is not registered ({} curves)",
                                      id, curves_.size()));
    }
    return *curves_[id - 1];
}

Uint256 CurveRegistry::preview_deposit(CurveId id, const Uint256& assets,
                                       const VaultTotals& totals) const {
    return at(id).preview_deposit(assets, totals);
}

Uint256 CurveRegistry::preview_redeem(CurveId id, const Uint256& shares,
                                      const VaultTotals& totals) const {
    return at(id).preview_redeem(shares, totals);
}

Uint256 CurveRegistry::preview_mint(CurveId id, const Uint256& shares,
                                    const VaultTotals& totals) const {
    return at(id).preview_mint(shares, totals);
}

Uint256 CurveRegistry::preview_withdraw(CurveId id, const Uint256& assets,
                                        const VaultTotals& totals) const {
    return at(id).preview_withdraw(assets, totals);
}

Uint256 CurveRegistry::convert_to_shares(CurveId id, const Uint256& assets,
                                         const VaultTotals& totals) const {
    return at(id).convert_to_shares(assets, totals);
}

Uint256 CurveRegistry::convert_to_assets(CurveId id, const Uint256& shares,
                                         const VaultTotals& totals) const {
    return at(id).convert_to_assets(shares, totals);
}

Uint256 CurveRegistry::current_price(CurveId id, const VaultTotals& totals) const {
    return at(id).current_price(totals);
}

Uint256 CurveRegistry::max_assets(CurveId id) const {
    return at(id).max_assets();
}

Uint256 CurveRegistry::max_shares(CurveId id) const {
    return at(id).max_shares();
}

} // namespace mvault::curve
