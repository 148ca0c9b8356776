/// @file src/core/config.cpp
/// @brief Configuration costs and validation.

#include "mvault/config.hpp"
#include "mvault/format.hpp"

#include <fmt/core.h>

namespace mvault {

Uint256 ConfigSnapshot::atom_cost() const {
    return atom.atom_creation_protocol_fee + general.min_share;
}

Uint256 ConfigSnapshot::triple_cost() const {
    return triple.triple_creation_protocol_fee
         + triple.total_atom_deposits_on_triple_creation
         + general.min_share * 2;
}

std::optional<std::string> validate_config(const ConfigSnapshot& config) {
    const auto& g = config.general;
    const Uint256& denom = g.fee_denominator;

    if (denom == 0) {
        return std::string{"fee_denominator must be non-zero"};
    }
    if (g.admin.is_zero()) {
        return std::string{"admin address must be set"};
    }
    if (g.protocol_multisig.is_zero()) {
        return std::string{"protocol_multisig address must be set"};
    }
    if (g.trust_bonding.is_zero()) {
        return std::string{"trust_bonding address must be set"};
    }
    if (g.min_share == 0) {
        return std::string{"min_share must be non-zero"};
    }
    if (config.bonding_curve.default_curve_id == 0) {
        return std::string{"default_curve_id must be non-zero"};
    }

    const Uint256& entry    = config.vault_fees.entry_fee;
    const Uint256& exit     = config.vault_fees.exit_fee;
    const Uint256& protocol = config.vault_fees.protocol_fee;
    const Uint256& wallet   = config.atom.atom_wallet_deposit_fee;
    const Uint256& fraction = config.triple.atom_deposit_fraction_for_triple;

    // An atom deposit and a triple deposit each take at most
    // protocol + entry + one term-kind fee; a redeem takes protocol + exit.
    if (protocol + entry + wallet > denom) {
        return fmt::format("atom deposit fees ({}) exceed fee_denominator ({})",
                           protocol + entry + wallet, denom);
    }
    if (protocol + entry + fraction > denom) {
        return fmt::format("triple deposit fees ({}) exceed fee_denominator ({})",
                           protocol + entry + fraction, denom);
    }
    if (protocol + exit > denom) {
        return fmt::format("redeem fees ({}) exceed fee_denominator ({})",
                           protocol + exit, denom);
    }
    return std::nullopt;
}

} // namespace mvault
