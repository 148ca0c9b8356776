#pragma once

/// @file include/mvault/config.hpp
/// @brief Versioned configuration snapshot consumed by the ledger.
///
/// # Module: Configuration
///
/// ## Responsibility
/// Carry every operator-tunable parameter (fee rates, minimums, privileged
/// addresses, the default curve) as one value struct. The ledger receives a snapshot at construction and replaces it
/// only at an explicit `sync_config` call; nothing reads configuration from
/// global state.
///
/// ## Fee Rates
/// Every rate is a numerator over `general.fee_denominator`. With the
/// default denominator of 10 000, a rate of 100 means 1 %.
///
/// ## NOT Responsible For
/// - Storing or distributing configuration (see ConfigSource)

#include "mvault/types.hpp"
#include "mvault/constants.hpp"

#include <optional>
#include <string>

namespace mvault {

// ─── Sections ─────────────────────────────────────────────────────────────────

/// Addresses, minimums and protocol-wide switches.
struct GeneralConfig {
    Address admin;                       ///< Receives ghost shares; may pause and sync config
    Address protocol_multisig;           ///< Treasury for undistributed protocol fees
    Address trust_bonding;               ///< Bonding/distribution sink address
    Uint256 fee_denominator = constants::DEFAULT_FEE_DENOMINATOR;
    Uint256 min_deposit     = 0;         ///< Smallest accepted deposit
    Uint256 min_share       = 1;         ///< Ghost shares minted per vault initialisation
    std::size_t atom_data_max_length = constants::DEFAULT_ATOM_DATA_MAX_LENGTH;
    bool protocol_fee_distribution_enabled = true;
};

/// Atom creation economics.
struct AtomConfig {
    Uint256 atom_creation_protocol_fee = 0;  ///< Static fee per atom (base units)
    Uint256 atom_wallet_deposit_fee    = 0;  ///< Rate credited to the atom wallet
};

/// Triple creation economics.
struct TripleConfig {
    Uint256 triple_creation_protocol_fee           = 0;  ///< Static fee per triple
    Uint256 total_atom_deposits_on_triple_creation = 0;  ///< Static amount split over the 3 atoms
    Uint256 atom_deposit_fraction_for_triple       = 0;  ///< Rate fanned out to the atoms
};

/// Percentage fees applied on every deposit/redeem.
struct VaultFees {
    Uint256 entry_fee    = 0;
    Uint256 exit_fee     = 0;
    Uint256 protocol_fee = 0;
};

/// Curve selection.
struct BondingCurveConfig {
    CurveId default_curve_id = constants::DEFAULT_CURVE_ID;
};

// ─── ConfigSnapshot ───────────────────────────────────────────────────────────

/// Complete configuration at one version.
struct ConfigSnapshot {
    std::uint64_t      version = 1;
    GeneralConfig      general{};
    AtomConfig         atom{};
    TripleConfig       triple{};
    VaultFees          vault_fees{};
    BondingCurveConfig bonding_curve{};

    /// If true, emit one diagnostic line per committed or rejected call to stderr.
    bool verbose = false;

    /// Static cost of creating an atom: creation fee + one vault's ghost shares.
    [[nodiscard]] Uint256 atom_cost() const;

    /// Static cost of creating a triple: creation fee + static atom deposits
    /// + ghost shares for the triple vault and its counter vault.
    [[nodiscard]] Uint256 triple_cost() const;
};

/// Check a snapshot for internal consistency.
///
/// # Returns
/// - `nullopt` if the snapshot is usable
/// - A description of the first problem found otherwise
[[nodiscard]] std::optional<std::string> validate_config(const ConfigSnapshot& config);

// ─── ConfigSource ─────────────────────────────────────────────────────────────

/// Read-only provider of configuration snapshots, pulled at sync points.
class ConfigSource {
public:
    virtual ~ConfigSource() = default;

    [[nodiscard]] virtual ConfigSnapshot snapshot() const = 0;
};

} // namespace mvault
