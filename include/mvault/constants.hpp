#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

/// @file include/mvault/constants.hpp
/// @brief Fixed protocol constants for the mvault ledger.
///
/// Values here never change at runtime. Anything an operator may tune
/// (fee rates, minimums, addresses) lives in config.hpp instead.

namespace mvault::constants {

// ─── Share Normalisation ──────────────────────────────────────────────────────

/// One whole share in base units (18 decimals).
/// Vaults holding at least this many shares report their price as the
/// asset value of one share; smaller vaults fall back to the marginal price.
static constexpr std::uint64_t ONE_SHARE = 1'000'000'000'000'000'000ULL;

// ─── Identity ─────────────────────────────────────────────────────────────────

/// Domain-separation seed for counter-triple ids.
/// The 32-byte salt itself is SHA-256 of this string.
static constexpr std::string_view COUNTER_SALT_SEED = "COUNTER_SALT";

/// Size in bytes of every term identifier.
static constexpr std::size_t TERM_ID_SIZE = 32;

/// Number of atoms referenced by a triple (subject, predicate, object).
static constexpr std::size_t TRIPLE_ARITY = 3;

// ─── Configuration Defaults ───────────────────────────────────────────────────

/// Default fee denominator: rates are expressed in basis points.
static constexpr std::uint64_t DEFAULT_FEE_DENOMINATOR = 10'000;

/// Default maximum atom payload length in bytes.
static constexpr std::size_t DEFAULT_ATOM_DATA_MAX_LENGTH = 1'000;

/// Curve id used for creation deposits and the counter-stake policy.
static constexpr std::uint64_t DEFAULT_CURVE_ID = 1;

} // namespace mvault::constants
