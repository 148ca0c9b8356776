#pragma once

/// @file include/mvault/types.hpp
/// @brief Shared primitive types for the mvault ledger.
///
/// Every module includes this file. It defines the identifier value types,
/// the 256-bit integer aliases used for all asset and share quantities, and
/// the small enums that travel on events.

#include <boost/multiprecision/cpp_int.hpp>

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mvault {

// ─── Numeric Types ────────────────────────────────────────────────────────────

/// Unsigned 256-bit quantity (assets, shares, fee rates, prices).
/// Checked: overflow and unsigned underflow raise instead of wrapping.
using Uint256 = boost::multiprecision::checked_uint256_t;

/// Signed 256-bit quantity (utilization buckets and deltas).
using Int256 = boost::multiprecision::checked_int256_t;

/// Bonding-curve identifier (1-based; 0 is never a valid curve).
using CurveId = std::uint64_t;

/// Externally clocked accounting period.
using Epoch = std::uint64_t;

/// Opaque atom payload.
using Bytes = std::vector<std::uint8_t>;

// ─── Identifiers ──────────────────────────────────────────────────────────────

/// 32-byte content-addressed term identifier (atom, triple or counter).
struct TermId {
    std::array<std::uint8_t, 32> bytes{};

    auto operator<=>(const TermId&) const = default;

    /// Lower-case hex with `0x` prefix (66 characters).
    [[nodiscard]] std::string to_hex() const;

    /// Parse `0x`-prefixed or bare 64-digit hex. `nullopt` on bad input.
    [[nodiscard]] static std::optional<TermId> from_hex(std::string_view hex) noexcept;

    [[nodiscard]] bool is_zero() const noexcept;
};

/// 20-byte account address.
struct Address {
    std::array<std::uint8_t, 20> bytes{};

    auto operator<=>(const Address&) const = default;

    [[nodiscard]] std::string to_hex() const;

    /// Parse `0x`-prefixed or bare 40-digit hex. `nullopt` on bad input.
    [[nodiscard]] static std::optional<Address> from_hex(std::string_view hex) noexcept;

    /// Address whose low eight bytes hold `value` big-endian.
    [[nodiscard]] static Address from_u64(std::uint64_t value) noexcept;

    [[nodiscard]] bool is_zero() const noexcept;
};

// ─── Enums ────────────────────────────────────────────────────────────────────

/// Kind of vault a term id resolves to.
enum class VaultType : std::uint8_t {
    Atom          = 0,
    Triple        = 1,
    CounterTriple = 2,
};

/// Bitmask granting a delegate the right to act for an owner.
enum class ApprovalType : std::uint8_t {
    None       = 0,
    Deposit    = 1,
    Redemption = 2,
    Both       = 3,
};

[[nodiscard]] constexpr bool allows(ApprovalType granted, ApprovalType needed) noexcept {
    return (static_cast<std::uint8_t>(granted) & static_cast<std::uint8_t>(needed))
        == static_cast<std::uint8_t>(needed);
}

[[nodiscard]] std::string_view to_string(VaultType type) noexcept;
[[nodiscard]] std::string_view to_string(ApprovalType type) noexcept;

// ─── Vault Totals ─────────────────────────────────────────────────────────────

/// Asset/share totals of one (term, curve) vault.
struct VaultTotals {
    Uint256 total_assets;
    Uint256 total_shares;

    bool operator==(const VaultTotals&) const = default;
};

} // namespace mvault
