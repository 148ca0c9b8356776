/// @file src/core/types.cpp
/// @brief Hex encoding and enum names for the shared value types.

#include "mvault/types.hpp"

#include <algorithm>

namespace mvault {

// ─── Internal helpers ─────────────────────────────────────────────────────────

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

template <std::size_t N>
[[nodiscard]] std::string encode_hex(const std::array<std::uint8_t, N>& bytes) {
    std::string out;
    out.reserve(2 + 2 * N);
    out += "0x";
    for (std::uint8_t b : bytes) {
        out += HEX_DIGITS[b >> 4];
        out += HEX_DIGITS[b & 0x0F];
    }
    return out;
}

[[nodiscard]] std::optional<std::uint8_t> nibble(char c) noexcept {
    if (c >= '0' && c <= '9') return static_cast<std::uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<std::uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<std::uint8_t>(c - 'A' + 10);
    return std::nullopt;
}

template <std::size_t N>
[[nodiscard]] std::optional<std::array<std::uint8_t, N>>
decode_hex(std::string_view hex) noexcept {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 2 * N) {
        return std::nullopt;
    }

    std::array<std::uint8_t, N> out{};
    for (std::size_t i = 0; i < N; ++i) {
        const auto hi = nibble(hex[2 * i]);
        const auto lo = nibble(hex[2 * i + 1]);
        if (!hi || !lo) {
            return std::nullopt;
        }
        out[i] = static_cast<std::uint8_t>((*hi << 4) | *lo);
    }
    return out;
}

template <std::size_t N>
[[nodiscard]] bool all_zero(const std::array<std::uint8_t, N>& bytes) noexcept {
    return std::all_of(bytes.begin(), bytes.end(),
                       [](std::uint8_t b) { return b == 0; });
}

} // anonymous namespace

// ─── TermId ───────────────────────────────────────────────────────────────────

std::string TermId::to_hex() const {
    return encode_hex(bytes);
}

std::optional<TermId> TermId::from_hex(std::string_view hex) noexcept {
    auto decoded = decode_hex<32>(hex);
    if (!decoded) {
        return std::nullopt;
    }
    return TermId{*decoded};
}

bool TermId::is_zero() const noexcept {
    return all_zero(bytes);
}

// ─── Address ──────────────────────────────────────────────────────────────────

std::string Address::to_hex() const {
    return encode_hex(bytes);
}

std::optional<Address> Address::from_hex(std::string_view hex) noexcept {
    auto decoded = decode_hex<20>(hex);
    if (!decoded) {
        return std::nullopt;
    }
    return Address{*decoded};
}

Address Address::from_u64(std::uint64_t value) noexcept {
    Address addr;
    for (std::size_t i = 0; i < 8; ++i) {
        addr.bytes[addr.bytes.size() - 1 - i] =
            static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF);
    }
    return addr;
}

bool Address::is_zero() const noexcept {
    return all_zero(bytes);
}

// ─── Enum names ───────────────────────────────────────────────────────────────

std::string_view to_string(VaultType type) noexcept {
    switch (type) {
        case VaultType::Atom:          return "ATOM";
        case VaultType::Triple:        return "TRIPLE";
        case VaultType::CounterTriple: return "COUNTER_TRIPLE";
    }
    return "UNKNOWN";
}

std::string_view to_string(ApprovalType type) noexcept {
    switch (type) {
        case ApprovalType::None:       return "NONE";
        case ApprovalType::Deposit:    return "DEPOSIT";
        case ApprovalType::Redemption: return "REDEMPTION";
        case ApprovalType::Both:       return "BOTH";
    }
    return "UNKNOWN";
}

} // namespace mvault
