#pragma once

/// @file src/identity/digest.hpp
/// @brief SHA-256 over one or more byte ranges, backed by OpenSSL EVP.

#include <array>
#include <cstdint>
#include <initializer_list>
#include <span>

namespace mvault::identity {

using Digest = std::array<std::uint8_t, 32>;

/// Hash the concatenation of `parts` in order.
/// Throws std::runtime_error if libcrypto fails.
[[nodiscard]] Digest sha256(std::initializer_list<std::span<const std::uint8_t>> parts);

} // namespace mvault::identity
