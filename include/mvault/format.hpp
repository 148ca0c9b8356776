#pragma once

/// @file include/mvault/format.hpp
/// @brief {fmt} formatters for mvault value types.
///
/// Lets diagnostics and event renderers write `fmt::format("{}", term_id)`
/// without calling `to_hex()` / `str()` at every call site.

#include "mvault/types.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <string_view>

template <>
struct fmt::formatter<mvault::TermId> : fmt::formatter<std::string_view> {
    auto format(const mvault::TermId& id, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(id.to_hex(), ctx);
    }
};

template <>
struct fmt::formatter<mvault::Address> : fmt::formatter<std::string_view> {
    auto format(const mvault::Address& addr, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(addr.to_hex(), ctx);
    }
};

template <>
struct fmt::formatter<mvault::Uint256> : fmt::formatter<std::string_view> {
    auto format(const mvault::Uint256& value, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(value.str(), ctx);
    }
};

template <>
struct fmt::formatter<mvault::Int256> : fmt::formatter<std::string_view> {
    auto format(const mvault::Int256& value, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(value.str(), ctx);
    }
};

template <>
struct fmt::formatter<mvault::VaultType> : fmt::formatter<std::string_view> {
    auto format(mvault::VaultType type, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(mvault::to_string(type), ctx);
    }
};

template <>
struct fmt::formatter<mvault::ApprovalType> : fmt::formatter<std::string_view> {
    auto format(mvault::ApprovalType type, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(mvault::to_string(type), ctx);
    }
};
