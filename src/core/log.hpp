#pragma once

/// @file src/core/log.hpp
/// @brief Verbose-gated diagnostic lines on stderr.

#include <fmt/core.h>

#include <cstdio>
#include <utility>

namespace mvault::core::detail {

/// Print one `[mvault]`-prefixed line to stderr when `verbose` is set.
template <typename... Args>
void log_line(bool verbose, fmt::format_string<Args...> format, Args&&... args) {
    if (!verbose) {
        return;
    }
    fmt::print(stderr, "[mvault] {}\n", fmt::format(format, std::forward<Args>(args)...));
}

} // namespace mvault::core::detail
