#pragma once

/// @file src/core/reentrancy_guard.hpp
/// @brief Scoped non-reentrancy flag.

#include "mvault/error.hpp"

namespace mvault::core::detail {

/// Sets `flag` for its lifetime. Throws `LedgerError(Reentrancy)` if the
/// flag is already set; released on every exit path.
class ReentrancyGuard {
public:
    explicit ReentrancyGuard(bool& flag) : flag_(flag) {
        if (flag_) {
            throw LedgerError(ErrorCode::Reentrancy, "a ledger call is already in flight");
        }
        flag_ = true;
    }

    ~ReentrancyGuard() { flag_ = false; }

    ReentrancyGuard(const ReentrancyGuard&)            = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

private:
    bool& flag_;
};

} // namespace mvault::core::detail
