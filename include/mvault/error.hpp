#pragma once

/// @file include/mvault/error.hpp
/// @brief Ledger error taxonomy.
///
/// # Module: Errors
///
/// ## Responsibility
/// Name every reason a state-changing call can be rejected. A rejected call
/// throws `LedgerError`; the transaction that raised it is discarded as a
/// unit, so callers never observe partial state.
///
/// ## Guarantees
/// - Every `ErrorCode` has a stable name via `to_string`
/// - Every `ErrorCode` belongs to exactly one `ErrorKind`

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mvault {

/// Taxonomy class of an error code.
enum class ErrorKind : std::uint8_t {
    IdentityConflict,
    ReferentialIntegrity,
    EconomicValidity,
    PolicyViolation,
    StructuralValidation,
};

/// Specific rejection reason.
enum class ErrorCode : std::uint8_t {
    // Identity conflicts
    AtomExists,
    TripleExists,

    // Referential integrity
    AtomDoesNotExist,
    TermDoesNotExist,
    InvalidCurveId,

    // Economic validity
    ZeroAmount,
    DepositBelowMinimum,
    InsufficientAssetsForCreation,
    DepositTooSmallForGhostShares,
    FeesExceedAssets,
    ZeroSharesOut,
    ZeroAssetsOut,
    SlippageExceeded,
    RemainingSharesBelowMinimum,
    InsufficientBalance,
    InsufficientFunds,
    ExceedsCurveMaxAssets,
    AtomDataTooLong,
    ArithmeticOverflow,

    // Policy violations
    HasCounterStake,
    CannotApproveSelf,
    SenderNotApproved,
    Unauthorized,
    TransfersDisabled,
    Paused,
    Reentrancy,
    InvalidConfig,
    StaleConfigVersion,

    // Structural validation
    ArraysLengthMismatch,
    EmptyArray,
};

[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;
[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;
[[nodiscard]] ErrorKind error_kind(ErrorCode code) noexcept;

/// Exception raised for every ledger rule violation.
class LedgerError : public std::runtime_error {
public:
    LedgerError(ErrorCode code, const std::string& detail);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] ErrorKind kind() const noexcept { return error_kind(code_); }

private:
    ErrorCode code_;
};

} // namespace mvault
