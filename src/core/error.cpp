/// @file src/core/error.cpp
/// @brief Error code names and taxonomy mapping.

#include "mvault/error.hpp"

#include <fmt/core.h>

namespace mvault {

LedgerError::LedgerError(ErrorCode code, const std::string& detail)
    : std::runtime_error(fmt::format("{}: {}", to_string(code), detail))
    , code_(code) {}

std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::AtomExists:                    return "AtomExists";
        case ErrorCode::TripleExists:                  return "TripleExists";
        case ErrorCode::AtomDoesNotExist:              return "AtomDoesNotExist";
        case ErrorCode::TermDoesNotExist:              return "TermDoesNotExist";
        case ErrorCode::InvalidCurveId:                return "InvalidCurveId";
        case ErrorCode::ZeroAmount:                    return "ZeroAmount";
        case ErrorCode::DepositBelowMinimum:           return "DepositBelowMinimum";
        case ErrorCode::InsufficientAssetsForCreation: return "InsufficientAssetsForCreation";
        case ErrorCode::DepositTooSmallForGhostShares: return "DepositTooSmallForGhostShares";
        case ErrorCode::FeesExceedAssets:              return "FeesExceedAssets";
        case ErrorCode::ZeroSharesOut:                 return "ZeroSharesOut";
        case ErrorCode::ZeroAssetsOut:                 return "ZeroAssetsOut";
        case ErrorCode::SlippageExceeded:              return "SlippageExceeded";
        case ErrorCode::RemainingSharesBelowMinimum:   return "RemainingSharesBelowMinimum";
        case ErrorCode::InsufficientBalance:           return "InsufficientBalance";
        case ErrorCode::InsufficientFunds:             return "InsufficientFunds";
        case ErrorCode::ExceedsCurveMaxAssets:         return "ExceedsCurveMaxAssets";
        case ErrorCode::AtomDataTooLong:               return "AtomDataTooLong";
        case ErrorCode::ArithmeticOverflow:            return "ArithmeticOverflow";
        case ErrorCode::HasCounterStake:               return "HasCounterStake";
        case ErrorCode::CannotApproveSelf:             return "CannotApproveSelf";
        case ErrorCode::SenderNotApproved:             return "SenderNotApproved";
        case ErrorCode::Unauthorized:                  return "Unauthorized";
        case ErrorCode::TransfersDisabled:             return "TransfersDisabled";
        case ErrorCode::Paused:                        return "Paused";
        case ErrorCode::Reentrancy:                    return "Reentrancy";
        case ErrorCode::InvalidConfig:                 return "InvalidConfig";
        case ErrorCode::StaleConfigVersion:            return "StaleConfigVersion";
        case ErrorCode::ArraysLengthMismatch:          return "ArraysLengthMismatch";
        case ErrorCode::EmptyArray:                    return "EmptyArray";
    }
    return "Unknown";
}

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::IdentityConflict:     return "IdentityConflict";
        case ErrorKind::ReferentialIntegrity: return "ReferentialIntegrity";
        case ErrorKind::EconomicValidity:     return "EconomicValidity";
        case ErrorKind::PolicyViolation:      return "PolicyViolation";
        case ErrorKind::StructuralValidation: return "StructuralValidation";
    }
    return "Unknown";
}

ErrorKind error_kind(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::AtomExists:
        case ErrorCode::TripleExists:
            return ErrorKind::IdentityConflict;

        case ErrorCode::AtomDoesNotExist:
        case ErrorCode::TermDoesNotExist:
        case ErrorCode::InvalidCurveId:
            return ErrorKind::ReferentialIntegrity;

        case ErrorCode::ZeroAmount:
        case ErrorCode::DepositBelowMinimum:
        case ErrorCode::InsufficientAssetsForCreation:
        case ErrorCode::DepositTooSmallForGhostShares:
        case ErrorCode::FeesExceedAssets:
        case ErrorCode::ZeroSharesOut:
        case ErrorCode::ZeroAssetsOut:
        case ErrorCode::SlippageExceeded:
        case ErrorCode::RemainingSharesBelowMinimum:
        case ErrorCode::InsufficientBalance:
        case ErrorCode::InsufficientFunds:
        case ErrorCode::ExceedsCurveMaxAssets:
        case ErrorCode::AtomDataTooLong:
        case ErrorCode::ArithmeticOverflow:
            return ErrorKind::EconomicValidity;

        case ErrorCode::HasCounterStake:
        case ErrorCode::CannotApproveSelf:
        case ErrorCode::SenderNotApproved:
        case ErrorCode::Unauthorized:
        case ErrorCode::TransfersDisabled:
        case ErrorCode::Paused:
        case ErrorCode::Reentrancy:
        case ErrorCode::InvalidConfig:
        case ErrorCode::StaleConfigVersion:
            return ErrorKind::PolicyViolation;

        case ErrorCode::ArraysLengthMismatch:
        case ErrorCode::EmptyArray:
            return ErrorKind::StructuralValidation;
    }
    return ErrorKind::StructuralValidation;
}

} // namespace mvault
