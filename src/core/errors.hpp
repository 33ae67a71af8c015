#pragma once

#include <string>
#include <utility>

namespace vault_ledger {

enum class ErrorCategory { NONE, AUTHORIZATION, STATE, ARITHMETIC, LIQUIDITY, VALUATION, NOT_FOUND };

enum class VaultError {
    OK,
    // Authorization
    UNAUTHORIZED,
    INVALID_IDENTITY,
    // State
    PAUSED,
    ALREADY_INITIALIZED,
    NOT_INITIALIZED,
    ZERO_AMOUNT,
    INVALID_AMOUNT,
    INVALID_FEE_BPS,
    NOTHING_TO_SWEEP,
    UNDEFINED_NAV,
    POSITION_EXISTS,
    INSUFFICIENT_SHARES,
    SLIPPAGE_EXCEEDED,
    INVARIANT_VIOLATION,
    // Lookup
    POSITION_NOT_FOUND,
    // Arithmetic
    MATH_OVERFLOW,
    // Liquidity
    INSUFFICIENT_LIQUIDITY,
    EXCEEDS_DEPLOYMENT_LIMIT,
    RETURN_EXCEEDS_DEPLOYED,
    // Valuation
    INVALID_VALUATION,
    NON_MONOTONIC_VALUATION,
    STALE_VALUATION
};

inline ErrorCategory error_category(VaultError e) {
    switch (e) {
        case VaultError::OK:
            return ErrorCategory::NONE;
        case VaultError::UNAUTHORIZED:
        case VaultError::INVALID_IDENTITY:
            return ErrorCategory::AUTHORIZATION;
        case VaultError::MATH_OVERFLOW:
            return ErrorCategory::ARITHMETIC;
        case VaultError::INSUFFICIENT_LIQUIDITY:
        case VaultError::EXCEEDS_DEPLOYMENT_LIMIT:
        case VaultError::RETURN_EXCEEDS_DEPLOYED:
            return ErrorCategory::LIQUIDITY;
        case VaultError::INVALID_VALUATION:
        case VaultError::NON_MONOTONIC_VALUATION:
        case VaultError::STALE_VALUATION:
            return ErrorCategory::VALUATION;
        case VaultError::POSITION_NOT_FOUND:
            return ErrorCategory::NOT_FOUND;
        default:
            return ErrorCategory::STATE;
    }
}

inline const char* to_string(VaultError e) {
    switch (e) {
        case VaultError::OK: return "Ok";
        case VaultError::UNAUTHORIZED: return "Unauthorized";
        case VaultError::INVALID_IDENTITY: return "InvalidIdentity";
        case VaultError::PAUSED: return "Paused";
        case VaultError::ALREADY_INITIALIZED: return "AlreadyInitialized";
        case VaultError::NOT_INITIALIZED: return "NotInitialized";
        case VaultError::ZERO_AMOUNT: return "ZeroAmount";
        case VaultError::INVALID_AMOUNT: return "InvalidAmount";
        case VaultError::INVALID_FEE_BPS: return "InvalidFeeBps";
        case VaultError::NOTHING_TO_SWEEP: return "NothingToSweep";
        case VaultError::UNDEFINED_NAV: return "UndefinedNav";
        case VaultError::POSITION_EXISTS: return "PositionExists";
        case VaultError::INSUFFICIENT_SHARES: return "InsufficientShares";
        case VaultError::SLIPPAGE_EXCEEDED: return "SlippageExceeded";
        case VaultError::INVARIANT_VIOLATION: return "InvariantViolation";
        case VaultError::POSITION_NOT_FOUND: return "PositionNotFound";
        case VaultError::MATH_OVERFLOW: return "Overflow";
        case VaultError::INSUFFICIENT_LIQUIDITY: return "InsufficientLiquidity";
        case VaultError::EXCEEDS_DEPLOYMENT_LIMIT: return "ExceedsDeploymentLimit";
        case VaultError::RETURN_EXCEEDS_DEPLOYED: return "ReturnExceedsDeployed";
        case VaultError::INVALID_VALUATION: return "InvalidValuation";
        case VaultError::NON_MONOTONIC_VALUATION: return "NonMonotonicValuation";
        case VaultError::STALE_VALUATION: return "StaleValuation";
    }
    return "Unknown";
}

inline const char* to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NONE: return "None";
        case ErrorCategory::AUTHORIZATION: return "AuthorizationError";
        case ErrorCategory::STATE: return "StateError";
        case ErrorCategory::ARITHMETIC: return "ArithmeticError";
        case ErrorCategory::LIQUIDITY: return "LiquidityError";
        case ErrorCategory::VALUATION: return "ValuationError";
        case ErrorCategory::NOT_FOUND: return "NotFound";
    }
    return "Unknown";
}

// Human-readable message for API responses.
inline const char* describe(VaultError e) {
    switch (e) {
        case VaultError::OK: return "ok";
        case VaultError::UNAUTHORIZED: return "caller lacks the required role";
        case VaultError::INVALID_IDENTITY: return "identity must not be empty";
        case VaultError::PAUSED: return "protocol is paused";
        case VaultError::ALREADY_INITIALIZED: return "protocol is already initialized";
        case VaultError::NOT_INITIALIZED: return "protocol is not initialized";
        case VaultError::ZERO_AMOUNT: return "amount must be greater than zero";
        case VaultError::INVALID_AMOUNT: return "amount is inconsistent with the reported pnl";
        case VaultError::INVALID_FEE_BPS: return "performance fee must be at most 10000 bps";
        case VaultError::NOTHING_TO_SWEEP: return "no accumulated fees";
        case VaultError::UNDEFINED_NAV: return "share price is undefined";
        case VaultError::POSITION_EXISTS: return "position already exists";
        case VaultError::INSUFFICIENT_SHARES: return "not enough shares";
        case VaultError::SLIPPAGE_EXCEEDED: return "result outside the caller's bound";
        case VaultError::INVARIANT_VIOLATION: return "ledger invariant check failed";
        case VaultError::POSITION_NOT_FOUND: return "position not found";
        case VaultError::MATH_OVERFLOW: return "arithmetic overflow";
        case VaultError::INSUFFICIENT_LIQUIDITY: return "not enough idle funds";
        case VaultError::EXCEEDS_DEPLOYMENT_LIMIT: return "deployment ceiling exceeded";
        case VaultError::RETURN_EXCEEDS_DEPLOYED: return "returned principal exceeds deployed capital";
        case VaultError::INVALID_VALUATION: return "valuation report rejected";
        case VaultError::NON_MONOTONIC_VALUATION: return "valuation timestamp is older than the last one";
        case VaultError::STALE_VALUATION: return "valuation is stale";
    }
    return "unknown error";
}

/**
 * Value-or-error return of every ledger operation.
 * A failed Result carries no value; callers must check ok() first.
 */
template <typename T>
class Result {
public:
    Result(T value) : error_(VaultError::OK), value_(std::move(value)) {}
    Result(VaultError error) : error_(error), value_{} {}

    bool ok() const { return error_ == VaultError::OK; }
    explicit operator bool() const { return ok(); }
    VaultError error() const { return error_; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    const T& operator*() const { return value_; }
    const T* operator->() const { return &value_; }

private:
    VaultError error_;
    T value_;
};

} // namespace vault_ledger
