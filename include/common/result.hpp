#pragma once

#include <string>
#include <utility>

namespace btcfi {

/**
 * Error codes returned by every mutating operation.
 * A non-NONE code always means no state was changed by the call.
 */
enum class ErrorCode {
    NONE,

    // Validation (caller input)
    INVALID_STRIKE,
    INVALID_QUANTITY,
    INVALID_PREMIUM,
    INVALID_EXPIRY,
    INVALID_AMOUNT,
    BELOW_MINIMUM_DEPOSIT,
    INVALID_SPOT_PRICE,
    INVALID_ADDRESS,
    DUPLICATE_CONTRACT,

    // Liquidity
    INSUFFICIENT_LIQUIDITY,
    INSUFFICIENT_AVAILABLE_LIQUIDITY,
    INSUFFICIENT_SHARES,
    INSUFFICIENT_LOCKED_COLLATERAL,
    INSUFFICIENT_FUNDS,
    POOL_INSOLVENT,

    // Lookup
    CONTRACT_NOT_FOUND,
    REQUEST_NOT_FOUND,

    // State / ordering
    ALREADY_SETTLED,
    NOT_ACTIVE,
    NOT_EXPIRED,
    NOT_FUNDED,
    PROOF_NOT_SUBMITTED,
    INVALID_REQUEST_STATE,

    // Proof validation (untrusted input disagreed with our accounting)
    OPTION_ID_MISMATCH,
    COMMITMENT_MISMATCH,
    AMOUNT_MISMATCH,
    ITM_FLAG_MISMATCH,
    SPOT_PRICE_MISMATCH,
    PROOF_TOO_LARGE,

    // Construction
    TAPROOT_CONSTRUCTION_FAILED
};

enum class ErrorCategory {
    NONE,
    VALIDATION,
    LIQUIDITY,
    LOOKUP,
    STATE,
    PROOF,
    CONSTRUCTION
};

inline std::string error_to_string(ErrorCode e) {
    switch (e) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::INVALID_STRIKE: return "INVALID_STRIKE";
        case ErrorCode::INVALID_QUANTITY: return "INVALID_QUANTITY";
        case ErrorCode::INVALID_PREMIUM: return "INVALID_PREMIUM";
        case ErrorCode::INVALID_EXPIRY: return "INVALID_EXPIRY";
        case ErrorCode::INVALID_AMOUNT: return "INVALID_AMOUNT";
        case ErrorCode::BELOW_MINIMUM_DEPOSIT: return "BELOW_MINIMUM_DEPOSIT";
        case ErrorCode::INVALID_SPOT_PRICE: return "INVALID_SPOT_PRICE";
        case ErrorCode::INVALID_ADDRESS: return "INVALID_ADDRESS";
        case ErrorCode::DUPLICATE_CONTRACT: return "DUPLICATE_CONTRACT";
        case ErrorCode::INSUFFICIENT_LIQUIDITY: return "INSUFFICIENT_LIQUIDITY";
        case ErrorCode::INSUFFICIENT_AVAILABLE_LIQUIDITY: return "INSUFFICIENT_AVAILABLE_LIQUIDITY";
        case ErrorCode::INSUFFICIENT_SHARES: return "INSUFFICIENT_SHARES";
        case ErrorCode::INSUFFICIENT_LOCKED_COLLATERAL: return "INSUFFICIENT_LOCKED_COLLATERAL";
        case ErrorCode::INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
        case ErrorCode::POOL_INSOLVENT: return "POOL_INSOLVENT";
        case ErrorCode::CONTRACT_NOT_FOUND: return "CONTRACT_NOT_FOUND";
        case ErrorCode::REQUEST_NOT_FOUND: return "REQUEST_NOT_FOUND";
        case ErrorCode::ALREADY_SETTLED: return "ALREADY_SETTLED";
        case ErrorCode::NOT_ACTIVE: return "NOT_ACTIVE";
        case ErrorCode::NOT_EXPIRED: return "NOT_EXPIRED";
        case ErrorCode::NOT_FUNDED: return "NOT_FUNDED";
        case ErrorCode::PROOF_NOT_SUBMITTED: return "PROOF_NOT_SUBMITTED";
        case ErrorCode::INVALID_REQUEST_STATE: return "INVALID_REQUEST_STATE";
        case ErrorCode::OPTION_ID_MISMATCH: return "OPTION_ID_MISMATCH";
        case ErrorCode::COMMITMENT_MISMATCH: return "COMMITMENT_MISMATCH";
        case ErrorCode::AMOUNT_MISMATCH: return "AMOUNT_MISMATCH";
        case ErrorCode::ITM_FLAG_MISMATCH: return "ITM_FLAG_MISMATCH";
        case ErrorCode::SPOT_PRICE_MISMATCH: return "SPOT_PRICE_MISMATCH";
        case ErrorCode::PROOF_TOO_LARGE: return "PROOF_TOO_LARGE";
        case ErrorCode::TAPROOT_CONSTRUCTION_FAILED: return "TAPROOT_CONSTRUCTION_FAILED";
    }
    return "UNKNOWN";
}

inline ErrorCategory error_category(ErrorCode e) {
    switch (e) {
        case ErrorCode::NONE:
            return ErrorCategory::NONE;
        case ErrorCode::INVALID_STRIKE:
        case ErrorCode::INVALID_QUANTITY:
        case ErrorCode::INVALID_PREMIUM:
        case ErrorCode::INVALID_EXPIRY:
        case ErrorCode::INVALID_AMOUNT:
        case ErrorCode::BELOW_MINIMUM_DEPOSIT:
        case ErrorCode::INVALID_SPOT_PRICE:
        case ErrorCode::INVALID_ADDRESS:
        case ErrorCode::DUPLICATE_CONTRACT:
            return ErrorCategory::VALIDATION;
        case ErrorCode::INSUFFICIENT_LIQUIDITY:
        case ErrorCode::INSUFFICIENT_AVAILABLE_LIQUIDITY:
        case ErrorCode::INSUFFICIENT_SHARES:
        case ErrorCode::INSUFFICIENT_LOCKED_COLLATERAL:
        case ErrorCode::INSUFFICIENT_FUNDS:
        case ErrorCode::POOL_INSOLVENT:
            return ErrorCategory::LIQUIDITY;
        case ErrorCode::CONTRACT_NOT_FOUND:
        case ErrorCode::REQUEST_NOT_FOUND:
            return ErrorCategory::LOOKUP;
        case ErrorCode::ALREADY_SETTLED:
        case ErrorCode::NOT_ACTIVE:
        case ErrorCode::NOT_EXPIRED:
        case ErrorCode::NOT_FUNDED:
        case ErrorCode::PROOF_NOT_SUBMITTED:
        case ErrorCode::INVALID_REQUEST_STATE:
            return ErrorCategory::STATE;
        case ErrorCode::OPTION_ID_MISMATCH:
        case ErrorCode::COMMITMENT_MISMATCH:
        case ErrorCode::AMOUNT_MISMATCH:
        case ErrorCode::ITM_FLAG_MISMATCH:
        case ErrorCode::SPOT_PRICE_MISMATCH:
        case ErrorCode::PROOF_TOO_LARGE:
            return ErrorCategory::PROOF;
        case ErrorCode::TAPROOT_CONSTRUCTION_FAILED:
            return ErrorCategory::CONSTRUCTION;
    }
    return ErrorCategory::NONE;
}

/**
 * Outcome of an operation that returns no value.
 */
struct Status {
    ErrorCode error{ErrorCode::NONE};
    std::string reason;

    bool ok() const { return error == ErrorCode::NONE; }
    explicit operator bool() const { return ok(); }

    static Status success() { return Status{}; }
    static Status failure(ErrorCode code, std::string why) {
        return Status{code, std::move(why)};
    }
};

/**
 * Outcome of an operation that produces a value on success.
 * `value` is default constructed when the call failed.
 */
template <typename T>
struct Result {
    ErrorCode error{ErrorCode::NONE};
    std::string reason;
    T value{};

    bool ok() const { return error == ErrorCode::NONE; }
    explicit operator bool() const { return ok(); }

    Status status() const { return Status{error, reason}; }

    static Result success(T v) {
        Result r;
        r.value = std::move(v);
        return r;
    }

    static Result failure(ErrorCode code, std::string why) {
        Result r;
        r.error = code;
        r.reason = std::move(why);
        return r;
    }

    static Result failure(const Status& s) {
        return failure(s.error, s.reason);
    }
};

} // namespace btcfi
