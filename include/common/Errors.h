#pragma once

#include <string>
#include <utility>

namespace stratvault {

enum class ErrorCode {
    NONE,

    // validation: rejected before any mutation
    INVALID_ASSET_PAIR,
    FEE_TOO_HIGH,
    BELOW_MINIMUM,
    ABOVE_MAXIMUM,
    INVALID_AMOUNT,
    INVALID_PARAMS,

    // state: caller must re-query
    NOT_ACTIVE,
    ALREADY_ACTIVE,
    INVALID_STATUS_TRANSITION,
    OPPORTUNITY_EXPIRED,
    OPPORTUNITY_NOT_FOUND,
    STRATEGY_NOT_FOUND,
    UNSUPPORTED_STRATEGY_TYPE,
    PRICE_UNAVAILABLE,

    // consistency
    INSUFFICIENT_SHARES,

    // concurrency: retryable
    BUSY,

    UNAUTHORIZED,

    // ledger already committed, needs reconciliation
    SETTLEMENT_FAILED,

    EXECUTION_FAILED
};

enum class ErrorCategory {
    NONE,
    VALIDATION,
    STATE,
    CONSISTENCY,
    CONCURRENCY,
    AUTHORIZATION,
    SETTLEMENT,
    EXECUTION
};

const char* toString(ErrorCode code);
ErrorCategory categoryOf(ErrorCode code);

inline bool isRetryable(ErrorCode code) {
    return code == ErrorCode::BUSY;
}

struct OpResult {
    ErrorCode error = ErrorCode::NONE;
    std::string message;

    bool ok() const { return error == ErrorCode::NONE; }
    bool retryable() const { return isRetryable(error); }

    static OpResult success() { return OpResult{}; }
    static OpResult failure(ErrorCode code, std::string msg = {}) {
        OpResult r;
        r.error = code;
        r.message = std::move(msg);
        return r;
    }
};

template <typename T>
struct ValueResult : OpResult {
    T value{};

    ValueResult() = default;
    ValueResult(const OpResult& status) : OpResult(status) {}

    static ValueResult of(T v) {
        ValueResult r;
        r.value = std::move(v);
        return r;
    }
};

} // namespace stratvault
