#include "common/Errors.h"

namespace stratvault {

const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "None";
        case ErrorCode::INVALID_ASSET_PAIR: return "InvalidAssetPair";
        case ErrorCode::FEE_TOO_HIGH: return "FeeTooHigh";
        case ErrorCode::BELOW_MINIMUM: return "BelowMinimum";
        case ErrorCode::ABOVE_MAXIMUM: return "AboveMaximum";
        case ErrorCode::INVALID_AMOUNT: return "InvalidAmount";
        case ErrorCode::INVALID_PARAMS: return "InvalidParams";
        case ErrorCode::NOT_ACTIVE: return "NotActive";
        case ErrorCode::ALREADY_ACTIVE: return "AlreadyActive";
        case ErrorCode::INVALID_STATUS_TRANSITION: return "InvalidStatusTransition";
        case ErrorCode::OPPORTUNITY_EXPIRED: return "OpportunityExpired";
        case ErrorCode::OPPORTUNITY_NOT_FOUND: return "OpportunityNotFound";
        case ErrorCode::STRATEGY_NOT_FOUND: return "StrategyNotFound";
        case ErrorCode::UNSUPPORTED_STRATEGY_TYPE: return "UnsupportedStrategyType";
        case ErrorCode::PRICE_UNAVAILABLE: return "PriceUnavailable";
        case ErrorCode::INSUFFICIENT_SHARES: return "InsufficientShares";
        case ErrorCode::BUSY: return "Busy";
        case ErrorCode::UNAUTHORIZED: return "Unauthorized";
        case ErrorCode::SETTLEMENT_FAILED: return "SettlementFailed";
        case ErrorCode::EXECUTION_FAILED: return "ExecutionFailed";
    }
    return "Unknown";
}

ErrorCategory categoryOf(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return ErrorCategory::NONE;
        case ErrorCode::INVALID_ASSET_PAIR:
        case ErrorCode::FEE_TOO_HIGH:
        case ErrorCode::BELOW_MINIMUM:
        case ErrorCode::ABOVE_MAXIMUM:
        case ErrorCode::INVALID_AMOUNT:
        case ErrorCode::INVALID_PARAMS:
            return ErrorCategory::VALIDATION;
        case ErrorCode::NOT_ACTIVE:
        case ErrorCode::ALREADY_ACTIVE:
        case ErrorCode::INVALID_STATUS_TRANSITION:
        case ErrorCode::OPPORTUNITY_EXPIRED:
        case ErrorCode::OPPORTUNITY_NOT_FOUND:
        case ErrorCode::STRATEGY_NOT_FOUND:
        case ErrorCode::UNSUPPORTED_STRATEGY_TYPE:
        case ErrorCode::PRICE_UNAVAILABLE:
            return ErrorCategory::STATE;
        case ErrorCode::INSUFFICIENT_SHARES:
            return ErrorCategory::CONSISTENCY;
        case ErrorCode::BUSY:
            return ErrorCategory::CONCURRENCY;
        case ErrorCode::UNAUTHORIZED:
            return ErrorCategory::AUTHORIZATION;
        case ErrorCode::SETTLEMENT_FAILED:
            return ErrorCategory::SETTLEMENT;
        case ErrorCode::EXECUTION_FAILED:
            return ErrorCategory::EXECUTION;
    }
    return ErrorCategory::NONE;
}

} // namespace stratvault
