#include "strata/error.hpp"

namespace strata {

const char* error_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_INSTRUCTION: return "INVALID_INSTRUCTION";
        case ErrorCode::INVALID_PRICE: return "INVALID_PRICE";
        case ErrorCode::INVALID_QUANTITY: return "INVALID_QUANTITY";
        case ErrorCode::INVALID_LOT_SIZE: return "INVALID_LOT_SIZE";
        case ErrorCode::INVALID_DECIMALS: return "INVALID_DECIMALS";
        case ErrorCode::INVALID_FEE_TIER: return "INVALID_FEE_TIER";
        case ErrorCode::INVALID_CAPACITY: return "INVALID_CAPACITY";
        case ErrorCode::INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
        case ErrorCode::UNAUTHORIZED: return "UNAUTHORIZED";
        case ErrorCode::DUPLICATE_ACCOUNT: return "DUPLICATE_ACCOUNT";
        case ErrorCode::ACCOUNT_MISMATCH: return "ACCOUNT_MISMATCH";
        case ErrorCode::INVALID_REFERRER: return "INVALID_REFERRER";
        case ErrorCode::SLAB_FULL: return "SLAB_FULL";
        case ErrorCode::REQUEST_QUEUE_FULL: return "REQUEST_QUEUE_FULL";
        case ErrorCode::EVENT_QUEUE_FULL: return "EVENT_QUEUE_FULL";
        case ErrorCode::TOO_MANY_OPEN_ORDERS: return "TOO_MANY_OPEN_ORDERS";
        case ErrorCode::REGION_TOO_SMALL: return "REGION_TOO_SMALL";
        case ErrorCode::ORDER_NOT_FOUND: return "ORDER_NOT_FOUND";
        case ErrorCode::MARKET_NOT_INITIALIZED: return "MARKET_NOT_INITIALIZED";
        case ErrorCode::MARKET_ALREADY_INITIALIZED: return "MARKET_ALREADY_INITIALIZED";
        case ErrorCode::OPEN_ORDERS_NOT_INITIALIZED: return "OPEN_ORDERS_NOT_INITIALIZED";
        case ErrorCode::OPEN_ORDERS_ALREADY_INITIALIZED: return "OPEN_ORDERS_ALREADY_INITIALIZED";
        case ErrorCode::OPEN_ORDERS_NOT_EMPTY: return "OPEN_ORDERS_NOT_EMPTY";
        case ErrorCode::MISSING_OPEN_ORDERS: return "MISSING_OPEN_ORDERS";
        case ErrorCode::DUPLICATE_KEY: return "DUPLICATE_KEY";
        case ErrorCode::BOOK_CROSSED: return "BOOK_CROSSED";
        case ErrorCode::WOULD_SELF_TRADE: return "WOULD_SELF_TRADE";
        case ErrorCode::REENTRANT_INVOCATION: return "REENTRANT_INVOCATION";
        case ErrorCode::CORRUPT_STATE: return "CORRUPT_STATE";
        case ErrorCode::ARITHMETIC_OVERFLOW: return "ARITHMETIC_OVERFLOW";
        case ErrorCode::WOULD_EXCEED_BUDGET: return "WOULD_EXCEED_BUDGET";
    }
    return "UNKNOWN";
}

const char* category_name(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::NONE: return "None";
        case ErrorCategory::VALIDATION: return "ValidationError";
        case ErrorCategory::CAPACITY: return "CapacityError";
        case ErrorCategory::STATE: return "StateError";
        case ErrorCategory::ARITHMETIC: return "ArithmeticError";
        case ErrorCategory::BUDGET: return "BudgetError";
    }
    return "Unknown";
}

} // namespace strata
