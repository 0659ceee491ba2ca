#pragma once

/**
 * Result codes returned by every instruction.
 *
 * The host persists the market region only when an invocation returns OK;
 * any other code means the invocation's effects were rolled back.
 * Codes are grouped by hundreds: 1xx validation, 2xx capacity, 3xx state,
 * 4xx arithmetic, 5xx budget.
 */

#include <cstdint>

namespace strata {

enum class ErrorCategory : uint8_t {
    NONE = 0,
    VALIDATION = 1,
    CAPACITY = 2,
    STATE = 3,
    ARITHMETIC = 4,
    BUDGET = 5
};

enum class ErrorCode : uint32_t {
    OK = 0,

    // Validation
    INVALID_INSTRUCTION = 100,
    INVALID_PRICE = 101,
    INVALID_QUANTITY = 102,
    INVALID_LOT_SIZE = 103,
    INVALID_DECIMALS = 104,
    INVALID_FEE_TIER = 105,
    INVALID_CAPACITY = 106,
    INSUFFICIENT_FUNDS = 107,
    UNAUTHORIZED = 108,
    DUPLICATE_ACCOUNT = 109,
    ACCOUNT_MISMATCH = 110,
    INVALID_REFERRER = 111,

    // Capacity
    SLAB_FULL = 200,
    REQUEST_QUEUE_FULL = 201,
    EVENT_QUEUE_FULL = 202,
    TOO_MANY_OPEN_ORDERS = 203,
    REGION_TOO_SMALL = 204,

    // State
    ORDER_NOT_FOUND = 300,
    MARKET_NOT_INITIALIZED = 301,
    MARKET_ALREADY_INITIALIZED = 302,
    OPEN_ORDERS_NOT_INITIALIZED = 303,
    OPEN_ORDERS_ALREADY_INITIALIZED = 304,
    OPEN_ORDERS_NOT_EMPTY = 305,
    MISSING_OPEN_ORDERS = 306,
    DUPLICATE_KEY = 307,
    BOOK_CROSSED = 308,
    WOULD_SELF_TRADE = 309,
    REENTRANT_INVOCATION = 310,
    CORRUPT_STATE = 311,

    // Arithmetic
    ARITHMETIC_OVERFLOW = 400,

    // Budget
    WOULD_EXCEED_BUDGET = 500
};

[[nodiscard]] constexpr ErrorCategory category_of(ErrorCode code) noexcept {
    const uint32_t group = static_cast<uint32_t>(code) / 100;
    return group <= 5 ? static_cast<ErrorCategory>(group) : ErrorCategory::NONE;
}

[[nodiscard]] constexpr bool ok(ErrorCode code) noexcept {
    return code == ErrorCode::OK;
}

[[nodiscard]] const char* error_name(ErrorCode code) noexcept;
[[nodiscard]] const char* category_name(ErrorCategory category) noexcept;

} // namespace strata
