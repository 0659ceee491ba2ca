#pragma once

/**
 * Instruction set
 *
 * Wire format: one tag byte, then the instruction's fields in declaration
 * order as fixed-width little-endian integers. Enums are single bytes.
 * Missing bytes, trailing bytes, unknown tags and out-of-range enum values
 * all decode to INVALID_INSTRUCTION.
 */

#include <cstddef>
#include <cstdint>
#include <variant>

#include "common.hpp"
#include "error.hpp"
#include "market_state.hpp"

namespace strata::codec {

enum class InstructionTag : uint8_t {
    INIT_MARKET = 0,
    NEW_ORDER = 1,
    CANCEL_ORDER = 2,
    CONSUME_EVENTS = 3,
    SETTLE_FUNDS = 4,
    CANCEL_ORDER_BY_CLIENT_ID = 5,
    INIT_OPEN_ORDERS = 6,
    CLOSE_OPEN_ORDERS = 7,
    PRUNE = 8,
    SWEEP_FEES = 9,
    MATCH_ORDERS = 10,
    CONSUME_EVENTS_PERMISSIONED = 11
};

// =============================================================================
// INSTRUCTIONS
// =============================================================================

struct InitMarket {
    market::MarketConfig config;
};

struct NewOrder {
    OwnerId owner{0};
    Side side{Side::BID};
    OrderType order_type{OrderType::LIMIT};
    SelfTradeBehavior self_trade{SelfTradeBehavior::DECREMENT_AND_CANCEL};
    uint8_t fee_tier{0};
    uint16_t match_limit{0};        // 0 = market default
    Price limit_price{0};           // Quote lots per base lot
    Quantity max_base_qty{0};       // Base lots
    uint64_t max_quote_qty{0};      // Native quote including fees (bids)
    uint64_t client_order_id{0};
};

struct CancelOrder {
    OwnerId owner{0};
    OrderKey order_id{};
};

struct CancelOrderByClientId {
    OwnerId owner{0};
    uint64_t client_order_id{0};
};

struct ConsumeEvents {
    uint16_t limit{0};
};

struct SettleFunds {
    OwnerId owner{0};
    uint64_t referrer{0};           // 0 = no referrer, rebates go to the fee pool
};

struct InitOpenOrders {
    OwnerId owner{0};
    uint64_t authority{0};
};

struct CloseOpenOrders {
    OwnerId owner{0};
};

struct Prune {
    OwnerId owner{0};
    uint16_t limit{0};
};

struct SweepFees {};

struct MatchOrders {
    uint16_t limit{0};
};

// ConsumeEvents restricted to the market's consume authority
struct ConsumeEventsPermissioned {
    uint16_t limit{0};
};

// Alternative index == tag value
using Instruction = std::variant<
    InitMarket,
    NewOrder,
    CancelOrder,
    ConsumeEvents,
    SettleFunds,
    CancelOrderByClientId,
    InitOpenOrders,
    CloseOpenOrders,
    Prune,
    SweepFees,
    MatchOrders,
    ConsumeEventsPermissioned
>;

static constexpr size_t MAX_INSTRUCTION_SIZE = 160;

[[nodiscard]] inline InstructionTag tag_of(const Instruction& instruction) noexcept {
    return static_cast<InstructionTag>(instruction.index());
}

[[nodiscard]] const char* instruction_name(InstructionTag tag) noexcept;

/**
 * Encode into `buffer`
 * @return bytes written, 0 if the buffer is too small
 */
[[nodiscard]] size_t encode(const Instruction& instruction, uint8_t* buffer, size_t capacity) noexcept;

[[nodiscard]] ErrorCode decode(const uint8_t* data, size_t length, Instruction& out) noexcept;

} // namespace strata::codec
