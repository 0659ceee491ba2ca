#pragma once

/**
 * Fixed-layout records carried by the request and event queues.
 * Both are persisted byte-for-byte; their layout is part of the host contract.
 */

#include <cstdint>

#include "common.hpp"

namespace strata::queue {

// =============================================================================
// EVENTS
// =============================================================================

enum class EventKind : uint8_t { FILL = 0, OUT = 1 };

enum EventFlags : uint8_t {
    EVENT_FLAG_NONE = 0,
    EVENT_FLAG_MAKER = 1 << 0,
    EVENT_FLAG_BID = 1 << 1,
    EVENT_FLAG_PARTIAL = 1 << 2     // Out: order stays on the book with less quantity
};

/**
 * Fill: one side of a trade. `native_qty_paid` leaves the owner's total,
 *       `native_qty_received` is credited (free and total). For a maker bid
 *       the rebate is credited in quote on top of the base received.
 * Out:  an order (or the unfilled part of one) left the book.
 *       `quantity` is the quantity taken out, `native_qty_paid` is the
 *       amount unlocked back to free balance.
 */
struct Event {
    EventKind kind;
    uint8_t flags;
    uint8_t owner_slot;
    uint8_t fee_tier;
    uint32_t reserved;
    SeqNum seq_num;
    OrderKey order_id;
    OrderKey counterparty_id;
    OwnerId owner;
    uint64_t client_order_id;
    Price price;
    Quantity quantity;
    uint64_t native_qty_paid;
    uint64_t native_qty_received;
    uint64_t native_fee_or_rebate;

    [[nodiscard]] bool is_maker() const noexcept { return (flags & EVENT_FLAG_MAKER) != 0; }
    [[nodiscard]] bool is_partial() const noexcept { return (flags & EVENT_FLAG_PARTIAL) != 0; }
    [[nodiscard]] Side side() const noexcept {
        return (flags & EVENT_FLAG_BID) != 0 ? Side::BID : Side::ASK;
    }

    [[nodiscard]] static Event fill(Side side, bool maker, const OrderKey& order_id,
                                    const OrderKey& counterparty_id, OwnerId owner,
                                    uint8_t owner_slot, uint8_t fee_tier,
                                    uint64_t client_order_id, Price price, Quantity quantity,
                                    uint64_t paid, uint64_t received, uint64_t fee_or_rebate) noexcept {
        Event e{};
        e.kind = EventKind::FILL;
        e.flags = static_cast<uint8_t>((maker ? EVENT_FLAG_MAKER : 0) |
                                       (side == Side::BID ? EVENT_FLAG_BID : 0));
        e.owner_slot = owner_slot;
        e.fee_tier = fee_tier;
        e.order_id = order_id;
        e.counterparty_id = counterparty_id;
        e.owner = owner;
        e.client_order_id = client_order_id;
        e.price = price;
        e.quantity = quantity;
        e.native_qty_paid = paid;
        e.native_qty_received = received;
        e.native_fee_or_rebate = fee_or_rebate;
        return e;
    }

    [[nodiscard]] static Event out(Side side, bool partial, const OrderKey& order_id, OwnerId owner,
                                   uint8_t owner_slot, uint64_t client_order_id, Price price,
                                   Quantity quantity, uint64_t released) noexcept {
        Event e{};
        e.kind = EventKind::OUT;
        e.flags = static_cast<uint8_t>((side == Side::BID ? EVENT_FLAG_BID : 0) |
                                       (partial ? EVENT_FLAG_PARTIAL : 0));
        e.owner_slot = owner_slot;
        e.order_id = order_id;
        e.owner = owner;
        e.client_order_id = client_order_id;
        e.price = price;
        e.quantity = quantity;
        e.native_qty_paid = released;
        return e;
    }
};

static_assert(sizeof(Event) == 104, "Event layout changed");

// =============================================================================
// REQUESTS
// =============================================================================

enum class RequestKind : uint8_t { NEW_ORDER = 0, CANCEL_ORDER = 1 };

struct Request {
    RequestKind kind;
    Side side;
    OrderType order_type;
    SelfTradeBehavior self_trade;
    uint8_t fee_tier;
    uint8_t reserved;
    uint16_t match_limit;       // 0 = market default
    SeqNum seq_num;
    OrderKey order_id;          // Cancel target
    OwnerId owner;
    Price limit_price;
    Quantity max_base_qty;
    uint64_t max_quote_qty;     // Native quote including fees (bids)
    uint64_t client_order_id;
};

static_assert(sizeof(Request) == 72, "Request layout changed");

} // namespace strata::queue
