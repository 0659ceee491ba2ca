#pragma once

/**
 * Matching Engine
 *
 * Consumes one request at a time against the persisted book:
 *
 *   Validate -> Match -> Post-or-Discard -> Emit
 *
 * - Price-time priority: the opposite side is walked best-first, fills
 *   execute at the resting order's price
 * - One Fill event per side of every trade; an Out event for every order
 *   (or unfilled remainder) that leaves or never reaches the book
 * - Balance effects on makers are deferred to event consumption; the
 *   taker's funds were locked before the request was queued
 * - Bounded: at most `max_match_steps` resting orders are touched per
 *   order, needing more fails with WOULD_EXCEED_BUDGET
 *
 * Every error leaves partial writes in the region; the caller restores
 * its snapshot.
 */

#include <cstdint>

#include "common.hpp"
#include "error.hpp"
#include "events.hpp"
#include "market_state.hpp"
#include "open_orders.hpp"

namespace strata::engine {

/**
 * What a processed order did, reported back to the host
 */
struct OrderResult {
    OrderKey order_id{};
    Quantity base_filled{0};
    Quantity posted_quantity{0};
    uint64_t native_quote_paid{0};      // Bids: notional + fees
    uint64_t native_quote_received{0};  // Asks: notional - fees
    uint64_t referrer_rebate{0};        // Accrued on the taker's record for its referrer
    uint32_t match_steps{0};
};

class Matcher {
public:
    explicit Matcher(market::MarketState& market) noexcept : market_(market) {}

    /**
     * Funds an order must lock before it is queued:
     * asks lock max_base_qty base lots, bids lock the smaller of
     * max_quote_qty and the notional at the limit price plus taker fee,
     * plus one quote unit of rounding per fill the order could make.
     */
    [[nodiscard]] static ErrorCode required_lock(const market::MarketHeader& header, Side side,
                                                 Price limit_price, Quantity max_base_qty,
                                                 uint64_t max_quote_qty, uint8_t fee_tier,
                                                 uint64_t& lock_out) noexcept;

    /**
     * Validate order parameters against the market (no state change)
     */
    [[nodiscard]] static ErrorCode validate_order(const market::MarketHeader& header,
                                                  const queue::Request& request) noexcept;

    /**
     * Process a queued NewOrder. For bids `request.max_quote_qty` is the
     * quote amount already locked for it.
     */
    [[nodiscard]] ErrorCode new_order(const queue::Request& request, market::OpenOrders& taker,
                                      OrderResult& result) noexcept;

    /**
     * Process a queued CancelOrder: pull the order off the book and
     * emit its Out event (the slot is released when that event is consumed)
     */
    [[nodiscard]] ErrorCode cancel_order(const queue::Request& request,
                                         market::OpenOrders& owner) noexcept;

private:
    struct TakerState;

    [[nodiscard]] ErrorCode fill(TakerState& taker, slab::LeafNode& maker, Quantity quantity) noexcept;
    [[nodiscard]] ErrorCode cancel_resting(Side side, const slab::LeafNode& resting) noexcept;
    [[nodiscard]] ErrorCode decrement_resting(Side side, slab::LeafNode& resting, Quantity quantity) noexcept;
    [[nodiscard]] ErrorCode discard_remainder(const TakerState& taker) noexcept;
    [[nodiscard]] ErrorCode post_remainder(TakerState& taker, market::OpenOrders& owner) noexcept;
    [[nodiscard]] ErrorCode resting_lock(Side side, Price price, Quantity quantity,
                                         uint64_t& out) const noexcept;
    [[nodiscard]] ErrorCode emit(const queue::Event& event) noexcept;

    market::MarketState& market_;
};

/**
 * Largest quantity a bid with `quote_available` can buy at `price`
 * including the taker fee
 */
[[nodiscard]] Quantity max_affordable_quantity(Price price, uint64_t quote_lot_size,
                                               uint64_t quote_available, uint32_t taker_fee_bps) noexcept;

} // namespace strata::engine
