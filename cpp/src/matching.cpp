#include "strata/matching.hpp"

#include <algorithm>

#include "strata/checked_math.hpp"
#include "strata/logging.hpp"

namespace strata::engine {

using queue::Event;
using queue::Request;
using slab::LeafNode;

struct Matcher::TakerState {
    Side side;
    OrderKey key;
    OwnerId owner;
    uint8_t fee_tier;
    uint32_t taker_fee_bps;
    uint64_t client_order_id;
    Price limit_price;

    Quantity remaining;
    Quantity filled;
    Quantity posted;
    uint64_t quote_left;        // Bids: locked quote not yet spent
    uint64_t quote_paid;
    uint64_t quote_received;
    uint64_t referrer_rebate;   // Share of net fees owed to the taker's referrer
    uint32_t steps;
    bool stop_posting;          // Remainder must not rest
};

// =============================================================================
// VALIDATION AND LOCKING
// =============================================================================

ErrorCode Matcher::validate_order(const market::MarketHeader& header, const Request& request) noexcept {
    if (!is_valid(request.side) || !is_valid(request.order_type) || !is_valid(request.self_trade)) {
        return ErrorCode::INVALID_INSTRUCTION;
    }
    if (request.limit_price == 0) {
        return ErrorCode::INVALID_PRICE;
    }
    uint64_t per_lot = 0;
    if (!checked_mul(request.limit_price, header.quote_lot_size, per_lot)) {
        return ErrorCode::INVALID_PRICE;
    }
    if (request.max_base_qty == 0) {
        return ErrorCode::INVALID_QUANTITY;
    }
    if (request.side == Side::BID && request.max_quote_qty == 0) {
        return ErrorCode::INVALID_QUANTITY;
    }
    if (request.fee_tier >= header.fee_tier_count) {
        return ErrorCode::INVALID_FEE_TIER;
    }
    return ErrorCode::OK;
}

ErrorCode Matcher::required_lock(const market::MarketHeader& header, Side side, Price limit_price,
                                 Quantity max_base_qty, uint64_t max_quote_qty, uint8_t fee_tier,
                                 uint64_t& lock_out) noexcept {
    if (side == Side::ASK) {
        return checked_mul(max_base_qty, header.base_lot_size, lock_out)
            ? ErrorCode::OK : ErrorCode::ARITHMETIC_OVERFLOW;
    }

    if (fee_tier >= header.fee_tier_count) {
        return ErrorCode::INVALID_FEE_TIER;
    }

    // The fee is rounded up on every fill, so each possible fill may cost
    // one quote unit more than the fee on the whole notional
    const uint32_t taker_bps = header.fee_tiers[fee_tier].taker_fee_bps;
    const uint64_t rounding = taker_bps == 0
        ? 0 : std::min<uint64_t>(max_base_qty, header.max_match_steps);

    // An overflowing notional is necessarily above max_quote_qty
    lock_out = max_quote_qty;
    uint64_t notional = 0;
    uint64_t fee = 0;
    uint64_t gross = 0;
    if (checked_mul3(limit_price, max_base_qty, header.quote_lot_size, notional) &&
        fee_ceil(notional, taker_bps, fee) &&
        checked_add(notional, fee, gross) &&
        checked_add(gross, rounding, gross)) {
        lock_out = std::min(max_quote_qty, gross);
    }
    return ErrorCode::OK;
}

Quantity max_affordable_quantity(Price price, uint64_t quote_lot_size,
                                 uint64_t quote_available, uint32_t taker_fee_bps) noexcept {
    using u128 = detail::uint128;

    const u128 per_lot = static_cast<u128>(price) * quote_lot_size;
    if (per_lot == 0) {
        return 0;
    }
    const auto cost = [&](u128 qty) {
        const u128 notional = per_lot * qty;
        return notional + (notional * taker_fee_bps + BPS_DENOMINATOR - 1) / BPS_DENOMINATOR;
    };

    // Estimate from the fee-inclusive lot cost, then settle on the exact bound
    u128 qty = static_cast<u128>(quote_available) * BPS_DENOMINATOR
             / (per_lot * (BPS_DENOMINATOR + taker_fee_bps));
    while (qty > 0 && cost(qty) > quote_available) {
        --qty;
    }
    while (cost(qty + 1) <= quote_available) {
        ++qty;
    }
    return qty > UINT64_MAX ? UINT64_MAX : static_cast<Quantity>(qty);
}

ErrorCode Matcher::resting_lock(Side side, Price price, Quantity quantity, uint64_t& out) const noexcept {
    const market::MarketHeader& header = market_.header();
    const bool fits = side == Side::BID
        ? checked_mul3(price, quantity, header.quote_lot_size, out)
        : checked_mul(quantity, header.base_lot_size, out);
    return fits ? ErrorCode::OK : ErrorCode::ARITHMETIC_OVERFLOW;
}

ErrorCode Matcher::emit(const Event& event) noexcept {
    return market_.events().push(event);
}

// =============================================================================
// NEW ORDER
// =============================================================================

ErrorCode Matcher::new_order(const Request& request, market::OpenOrders& taker_account,
                             OrderResult& result) noexcept {
    const market::MarketHeader& header = market_.header();

    ErrorCode status = validate_order(header, request);
    if (!ok(status)) return status;
    if (request.owner != taker_account.owner()) {
        return ErrorCode::ACCOUNT_MISMATCH;
    }

    TakerState taker{};
    taker.side = request.side;
    taker.key = OrderKey::make(request.side, request.limit_price, market_.mint_order_seq());
    taker.owner = request.owner;
    taker.fee_tier = request.fee_tier;
    taker.taker_fee_bps = header.fee_tiers[request.fee_tier].taker_fee_bps;
    taker.client_order_id = request.client_order_id;
    taker.limit_price = request.limit_price;
    taker.remaining = request.max_base_qty;
    taker.quote_left = request.side == Side::BID ? request.max_quote_qty : 0;

    const Side maker_side = opposite(request.side);
    const uint32_t step_limit = request.match_limit == 0
        ? header.max_match_steps
        : std::min<uint32_t>(request.match_limit, header.max_match_steps);

    while (taker.remaining > 0) {
        LeafNode* maker = market_.book().best_mut(maker_side);
        if (maker == nullptr) break;

        const Price price = maker->key.price();
        const bool crosses = request.side == Side::BID ? request.limit_price >= price
                                                       : request.limit_price <= price;
        if (!crosses) break;

        if (request.order_type == OrderType::POST_ONLY) {
            taker.stop_posting = true;
            break;
        }

        if (STRATA_UNLIKELY(taker.steps == step_limit)) {
            logger().debug("order by owner {} needs more than {} match steps", taker.owner, step_limit);
            return ErrorCode::WOULD_EXCEED_BUDGET;
        }
        ++taker.steps;

        if (maker->owner == taker.owner) {
            const LeafNode resting = *maker;
            switch (request.self_trade) {
                case SelfTradeBehavior::ABORT_TRANSACTION:
                    return ErrorCode::WOULD_SELF_TRADE;

                case SelfTradeBehavior::CANCEL_OLDEST:
                    status = cancel_resting(maker_side, resting);
                    if (!ok(status)) return status;
                    continue;

                case SelfTradeBehavior::CANCEL_NEWEST:
                    taker.stop_posting = true;
                    break;

                case SelfTradeBehavior::DECREMENT_AND_CANCEL:
                    if (resting.quantity > taker.remaining) {
                        // Incoming is the smaller side: shrink the resting order, drop ours
                        status = decrement_resting(maker_side, *maker, taker.remaining);
                        if (!ok(status)) return status;
                        taker.stop_posting = true;
                        break;
                    }
                    status = cancel_resting(maker_side, resting);
                    if (!ok(status)) return status;
                    taker.remaining -= resting.quantity;
                    continue;
            }
            if (taker.stop_posting) break;
        }

        Quantity quantity = std::min(taker.remaining, maker->quantity);
        if (request.side == Side::BID) {
            const Quantity affordable = max_affordable_quantity(price, header.quote_lot_size,
                                                                taker.quote_left, taker.taker_fee_bps);
            if (affordable == 0) {
                taker.stop_posting = true;
                break;
            }
            quantity = std::min(quantity, affordable);
        }

        status = fill(taker, *maker, quantity);
        if (!ok(status)) return status;
    }

    if (taker.remaining > 0) {
        status = (taker.stop_posting || request.order_type == OrderType::IMMEDIATE_OR_CANCEL)
            ? discard_remainder(taker)
            : post_remainder(taker, taker_account);
        if (!ok(status)) return status;
    }

    // Hand back whatever the order no longer needs locked
    uint64_t release = 0;
    if (request.side == Side::BID) {
        release = taker.quote_left;
    } else {
        uint64_t used = 0;
        if (!checked_mul(taker.filled + taker.posted, header.base_lot_size, used) ||
            !checked_mul(request.max_base_qty, header.base_lot_size, release) || used > release) {
            return ErrorCode::ARITHMETIC_OVERFLOW;
        }
        release -= used;
    }
    if (release > 0) {
        status = taker_account.unlock(request.side == Side::BID ? Asset::QUOTE : Asset::BASE, release);
        if (!ok(status)) return status;
    }

    if (taker.referrer_rebate > 0) {
        status = taker_account.accrue_referrer_rebate(taker.referrer_rebate);
        if (!ok(status)) return status;
    }

    if (STRATA_UNLIKELY(market_.book().is_crossed())) {
        logger().error("book crossed after order {} of owner {}", taker.key.seq_num(taker.side), taker.owner);
        return ErrorCode::BOOK_CROSSED;
    }

    result.order_id = taker.key;
    result.base_filled = taker.filled;
    result.posted_quantity = taker.posted;
    result.native_quote_paid = taker.quote_paid;
    result.native_quote_received = taker.quote_received;
    result.referrer_rebate = taker.referrer_rebate;
    result.match_steps = taker.steps;
    return ErrorCode::OK;
}

ErrorCode Matcher::fill(TakerState& taker, LeafNode& maker, Quantity quantity) noexcept {
    market::MarketHeader& header = market_.header();
    const Price price = maker.key.price();
    const Side maker_side = opposite(taker.side);

    uint64_t notional = 0;
    uint64_t base_native = 0;
    if (!checked_mul3(price, quantity, header.quote_lot_size, notional) ||
        !checked_mul(quantity, header.base_lot_size, base_native)) {
        return ErrorCode::ARITHMETIC_OVERFLOW;
    }

    const market::FeeTier* maker_tier = market_.fee_tier(maker.fee_tier);
    if (maker_tier == nullptr) {
        return ErrorCode::CORRUPT_STATE;
    }
    uint64_t taker_fee = 0;
    uint64_t rebate = 0;
    if (!fee_ceil(notional, taker.taker_fee_bps, taker_fee) ||
        !fee_floor(notional, maker_tier->maker_rebate_bps, rebate)) {
        return ErrorCode::ARITHMETIC_OVERFLOW;
    }
    if (rebate > taker_fee) {
        return ErrorCode::CORRUPT_STATE;
    }
    uint64_t referrer_share = 0;
    uint64_t accrued = 0;
    uint64_t referrer_total = 0;
    if (!fee_floor(taker_fee - rebate, header.referrer_rebate_bps, referrer_share) ||
        !checked_add(header.quote_fees_accrued, taker_fee - rebate - referrer_share, accrued) ||
        !checked_add(taker.referrer_rebate, referrer_share, referrer_total)) {
        return ErrorCode::ARITHMETIC_OVERFLOW;
    }

    uint64_t maker_paid = 0;
    uint64_t maker_received = 0;
    uint64_t taker_paid = 0;
    uint64_t taker_received = 0;
    if (taker.side == Side::BID) {
        if (!checked_add(notional, taker_fee, taker_paid) ||
            !checked_add(notional, rebate, maker_received)) {
            return ErrorCode::ARITHMETIC_OVERFLOW;
        }
        if (taker_paid > taker.quote_left) {
            return ErrorCode::CORRUPT_STATE;
        }
        taker_received = base_native;
        maker_paid = base_native;
        taker.quote_left -= taker_paid;
        taker.quote_paid += taker_paid;
    } else {
        taker_paid = base_native;
        taker_received = notional - taker_fee;
        maker_paid = notional;
        maker_received = base_native;
        taker.quote_received += taker_received;
    }

    header.quote_fees_accrued = accrued;
    taker.referrer_rebate = referrer_total;
    maker.quantity -= quantity;
    taker.remaining -= quantity;
    taker.filled += quantity;

    logger().trace("fill {} @ {} maker owner {} taker owner {}", quantity, price, maker.owner, taker.owner);

    ErrorCode status = emit(Event::fill(maker_side, true, maker.key, taker.key, maker.owner,
                                        maker.owner_slot, maker.fee_tier, maker.client_order_id,
                                        price, quantity, maker_paid, maker_received, rebate));
    if (!ok(status)) return status;
    status = emit(Event::fill(taker.side, false, taker.key, maker.key, taker.owner, NO_SLOT,
                              taker.fee_tier, taker.client_order_id, price, quantity,
                              taker_paid, taker_received, taker_fee));
    if (!ok(status)) return status;

    if (maker.quantity == 0) {
        const LeafNode done = maker;
        if (!market_.book().remove_order(maker_side, done.key)) {
            return ErrorCode::CORRUPT_STATE;
        }
        return emit(Event::out(maker_side, false, done.key, done.owner, done.owner_slot,
                               done.client_order_id, price, 0, 0));
    }
    return ErrorCode::OK;
}

ErrorCode Matcher::cancel_resting(Side side, const LeafNode& resting) noexcept {
    if (!market_.book().remove_order(side, resting.key)) {
        return ErrorCode::CORRUPT_STATE;
    }
    uint64_t released = 0;
    const ErrorCode status = resting_lock(side, resting.key.price(), resting.quantity, released);
    if (!ok(status)) return status;
    return emit(Event::out(side, false, resting.key, resting.owner, resting.owner_slot,
                           resting.client_order_id, resting.key.price(), resting.quantity, released));
}

ErrorCode Matcher::decrement_resting(Side side, LeafNode& resting, Quantity quantity) noexcept {
    uint64_t released = 0;
    const ErrorCode status = resting_lock(side, resting.key.price(), quantity, released);
    if (!ok(status)) return status;
    resting.quantity -= quantity;
    return emit(Event::out(side, true, resting.key, resting.owner, resting.owner_slot,
                           resting.client_order_id, resting.key.price(), quantity, released));
}

ErrorCode Matcher::discard_remainder(const TakerState& taker) noexcept {
    return emit(Event::out(taker.side, false, taker.key, taker.owner, NO_SLOT,
                           taker.client_order_id, taker.limit_price, taker.remaining, 0));
}

ErrorCode Matcher::post_remainder(TakerState& taker, market::OpenOrders& owner) noexcept {
    Quantity post_quantity = taker.remaining;

    if (taker.side == Side::BID) {
        uint64_t per_lot = 0;
        if (!checked_mul(taker.limit_price, market_.header().quote_lot_size, per_lot)) {
            return ErrorCode::ARITHMETIC_OVERFLOW;
        }
        post_quantity = std::min<Quantity>(post_quantity, taker.quote_left / per_lot);
    }

    if (post_quantity < taker.remaining) {
        // Quote budget cannot back the full remainder at the limit price
        TakerState unposted = taker;
        unposted.remaining = taker.remaining - post_quantity;
        const ErrorCode status = discard_remainder(unposted);
        if (!ok(status)) return status;
        taker.remaining = post_quantity;
    }
    if (post_quantity == 0) {
        return ErrorCode::OK;
    }

    const auto slot = owner.add_order(taker.key, taker.side, taker.client_order_id);
    if (!slot) {
        return ErrorCode::TOO_MANY_OPEN_ORDERS;
    }

    LeafNode leaf{};
    leaf.owner_slot = *slot;
    leaf.fee_tier = taker.fee_tier;
    leaf.key = taker.key;
    leaf.owner = taker.owner;
    leaf.quantity = post_quantity;
    leaf.client_order_id = taker.client_order_id;

    ErrorCode status = market_.book().insert_order(taker.side, leaf);
    if (!ok(status)) return status;

    uint64_t locked = 0;
    status = resting_lock(taker.side, taker.limit_price, post_quantity, locked);
    if (!ok(status)) return status;
    if (taker.side == Side::BID) {
        taker.quote_left -= locked;
    }
    taker.posted = post_quantity;
    return ErrorCode::OK;
}

// =============================================================================
// CANCEL
// =============================================================================

ErrorCode Matcher::cancel_order(const Request& request, market::OpenOrders& owner) noexcept {
    if (request.owner != owner.owner()) {
        return ErrorCode::ACCOUNT_MISMATCH;
    }
    const auto slot = owner.slot_of(request.order_id);
    if (!slot) {
        return ErrorCode::ORDER_NOT_FOUND;
    }
    const Side side = owner.slot_side(*slot);

    const auto removed = market_.book().remove_order(owner, *slot);
    if (!removed) {
        // Already filled or canceled, waiting for its Out event to be consumed
        return ErrorCode::ORDER_NOT_FOUND;
    }
    if (removed->owner != owner.owner()) {
        logger().error("order in slot {} of owner {} belongs to owner {}", *slot, owner.owner(), removed->owner);
        return ErrorCode::CORRUPT_STATE;
    }

    uint64_t released = 0;
    const ErrorCode status = resting_lock(side, removed->key.price(), removed->quantity, released);
    if (!ok(status)) return status;
    return emit(Event::out(side, false, removed->key, removed->owner, *slot, removed->client_order_id,
                           removed->key.price(), removed->quantity, released));
}

} // namespace strata::engine
