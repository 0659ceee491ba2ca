#include <gtest/gtest.h>
#include "strata/matching.hpp"

#include <map>
#include <memory>
#include <random>
#include <vector>

using namespace strata;
using namespace strata::engine;
using queue::Event;
using queue::EventKind;
using queue::Request;
using queue::RequestKind;

// =============================================================================
// FIXTURE
// =============================================================================

class MatchingTest : public ::testing::Test {
protected:
    static constexpr OwnerId ALICE = 1;
    static constexpr OwnerId BOB = 2;
    static constexpr OwnerId CAROL = 3;

    void SetUp() override { open_market(market::MarketConfig{}); }

    void open_market(market::MarketConfig config) {
        config.market_id = 9;
        config.bids_capacity = 1023;
        config.asks_capacity = 1023;
        config.event_capacity = 4096;
        region.assign(market::MarketState::required_size(config), 0);
        ASSERT_EQ(market::MarketState::init(region.data(), region.size(), config), ErrorCode::OK);
        ASSERT_EQ(market::MarketState::attach(region.data(), region.size(), market), ErrorCode::OK);
        accounts.clear();
        regions.clear();
        deposited[0] = deposited[1] = 0;
        for (OwnerId owner : {ALICE, BOB, CAROL}) {
            regions[owner] = std::make_unique<std::vector<uint8_t>>(market::OpenOrders::region_size(), 0);
            ASSERT_EQ(market::OpenOrders::init(regions[owner]->data(), regions[owner]->size(),
                                               config.market_id, owner, owner), ErrorCode::OK);
            accounts[owner] = market::OpenOrders(regions[owner]->data(), regions[owner]->size());
        }
    }

    /**
     * Lock the order's funds the way the processor does, then match it
     */
    ErrorCode submit(OwnerId owner, Side side, Price price, Quantity qty,
                     OrderType type = OrderType::LIMIT,
                     SelfTradeBehavior stb = SelfTradeBehavior::DECREMENT_AND_CANCEL,
                     uint16_t match_limit = 0, uint64_t max_quote = UINT64_MAX) {
        Request request{};
        request.kind = RequestKind::NEW_ORDER;
        request.side = side;
        request.order_type = type;
        request.self_trade = stb;
        request.match_limit = match_limit;
        request.owner = owner;
        request.limit_price = price;
        request.max_base_qty = qty;
        request.max_quote_qty = max_quote;
        request.client_order_id = ++client_ids;

        uint64_t lock = 0;
        ErrorCode status = Matcher::required_lock(market.header(), side, price, qty, max_quote, 0, lock);
        if (!ok(status)) return status;
        const Asset asset = side == Side::BID ? Asset::QUOTE : Asset::BASE;
        uint64_t deposit = 0;
        status = accounts[owner].lock(asset, lock, deposit);
        if (!ok(status)) return status;
        deposited[static_cast<size_t>(asset)] += deposit;
        if (side == Side::BID) {
            request.max_quote_qty = lock;
        }

        result = OrderResult{};
        Matcher matcher(market);
        return matcher.new_order(request, accounts[owner], result);
    }

    ErrorCode cancel(OwnerId owner, const OrderKey& id) {
        Request request{};
        request.kind = RequestKind::CANCEL_ORDER;
        request.owner = owner;
        request.order_id = id;
        Matcher matcher(market);
        return matcher.cancel_order(request, accounts[owner]);
    }

    /**
     * Drain the event queue into a vector and apply every event to its owner
     */
    std::vector<Event> consume() {
        std::vector<Event> out;
        while (auto event = market.events().pop()) {
            EXPECT_EQ(accounts[event->owner].apply_event(*event), ErrorCode::OK);
            out.push_back(*event);
        }
        return out;
    }

    static size_t count(const std::vector<Event>& events, EventKind kind) {
        size_t n = 0;
        for (const Event& e : events) n += e.kind == kind ? 1 : 0;
        return n;
    }

    std::vector<OrderKey> keys(Side side) const {
        std::vector<OrderKey> out;
        for (const slab::LeafNode& leaf : market.book().index(side).ascending()) {
            out.push_back(leaf.key);
        }
        return out;
    }

    std::vector<uint8_t> region;
    market::MarketState market;
    std::map<OwnerId, std::unique_ptr<std::vector<uint8_t>>> regions;
    std::map<OwnerId, market::OpenOrders> accounts;
    uint64_t deposited[2]{0, 0};
    OrderResult result;
    uint64_t client_ids = 0;
};

// =============================================================================
// BASIC MATCHING
// =============================================================================

TEST_F(MatchingTest, RestingBidPartiallyFilledByAsk) {
    ASSERT_EQ(submit(ALICE, Side::BID, 100, 5), ErrorCode::OK);
    EXPECT_EQ(result.posted_quantity, 5u);
    const OrderKey bid_id = result.order_id;

    ASSERT_EQ(submit(BOB, Side::ASK, 100, 3), ErrorCode::OK);
    EXPECT_EQ(result.base_filled, 3u);
    EXPECT_EQ(result.posted_quantity, 0u);

    const auto events = consume();
    ASSERT_EQ(count(events, EventKind::FILL), 2u);
    EXPECT_EQ(count(events, EventKind::OUT), 0u);

    const Event& maker = events[0];
    EXPECT_TRUE(maker.is_maker());
    EXPECT_EQ(maker.side(), Side::BID);
    EXPECT_EQ(maker.order_id, bid_id);
    EXPECT_EQ(maker.quantity, 3u);
    EXPECT_EQ(maker.price, 100u);
    EXPECT_FALSE(events[1].is_maker());
    EXPECT_EQ(events[1].counterparty_id, bid_id);

    ASSERT_NE(market.book().best_bid(), nullptr);
    EXPECT_EQ(market.book().best_bid()->key, bid_id);
    EXPECT_EQ(market.book().best_bid()->quantity, 2u);
    EXPECT_EQ(market.book().best_ask(), nullptr);

    // Alice: 507 locked (500 + 2 fee + 5 rounding), 7 released, 300 spent, 200 backs the remainder
    EXPECT_EQ(accounts[ALICE].total_balance(Asset::QUOTE), 207u);
    EXPECT_EQ(accounts[ALICE].locked_balance(Asset::QUOTE), 200u);
    EXPECT_EQ(accounts[ALICE].free_balance(Asset::BASE), 3u);
    // Bob pays a 1 quote taker fee (ceil of 0.66)
    EXPECT_EQ(accounts[BOB].free_balance(Asset::QUOTE), 299u);
    EXPECT_EQ(accounts[BOB].total_balance(Asset::BASE), 0u);
    EXPECT_EQ(market.header().quote_fees_accrued, 1u);
}

TEST_F(MatchingTest, IocOnEmptyBookIsDiscarded) {
    ASSERT_EQ(submit(BOB, Side::ASK, 50, 10, OrderType::IMMEDIATE_OR_CANCEL), ErrorCode::OK);
    EXPECT_EQ(result.base_filled, 0u);
    EXPECT_EQ(result.posted_quantity, 0u);

    const auto events = consume();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, EventKind::OUT);
    EXPECT_EQ(events[0].quantity, 10u);
    EXPECT_EQ(events[0].owner_slot, NO_SLOT);
    EXPECT_EQ(market.book().order_count(), 0u);
    EXPECT_EQ(accounts[BOB].free_balance(Asset::BASE), 10u);
    EXPECT_EQ(accounts[BOB].order_count(), 0u);
}

TEST_F(MatchingTest, PriceTimePriorityAcrossLevels) {
    ASSERT_EQ(submit(ALICE, Side::ASK, 101, 2), ErrorCode::OK);
    const OrderKey worse = result.order_id;
    ASSERT_EQ(submit(BOB, Side::ASK, 100, 2), ErrorCode::OK);
    const OrderKey first = result.order_id;
    ASSERT_EQ(submit(CAROL, Side::ASK, 100, 2), ErrorCode::OK);
    const OrderKey second = result.order_id;
    consume();

    ASSERT_EQ(submit(CAROL, Side::BID, 101, 5, OrderType::LIMIT, SelfTradeBehavior::CANCEL_OLDEST),
              ErrorCode::OK);
    const auto events = consume();
    std::vector<OrderKey> maker_order;
    for (const Event& e : events) {
        if (e.kind == EventKind::FILL && e.is_maker()) maker_order.push_back(e.order_id);
    }
    // Carol's own resting ask at 100 is canceled, not filled
    ASSERT_EQ(maker_order.size(), 2u);
    EXPECT_EQ(maker_order[0], first);
    EXPECT_EQ(maker_order[1], worse);
    EXPECT_EQ(market.book().find_order(Side::ASK, second), nullptr);
    EXPECT_EQ(result.base_filled, 4u);
    EXPECT_EQ(result.posted_quantity, 1u);
}

TEST_F(MatchingTest, FillsExecuteAtRestingPrice) {
    ASSERT_EQ(submit(ALICE, Side::ASK, 90, 4), ErrorCode::OK);
    ASSERT_EQ(submit(BOB, Side::BID, 100, 4), ErrorCode::OK);
    const auto events = consume();
    ASSERT_GE(events.size(), 2u);
    EXPECT_EQ(events[0].price, 90u);
    // Bob locked at 100 but only paid 90 per lot plus fee; the rest is free again
    EXPECT_EQ(accounts[BOB].locked_balance(Asset::QUOTE), 0u);
    EXPECT_EQ(accounts[BOB].free_balance(Asset::BASE), 4u);
}

TEST_F(MatchingTest, FullyConsumedMakerGetsOut) {
    ASSERT_EQ(submit(ALICE, Side::ASK, 100, 3), ErrorCode::OK);
    const OrderKey ask = result.order_id;
    consume();
    EXPECT_EQ(accounts[ALICE].order_count(), 1u);

    ASSERT_EQ(submit(BOB, Side::BID, 100, 3), ErrorCode::OK);
    const auto events = consume();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[2].kind, EventKind::OUT);
    EXPECT_EQ(events[2].order_id, ask);
    EXPECT_EQ(events[2].quantity, 0u);
    EXPECT_EQ(accounts[ALICE].order_count(), 0u);
    EXPECT_EQ(accounts[ALICE].free_balance(Asset::QUOTE), 300u);
}

// =============================================================================
// FEES
// =============================================================================

TEST_F(MatchingTest, TakerFeeRoundsUpMakerRebateRoundsDown) {
    market::MarketConfig config;
    config.quote_lot_size = 100;
    open_market(config);

    ASSERT_EQ(submit(ALICE, Side::BID, 100, 3), ErrorCode::OK);
    ASSERT_EQ(submit(BOB, Side::ASK, 100, 3), ErrorCode::OK);
    const auto events = consume();

    // Notional 30000: fee ceil(66) = 66, rebate floor(9) = 9
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].native_fee_or_rebate, 9u);
    EXPECT_EQ(events[1].native_fee_or_rebate, 66u);
    EXPECT_EQ(events[1].native_qty_received, 30000u - 66u);
    EXPECT_EQ(market.header().quote_fees_accrued, 57u);
    // rebate + unused fee reserve + 3 units of rounding reserve
    EXPECT_EQ(accounts[ALICE].free_balance(Asset::QUOTE), 9u + 66u + 3u);
}

// =============================================================================
// ORDER TYPES
// =============================================================================

TEST_F(MatchingTest, PostOnlyThatWouldCrossIsDiscarded) {
    ASSERT_EQ(submit(BOB, Side::ASK, 100, 5), ErrorCode::OK);
    consume();
    ASSERT_EQ(submit(ALICE, Side::BID, 100, 2, OrderType::POST_ONLY), ErrorCode::OK);
    const auto events = consume();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, EventKind::OUT);
    EXPECT_EQ(market.book().quantity_at(Side::ASK, 100), 5u);
    EXPECT_EQ(market.book().order_count(Side::BID), 0u);
    EXPECT_EQ(accounts[ALICE].locked_balance(Asset::QUOTE), 0u);

    ASSERT_EQ(submit(ALICE, Side::BID, 99, 2, OrderType::POST_ONLY), ErrorCode::OK);
    EXPECT_EQ(result.posted_quantity, 2u);
}

TEST_F(MatchingTest, BidLimitedByQuoteBudget) {
    ASSERT_EQ(submit(BOB, Side::ASK, 100, 10), ErrorCode::OK);
    consume();

    // 350 quote buys 3 lots (300 + 1 fee), the 4th would cost 401
    ASSERT_EQ(submit(ALICE, Side::BID, 100, 10, OrderType::LIMIT,
                     SelfTradeBehavior::DECREMENT_AND_CANCEL, 0, 350), ErrorCode::OK);
    EXPECT_EQ(result.base_filled, 3u);
    EXPECT_EQ(result.posted_quantity, 0u);
    EXPECT_EQ(result.native_quote_paid, 301u);

    const auto events = consume();
    EXPECT_EQ(events.back().kind, EventKind::OUT);
    EXPECT_EQ(events.back().quantity, 7u);
    EXPECT_EQ(accounts[ALICE].free_balance(Asset::QUOTE), 49u);
    EXPECT_EQ(accounts[ALICE].locked_balance(Asset::QUOTE), 0u);
}

TEST_F(MatchingTest, FeeBearingBidFillsAcrossSeveralMakers) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(submit(BOB, Side::ASK, 100, 1), ErrorCode::OK);
    }
    consume();

    // Each one-lot fill rounds its 0.22 fee up to 1
    ASSERT_EQ(submit(ALICE, Side::BID, 100, 3), ErrorCode::OK);
    EXPECT_EQ(result.base_filled, 3u);
    EXPECT_EQ(result.posted_quantity, 0u);
    EXPECT_EQ(result.native_quote_paid, 303u);
    EXPECT_EQ(market.book().order_count(Side::ASK), 0u);

    const auto events = consume();
    EXPECT_EQ(count(events, EventKind::FILL), 6u);
    EXPECT_EQ(accounts[ALICE].free_balance(Asset::BASE), 3u);
    EXPECT_EQ(accounts[ALICE].locked_balance(Asset::QUOTE), 0u);
    EXPECT_EQ(market.header().quote_fees_accrued, 3u);
}

TEST_F(MatchingTest, ZeroFeeBidLocksNoRoundingReserve) {
    market::MarketConfig config;
    config.fee_tiers = {{{0, 0}, {20, 0}, {18, 0}, {16, 0}}};
    open_market(config);

    uint64_t lock = 0;
    ASSERT_EQ(Matcher::required_lock(market.header(), Side::BID, 100, 5, UINT64_MAX, 0, lock), ErrorCode::OK);
    EXPECT_EQ(lock, 500u);
    ASSERT_EQ(Matcher::required_lock(market.header(), Side::BID, 100, 5, UINT64_MAX, 1, lock), ErrorCode::OK);
    EXPECT_EQ(lock, 500u + 1u + 5u);  // 20 bps of 500 is exactly 1
}

TEST_F(MatchingTest, MaxAffordableQuantityIsExact) {
    EXPECT_EQ(max_affordable_quantity(100, 1, 350, 22), 3u);
    EXPECT_EQ(max_affordable_quantity(100, 1, 301, 22), 3u);
    EXPECT_EQ(max_affordable_quantity(100, 1, 300, 22), 2u);
    EXPECT_EQ(max_affordable_quantity(100, 1, 99, 0), 0u);
    EXPECT_EQ(max_affordable_quantity(1, 1, UINT64_MAX, 0), UINT64_MAX);
}

TEST_F(MatchingTest, MatchStepBudget) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(submit(BOB, Side::ASK, 100, 1), ErrorCode::OK);
    }
    consume();
    EXPECT_EQ(submit(ALICE, Side::BID, 100, 3, OrderType::LIMIT,
                     SelfTradeBehavior::DECREMENT_AND_CANCEL, 2), ErrorCode::WOULD_EXCEED_BUDGET);
}

TEST_F(MatchingTest, MatchStepBudgetExactlyEnough) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(submit(BOB, Side::ASK, 100, 1), ErrorCode::OK);
    }
    consume();
    ASSERT_EQ(submit(ALICE, Side::BID, 100, 3, OrderType::LIMIT,
                     SelfTradeBehavior::DECREMENT_AND_CANCEL, 3), ErrorCode::OK);
    EXPECT_EQ(result.match_steps, 3u);
    EXPECT_EQ(result.base_filled, 3u);
}

TEST_F(MatchingTest, InvalidOrdersAreRejected) {
    EXPECT_EQ(submit(ALICE, Side::BID, 0, 1), ErrorCode::INVALID_PRICE);
    EXPECT_EQ(submit(ALICE, Side::ASK, 10, 0), ErrorCode::INVALID_QUANTITY);

    Request request{};
    request.side = Side::BID;
    request.limit_price = 10;
    request.max_base_qty = 1;
    request.max_quote_qty = 100;
    request.fee_tier = 4;
    EXPECT_EQ(Matcher::validate_order(market.header(), request), ErrorCode::INVALID_FEE_TIER);
    request.fee_tier = 0;
    request.order_type = static_cast<OrderType>(9);
    EXPECT_EQ(Matcher::validate_order(market.header(), request), ErrorCode::INVALID_INSTRUCTION);
}

// =============================================================================
// SELF-TRADE PREVENTION
// =============================================================================

TEST_F(MatchingTest, SelfTradeAbort) {
    ASSERT_EQ(submit(ALICE, Side::ASK, 100, 5), ErrorCode::OK);
    EXPECT_EQ(submit(ALICE, Side::BID, 100, 3, OrderType::LIMIT, SelfTradeBehavior::ABORT_TRANSACTION),
              ErrorCode::WOULD_SELF_TRADE);
}

TEST_F(MatchingTest, SelfTradeCancelOldest) {
    ASSERT_EQ(submit(ALICE, Side::ASK, 100, 5), ErrorCode::OK);
    const OrderKey own = result.order_id;
    ASSERT_EQ(submit(BOB, Side::ASK, 101, 5), ErrorCode::OK);
    consume();

    ASSERT_EQ(submit(ALICE, Side::BID, 101, 3, OrderType::LIMIT, SelfTradeBehavior::CANCEL_OLDEST),
              ErrorCode::OK);
    const auto events = consume();
    ASSERT_GE(events.size(), 1u);
    EXPECT_EQ(events[0].kind, EventKind::OUT);
    EXPECT_EQ(events[0].order_id, own);
    EXPECT_EQ(events[0].quantity, 5u);
    EXPECT_EQ(result.base_filled, 3u);
    EXPECT_EQ(market.book().quantity_at(Side::ASK, 101), 2u);
    EXPECT_EQ(accounts[ALICE].locked_balance(Asset::BASE), 0u);
    EXPECT_EQ(accounts[ALICE].free_balance(Asset::BASE), 8u);
}

TEST_F(MatchingTest, SelfTradeCancelNewest) {
    ASSERT_EQ(submit(ALICE, Side::ASK, 100, 5), ErrorCode::OK);
    consume();
    ASSERT_EQ(submit(ALICE, Side::BID, 100, 3, OrderType::LIMIT, SelfTradeBehavior::CANCEL_NEWEST),
              ErrorCode::OK);
    const auto events = consume();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, EventKind::OUT);
    EXPECT_EQ(events[0].quantity, 3u);
    EXPECT_EQ(market.book().quantity_at(Side::ASK, 100), 5u);
    EXPECT_EQ(market.book().order_count(Side::BID), 0u);
}

TEST_F(MatchingTest, SelfTradeDecrementShrinksLargerResting) {
    ASSERT_EQ(submit(ALICE, Side::ASK, 100, 5), ErrorCode::OK);
    consume();
    ASSERT_EQ(submit(ALICE, Side::BID, 100, 3), ErrorCode::OK);

    const auto events = consume();
    EXPECT_EQ(count(events, EventKind::FILL), 0u);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_TRUE(events[0].is_partial());
    EXPECT_EQ(events[0].quantity, 3u);
    EXPECT_EQ(market.book().quantity_at(Side::ASK, 100), 2u);
    EXPECT_EQ(market.book().order_count(Side::BID), 0u);
    EXPECT_EQ(accounts[ALICE].locked_balance(Asset::BASE), 2u);
    EXPECT_EQ(accounts[ALICE].order_count(), 1u);
}

TEST_F(MatchingTest, SelfTradeDecrementCancelsSmallerResting) {
    ASSERT_EQ(submit(ALICE, Side::ASK, 100, 3), ErrorCode::OK);
    consume();
    ASSERT_EQ(submit(ALICE, Side::BID, 100, 5), ErrorCode::OK);

    const auto events = consume();
    EXPECT_EQ(count(events, EventKind::FILL), 0u);
    EXPECT_EQ(market.book().order_count(Side::ASK), 0u);
    // The incoming order shrinks by the canceled quantity and rests
    EXPECT_EQ(result.posted_quantity, 2u);
    EXPECT_EQ(market.book().quantity_at(Side::BID, 100), 2u);
}

TEST_F(MatchingTest, SelfTradeDecrementEqualSizesCancelsBoth) {
    ASSERT_EQ(submit(ALICE, Side::ASK, 100, 4), ErrorCode::OK);
    consume();
    ASSERT_EQ(submit(ALICE, Side::BID, 100, 4), ErrorCode::OK);
    const auto events = consume();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, EventKind::OUT);
    EXPECT_EQ(market.book().order_count(), 0u);
    EXPECT_EQ(accounts[ALICE].order_count(), 0u);
}

// =============================================================================
// CANCEL
// =============================================================================

TEST_F(MatchingTest, CancelRestoresBook) {
    ASSERT_EQ(submit(BOB, Side::ASK, 105, 2), ErrorCode::OK);
    ASSERT_EQ(submit(CAROL, Side::BID, 95, 2), ErrorCode::OK);
    consume();
    const auto bids_before = keys(Side::BID);
    const auto asks_before = keys(Side::ASK);
    const uint64_t count_before = market.book().order_count();

    ASSERT_EQ(submit(ALICE, Side::BID, 99, 7), ErrorCode::OK);
    const OrderKey id = result.order_id;
    consume();
    ASSERT_EQ(cancel(ALICE, id), ErrorCode::OK);

    EXPECT_EQ(keys(Side::BID), bids_before);
    EXPECT_EQ(keys(Side::ASK), asks_before);
    EXPECT_EQ(market.book().order_count(), count_before);

    const auto events = consume();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].native_qty_paid, 693u);
    EXPECT_EQ(accounts[ALICE].order_count(), 0u);
    EXPECT_EQ(accounts[ALICE].locked_balance(Asset::QUOTE), 0u);
}

TEST_F(MatchingTest, CancelUnknownOrder) {
    EXPECT_EQ(cancel(ALICE, OrderKey::make(Side::BID, 1, 1)), ErrorCode::ORDER_NOT_FOUND);

    ASSERT_EQ(submit(ALICE, Side::BID, 99, 7), ErrorCode::OK);
    const OrderKey id = result.order_id;
    ASSERT_EQ(cancel(ALICE, id), ErrorCode::OK);
    // Slot is still held until the Out is consumed, but the order is gone
    EXPECT_EQ(cancel(ALICE, id), ErrorCode::ORDER_NOT_FOUND);
    // Bob cannot cancel Alice's order through his own record
    EXPECT_EQ(cancel(BOB, id), ErrorCode::ORDER_NOT_FOUND);
}

// =============================================================================
// PROPERTIES
// =============================================================================

TEST_F(MatchingTest, RandomFlowNeverCrossesAndConservesFunds) {
    market::MarketConfig config;
    config.quote_lot_size = 10;
    config.max_match_steps = 1000;
    open_market(config);

    std::mt19937_64 rng(20240611);
    const OwnerId owners[] = {ALICE, BOB, CAROL};
    const OrderType types[] = {OrderType::LIMIT, OrderType::IMMEDIATE_OR_CANCEL, OrderType::POST_ONLY};

    for (int i = 0; i < 400; ++i) {
        const OwnerId owner = owners[rng() % 3];
        if (accounts[owner].order_count() >= 100) {
            const uint8_t slot = static_cast<uint8_t>(rng() % 100);
            if (accounts[owner].slot_in_use(slot)) {
                ASSERT_EQ(cancel(owner, accounts[owner].slot_key(slot)), ErrorCode::OK);
            }
            consume();
            continue;
        }
        const Side side = rng() % 2 ? Side::BID : Side::ASK;
        ASSERT_EQ(submit(owner, side, 95 + rng() % 11, 1 + rng() % 10, types[rng() % 3],
                         SelfTradeBehavior::CANCEL_OLDEST), ErrorCode::OK);
        ASSERT_FALSE(market.book().is_crossed());
        consume();
        if (i % 50 == 0) {
            ASSERT_EQ(market.book().check_invariants(), ErrorCode::OK);
        }
    }

    // Locked balances back exactly the resting orders
    std::map<OwnerId, uint64_t> resting_quote;
    std::map<OwnerId, uint64_t> resting_base;
    for (const slab::LeafNode& leaf : market.book().index(Side::BID).ascending()) {
        resting_quote[leaf.owner] += leaf.key.price() * leaf.quantity * config.quote_lot_size;
    }
    for (const slab::LeafNode& leaf : market.book().index(Side::ASK).ascending()) {
        resting_base[leaf.owner] += leaf.quantity;
    }

    uint64_t base_total = 0;
    uint64_t quote_total = 0;
    for (OwnerId owner : owners) {
        EXPECT_EQ(accounts[owner].locked_balance(Asset::QUOTE), resting_quote[owner]);
        EXPECT_EQ(accounts[owner].locked_balance(Asset::BASE), resting_base[owner]);
        base_total += accounts[owner].total_balance(Asset::BASE);
        quote_total += accounts[owner].total_balance(Asset::QUOTE);
    }
    EXPECT_EQ(base_total, deposited[0]);
    EXPECT_EQ(quote_total + market.header().quote_fees_accrued, deposited[1]);
}
