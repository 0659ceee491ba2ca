#include <gtest/gtest.h>
#include "strata/order_book.hpp"

#include <vector>

using namespace strata;
using namespace strata::book;

// =============================================================================
// BASIC FUNCTIONALITY TESTS
// =============================================================================

class OrderBookTest : public ::testing::Test {
protected:
    static constexpr uint32_t CAPACITY = 128;

    void SetUp() override {
        bid_region.resize(slab::Slab::region_size(CAPACITY));
        ask_region.resize(slab::Slab::region_size(CAPACITY));
        ASSERT_EQ(slab::Slab::init(bid_region.data(), bid_region.size(), CAPACITY), ErrorCode::OK);
        ASSERT_EQ(slab::Slab::init(ask_region.data(), ask_region.size(), CAPACITY), ErrorCode::OK);
        book = OrderBook(CritbitIndex(slab::Slab(bid_region.data(), bid_region.size())),
                         CritbitIndex(slab::Slab(ask_region.data(), ask_region.size())));
    }

    OrderKey add(Side side, Price price, Quantity qty, OwnerId owner = 1, uint8_t slot = NO_SLOT) {
        LeafNode leaf{};
        leaf.key = OrderKey::make(side, price, seq++);
        leaf.quantity = qty;
        leaf.owner = owner;
        leaf.owner_slot = slot;
        EXPECT_EQ(book.insert_order(side, leaf), ErrorCode::OK);
        return leaf.key;
    }

    std::vector<uint8_t> bid_region;
    std::vector<uint8_t> ask_region;
    OrderBook book;
    SeqNum seq = 0;
};

TEST_F(OrderBookTest, EmptyBook) {
    EXPECT_EQ(book.best_bid(), nullptr);
    EXPECT_EQ(book.best_ask(), nullptr);
    EXPECT_FALSE(book.best_price(Side::BID).has_value());
    EXPECT_FALSE(book.is_crossed());
    EXPECT_EQ(book.order_count(), 0u);
    EXPECT_EQ(book.check_invariants(), ErrorCode::OK);
}

TEST_F(OrderBookTest, BothSidesOfBook) {
    add(Side::BID, 10000, 100);
    add(Side::ASK, 10010, 100);

    EXPECT_EQ(book.best_price(Side::BID), 10000u);
    EXPECT_EQ(book.best_price(Side::ASK), 10010u);
    EXPECT_FALSE(book.is_crossed());
    EXPECT_EQ(book.order_count(Side::BID), 1u);
    EXPECT_EQ(book.order_count(Side::ASK), 1u);
}

TEST_F(OrderBookTest, PriceTimePriority) {
    const OrderKey first = add(Side::BID, 10000, 100);
    add(Side::BID, 10000, 100);
    EXPECT_EQ(book.best_bid()->key, first);

    const OrderKey better = add(Side::BID, 10010, 5);
    EXPECT_EQ(book.best_bid()->key, better);

    const OrderKey ask_first = add(Side::ASK, 10020, 1);
    add(Side::ASK, 10020, 1);
    add(Side::ASK, 10030, 1);
    EXPECT_EQ(book.best_ask()->key, ask_first);
}

TEST_F(OrderBookTest, ZeroQuantityIsRejected) {
    LeafNode leaf{};
    leaf.key = OrderKey::make(Side::ASK, 100, 1);
    EXPECT_EQ(book.insert_order(Side::ASK, leaf), ErrorCode::INVALID_QUANTITY);
    EXPECT_EQ(book.order_count(), 0u);
}

TEST_F(OrderBookTest, CrossedBookFailsInvariants) {
    add(Side::BID, 105, 1);
    add(Side::ASK, 105, 1);
    EXPECT_TRUE(book.is_crossed());
    EXPECT_EQ(book.check_invariants(), ErrorCode::BOOK_CROSSED);
}

TEST_F(OrderBookTest, OrderRemoval) {
    const OrderKey key = add(Side::ASK, 200, 7);
    auto removed = book.remove_order(Side::ASK, key);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->quantity, 7u);
    EXPECT_EQ(book.best_ask(), nullptr);
    EXPECT_FALSE(book.remove_order(Side::ASK, key).has_value());
    // Wrong side does not find it either
    const OrderKey again = add(Side::ASK, 200, 7);
    EXPECT_FALSE(book.remove_order(Side::BID, again).has_value());
}

TEST_F(OrderBookTest, RemoveThroughOwnerSlot) {
    std::vector<uint8_t> oo_region(market::OpenOrders::region_size(), 0);
    ASSERT_EQ(market::OpenOrders::init(oo_region.data(), oo_region.size(), 1, 9, 9), ErrorCode::OK);
    market::OpenOrders owner(oo_region.data(), oo_region.size());

    const OrderKey key = OrderKey::make(Side::BID, 150, seq);
    const uint8_t slot = *owner.add_order(key, Side::BID, 0);
    add(Side::BID, 150, 4, 9, slot);

    auto removed = book.remove_order(owner, slot);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->key, key);
    EXPECT_EQ(book.order_count(), 0u);
    EXPECT_FALSE(book.remove_order(owner, static_cast<uint8_t>(slot + 1)).has_value());
}

// =============================================================================
// MARKET DATA TESTS
// =============================================================================

TEST_F(OrderBookTest, DepthAggregatesLevelsBestFirst) {
    add(Side::BID, 100, 5);
    add(Side::BID, 102, 1);
    add(Side::BID, 100, 3);
    add(Side::BID, 99, 2);
    add(Side::ASK, 105, 4);
    add(Side::ASK, 104, 6);
    add(Side::ASK, 105, 1);

    std::vector<OrderBook::LevelInfo> bids;
    book.depth(Side::BID, bids);
    ASSERT_EQ(bids.size(), 3u);
    EXPECT_EQ(bids[0].price, 102u);
    EXPECT_EQ(bids[1].price, 100u);
    EXPECT_EQ(bids[1].quantity, 8u);
    EXPECT_EQ(bids[1].order_count, 2u);
    EXPECT_EQ(bids[2].price, 99u);

    std::vector<OrderBook::LevelInfo> asks;
    book.depth(Side::ASK, asks, 1);
    ASSERT_EQ(asks.size(), 1u);
    EXPECT_EQ(asks[0].price, 104u);
    EXPECT_EQ(asks[0].quantity, 6u);

    book.depth(Side::ASK, asks, 0);
    EXPECT_TRUE(asks.empty());
}

TEST_F(OrderBookTest, QuantityAtPrice) {
    add(Side::ASK, 110, 3);
    add(Side::ASK, 110, 4);
    add(Side::ASK, 111, 9);
    add(Side::BID, 109, 2);
    add(Side::BID, 109, 2);

    EXPECT_EQ(book.quantity_at(Side::ASK, 110), 7u);
    EXPECT_EQ(book.quantity_at(Side::ASK, 111), 9u);
    EXPECT_EQ(book.quantity_at(Side::ASK, 112), 0u);
    EXPECT_EQ(book.quantity_at(Side::BID, 109), 4u);
}

TEST_F(OrderBookTest, BestMutAdjustsResting) {
    add(Side::ASK, 120, 10);
    book.best_mut(Side::ASK)->quantity = 2;
    EXPECT_EQ(book.quantity_at(Side::ASK, 120), 2u);
}
