#pragma once

/**
 * Order Book - two critbit indexes over the persisted slabs
 *
 * Bids and asks are separate indexes. OrderKey orientation makes the
 * best bid the maximum of the bid index and the best ask the minimum of
 * the ask index, both at earliest arrival within the price.
 *
 * The book holds no state of its own; it is a view over the market region.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "common.hpp"
#include "critbit.hpp"
#include "error.hpp"
#include "open_orders.hpp"

namespace strata::book {

using critbit::CritbitIndex;
using slab::LeafNode;

class OrderBook {
public:
    OrderBook() = default;
    OrderBook(CritbitIndex bids, CritbitIndex asks) noexcept
        : bids_(bids), asks_(asks) {}

    [[nodiscard]] CritbitIndex& index(Side side) noexcept {
        return side == Side::BID ? bids_ : asks_;
    }
    [[nodiscard]] const CritbitIndex& index(Side side) const noexcept {
        return side == Side::BID ? bids_ : asks_;
    }

    // =========================================================================
    // TOP OF BOOK
    // =========================================================================

    [[nodiscard]] const LeafNode* best_bid() const noexcept { return best(Side::BID); }
    [[nodiscard]] const LeafNode* best_ask() const noexcept { return best(Side::ASK); }

    /**
     * Best resting order of `side`, nullptr when that side is empty
     */
    [[nodiscard]] const LeafNode* best(Side side) const noexcept;
    [[nodiscard]] LeafNode* best_mut(Side side) noexcept;

    [[nodiscard]] std::optional<Price> best_price(Side side) const noexcept;

    /**
     * True when both sides are non-empty and best bid >= best ask
     */
    [[nodiscard]] bool is_crossed() const noexcept;

    // =========================================================================
    // ORDER MANAGEMENT
    // =========================================================================

    [[nodiscard]] ErrorCode insert_order(Side side, const LeafNode& order) noexcept;

    [[nodiscard]] std::optional<LeafNode> remove_order(Side side, const OrderKey& key) noexcept;

    /**
     * Remove the order an owner tracks in `slot`
     */
    [[nodiscard]] std::optional<LeafNode> remove_order(const market::OpenOrders& owner,
                                                       uint8_t slot) noexcept;

    [[nodiscard]] const LeafNode* find_order(Side side, const OrderKey& key) const noexcept {
        return index(side).find(key);
    }

    // =========================================================================
    // MARKET DATA
    // =========================================================================

    struct LevelInfo {
        Price price;
        Quantity quantity;
        uint32_t order_count;
    };

    /**
     * Aggregate the top `levels` price levels of `side`, best first
     */
    void depth(Side side, std::vector<LevelInfo>& out, size_t levels = 10) const;

    [[nodiscard]] Quantity quantity_at(Side side, Price price) const noexcept;

    [[nodiscard]] uint64_t order_count() const noexcept {
        return bids_.leaf_count() + asks_.leaf_count();
    }
    [[nodiscard]] uint64_t order_count(Side side) const noexcept { return index(side).leaf_count(); }

    [[nodiscard]] ErrorCode check_invariants() const noexcept;

private:
    CritbitIndex bids_;
    CritbitIndex asks_;
};

} // namespace strata::book
