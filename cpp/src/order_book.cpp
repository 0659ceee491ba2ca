#include "strata/order_book.hpp"

namespace strata::book {

const LeafNode* OrderBook::best(Side side) const noexcept {
    const CritbitIndex& idx = index(side);
    const auto handle = side == Side::BID ? idx.find_max() : idx.find_min();
    return handle ? idx.leaf(*handle) : nullptr;
}

LeafNode* OrderBook::best_mut(Side side) noexcept {
    CritbitIndex& idx = index(side);
    const auto handle = side == Side::BID ? idx.find_max() : idx.find_min();
    return handle ? idx.leaf_mut(*handle) : nullptr;
}

std::optional<Price> OrderBook::best_price(Side side) const noexcept {
    const LeafNode* order = best(side);
    if (order == nullptr) {
        return std::nullopt;
    }
    return order->key.price();
}

bool OrderBook::is_crossed() const noexcept {
    const auto bid = best_price(Side::BID);
    const auto ask = best_price(Side::ASK);
    return bid && ask && *bid >= *ask;
}

ErrorCode OrderBook::insert_order(Side side, const LeafNode& order) noexcept {
    if (order.quantity == 0) {
        return ErrorCode::INVALID_QUANTITY;
    }
    return index(side).insert(order);
}

std::optional<LeafNode> OrderBook::remove_order(Side side, const OrderKey& key) noexcept {
    return index(side).remove(key);
}

std::optional<LeafNode> OrderBook::remove_order(const market::OpenOrders& owner,
                                                uint8_t slot) noexcept {
    if (!owner.slot_in_use(slot)) {
        return std::nullopt;
    }
    return index(owner.slot_side(slot)).remove(owner.slot_key(slot));
}

void OrderBook::depth(Side side, std::vector<LevelInfo>& out, size_t levels) const {
    out.clear();
    if (levels == 0) return;

    // Bids walk descending (highest price first), asks ascending
    const critbit::Direction direction =
        side == Side::BID ? critbit::Direction::DESCENDING : critbit::Direction::ASCENDING;

    for (const LeafNode& order : index(side).iterate(direction)) {
        const Price price = order.key.price();
        if (out.empty() || out.back().price != price) {
            if (out.size() == levels) break;
            out.push_back(LevelInfo{price, 0, 0});
        }
        out.back().quantity += order.quantity;
        ++out.back().order_count;
    }
}

Quantity OrderBook::quantity_at(Side side, Price price) const noexcept {
    Quantity total = 0;
    for (const LeafNode& order : index(side).ascending()) {
        const Price p = order.key.price();
        if (p < price) continue;
        if (p > price) break;
        total += order.quantity;
    }
    return total;
}

ErrorCode OrderBook::check_invariants() const noexcept {
    ErrorCode status = bids_.check_invariants();
    if (!ok(status)) return status;
    status = asks_.check_invariants();
    if (!ok(status)) return status;
    return is_crossed() ? ErrorCode::BOOK_CROSSED : ErrorCode::OK;
}

} // namespace strata::book
