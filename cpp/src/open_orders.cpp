#include "strata/open_orders.hpp"

#include <bit>
#include <cstring>

#include "strata/checked_math.hpp"
#include "strata/logging.hpp"

namespace strata::market {

namespace {

[[nodiscard]] inline bool test_bit(const uint64_t (&bits)[2], uint8_t slot) noexcept {
    return ((bits[slot >> 6] >> (slot & 63)) & 1u) != 0;
}

inline void set_bit(uint64_t (&bits)[2], uint8_t slot, bool value) noexcept {
    const uint64_t mask = uint64_t{1} << (slot & 63);
    if (value) {
        bits[slot >> 6] |= mask;
    } else {
        bits[slot >> 6] &= ~mask;
    }
}

} // namespace

ErrorCode OpenOrders::init(uint8_t* region, size_t length, uint64_t market_id,
                           OwnerId owner, uint64_t authority) noexcept {
    if (length < sizeof(OpenOrdersRecord)) {
        return ErrorCode::REGION_TOO_SMALL;
    }
    auto* record = reinterpret_cast<OpenOrdersRecord*>(region);
    if (std::memcmp(record->magic, OPEN_ORDERS_MAGIC, sizeof(OPEN_ORDERS_MAGIC)) == 0) {
        return ErrorCode::OPEN_ORDERS_ALREADY_INITIALIZED;
    }

    std::memset(region, 0, sizeof(OpenOrdersRecord));
    std::memcpy(record->magic, OPEN_ORDERS_MAGIC, sizeof(OPEN_ORDERS_MAGIC));
    record->version = OPEN_ORDERS_VERSION;
    record->flags = OPEN_ORDERS_FLAG_INITIALIZED;
    record->market_id = market_id;
    record->owner = owner;
    record->authority = authority;
    record->free_slot_bits[0] = ~uint64_t{0};
    record->free_slot_bits[1] = ~uint64_t{0};
    return ErrorCode::OK;
}

ErrorCode OpenOrders::validate(uint64_t market_id, OwnerId account_id) const noexcept {
    if (record_ == nullptr || length_ < sizeof(OpenOrdersRecord)) {
        return ErrorCode::REGION_TOO_SMALL;
    }
    if (std::memcmp(record_->magic, OPEN_ORDERS_MAGIC, sizeof(OPEN_ORDERS_MAGIC)) != 0 ||
        (record_->flags & OPEN_ORDERS_FLAG_INITIALIZED) == 0) {
        return ErrorCode::OPEN_ORDERS_NOT_INITIALIZED;
    }
    if (record_->version != OPEN_ORDERS_VERSION) {
        return ErrorCode::CORRUPT_STATE;
    }
    if (record_->market_id != market_id || record_->owner != account_id) {
        return ErrorCode::ACCOUNT_MISMATCH;
    }
    if (record_->base_free > record_->base_total || record_->quote_free > record_->quote_total) {
        return ErrorCode::CORRUPT_STATE;
    }
    return ErrorCode::OK;
}

// =============================================================================
// ORDER SLOTS
// =============================================================================

std::optional<uint8_t> OpenOrders::add_order(const OrderKey& key, Side side,
                                             uint64_t client_order_id) noexcept {
    uint8_t slot = 0;
    if (record_->free_slot_bits[0] != 0) {
        slot = static_cast<uint8_t>(std::countr_zero(record_->free_slot_bits[0]));
    } else if (record_->free_slot_bits[1] != 0) {
        slot = static_cast<uint8_t>(64 + std::countr_zero(record_->free_slot_bits[1]));
    } else {
        return std::nullopt;
    }

    set_bit(record_->free_slot_bits, slot, false);
    set_bit(record_->is_bid_bits, slot, side == Side::BID);
    record_->orders[slot] = key;
    record_->client_order_ids[slot] = client_order_id;
    return slot;
}

void OpenOrders::remove_order(uint8_t slot) noexcept {
    if (slot >= MAX_OPEN_ORDERS) return;
    set_bit(record_->free_slot_bits, slot, true);
    set_bit(record_->is_bid_bits, slot, false);
    record_->orders[slot] = OrderKey{};
    record_->client_order_ids[slot] = 0;
}

bool OpenOrders::slot_in_use(uint8_t slot) const noexcept {
    return slot < MAX_OPEN_ORDERS && !test_bit(record_->free_slot_bits, slot);
}

std::optional<uint8_t> OpenOrders::slot_of(const OrderKey& key) const noexcept {
    for (size_t i = 0; i < MAX_OPEN_ORDERS; ++i) {
        const auto slot = static_cast<uint8_t>(i);
        if (slot_in_use(slot) && record_->orders[i] == key) {
            return slot;
        }
    }
    return std::nullopt;
}

std::optional<uint8_t> OpenOrders::slot_of_client_id(uint64_t client_order_id) const noexcept {
    for (size_t i = 0; i < MAX_OPEN_ORDERS; ++i) {
        const auto slot = static_cast<uint8_t>(i);
        if (slot_in_use(slot) && record_->client_order_ids[i] == client_order_id) {
            return slot;
        }
    }
    return std::nullopt;
}

Side OpenOrders::slot_side(uint8_t slot) const noexcept {
    return test_bit(record_->is_bid_bits, slot) ? Side::BID : Side::ASK;
}

size_t OpenOrders::order_count() const noexcept {
    return MAX_OPEN_ORDERS
        - static_cast<size_t>(std::popcount(record_->free_slot_bits[0]))
        - static_cast<size_t>(std::popcount(record_->free_slot_bits[1]));
}

bool OpenOrders::is_empty() const noexcept {
    return order_count() == 0 && record_->base_total == 0 && record_->quote_total == 0 &&
           record_->referrer_rebates_accrued == 0;
}

// =============================================================================
// BALANCES
// =============================================================================

ErrorCode OpenOrders::lock(Asset asset, uint64_t amount, uint64_t& deposit_out) noexcept {
    uint64_t& free = asset == Asset::BASE ? record_->base_free : record_->quote_free;
    uint64_t& total = asset == Asset::BASE ? record_->base_total : record_->quote_total;

    deposit_out = 0;
    if (amount <= free) {
        free -= amount;
        return ErrorCode::OK;
    }

    const uint64_t shortfall = amount - free;
    uint64_t new_total = 0;
    if (!checked_add(total, shortfall, new_total)) {
        return ErrorCode::ARITHMETIC_OVERFLOW;
    }
    total = new_total;
    free = 0;
    deposit_out = shortfall;
    return ErrorCode::OK;
}

ErrorCode OpenOrders::unlock(Asset asset, uint64_t amount) noexcept {
    uint64_t& free = asset == Asset::BASE ? record_->base_free : record_->quote_free;
    const uint64_t total = asset == Asset::BASE ? record_->base_total : record_->quote_total;
    uint64_t new_free = 0;
    if (!checked_add(free, amount, new_free)) {
        return ErrorCode::ARITHMETIC_OVERFLOW;
    }
    if (new_free > total) {
        logger().error("owner {} unlock of {} exceeds locked balance", record_->owner, amount);
        return ErrorCode::CORRUPT_STATE;
    }
    free = new_free;
    return ErrorCode::OK;
}

ErrorCode OpenOrders::credit(Asset asset, uint64_t amount) noexcept {
    uint64_t& free = asset == Asset::BASE ? record_->base_free : record_->quote_free;
    uint64_t& total = asset == Asset::BASE ? record_->base_total : record_->quote_total;
    uint64_t new_free = 0;
    uint64_t new_total = 0;
    if (!checked_add(free, amount, new_free) || !checked_add(total, amount, new_total)) {
        return ErrorCode::ARITHMETIC_OVERFLOW;
    }
    free = new_free;
    total = new_total;
    return ErrorCode::OK;
}

ErrorCode OpenOrders::debit_locked(Asset asset, uint64_t amount) noexcept {
    const uint64_t free = asset == Asset::BASE ? record_->base_free : record_->quote_free;
    uint64_t& total = asset == Asset::BASE ? record_->base_total : record_->quote_total;
    if (total - free < amount) {
        logger().error("owner {} fill debits {} beyond locked balance {}",
                       record_->owner, amount, total - free);
        return ErrorCode::CORRUPT_STATE;
    }
    total -= amount;
    return ErrorCode::OK;
}

ErrorCode OpenOrders::apply_event(const queue::Event& event) noexcept {
    if (event.owner != record_->owner) {
        return ErrorCode::ACCOUNT_MISMATCH;
    }
    return event.kind == queue::EventKind::FILL ? apply_fill(event) : apply_out(event);
}

ErrorCode OpenOrders::apply_fill(const queue::Event& event) noexcept {
    if (event.side() == Side::BID) {
        // Paid quote, received base; a maker also collects its rebate in quote
        ErrorCode status = debit_locked(Asset::QUOTE, event.native_qty_paid);
        if (!ok(status)) return status;
        status = credit(Asset::BASE, event.native_qty_received);
        if (!ok(status)) return status;
        if (event.is_maker() && event.native_fee_or_rebate > 0) {
            return credit(Asset::QUOTE, event.native_fee_or_rebate);
        }
        return ErrorCode::OK;
    }

    const ErrorCode status = debit_locked(Asset::BASE, event.native_qty_paid);
    if (!ok(status)) return status;
    return credit(Asset::QUOTE, event.native_qty_received);
}

ErrorCode OpenOrders::apply_out(const queue::Event& event) noexcept {
    const Asset locked_asset = event.side() == Side::BID ? Asset::QUOTE : Asset::BASE;
    if (event.native_qty_paid > 0) {
        const ErrorCode status = unlock(locked_asset, event.native_qty_paid);
        if (!ok(status)) return status;
    }

    if (!event.is_partial() && event.owner_slot != NO_SLOT &&
        slot_in_use(event.owner_slot) && record_->orders[event.owner_slot] == event.order_id) {
        remove_order(event.owner_slot);
    }
    return ErrorCode::OK;
}

void OpenOrders::settle(uint64_t& base_out, uint64_t& quote_out) noexcept {
    base_out = record_->base_free;
    quote_out = record_->quote_free;
    record_->base_total -= record_->base_free;
    record_->quote_total -= record_->quote_free;
    record_->base_free = 0;
    record_->quote_free = 0;
}

ErrorCode OpenOrders::accrue_referrer_rebate(uint64_t amount) noexcept {
    uint64_t accrued = 0;
    if (!checked_add(record_->referrer_rebates_accrued, amount, accrued)) {
        return ErrorCode::ARITHMETIC_OVERFLOW;
    }
    record_->referrer_rebates_accrued = accrued;
    return ErrorCode::OK;
}

uint64_t OpenOrders::take_referrer_rebates() noexcept {
    const uint64_t amount = record_->referrer_rebates_accrued;
    record_->referrer_rebates_accrued = 0;
    return amount;
}

} // namespace strata::market
