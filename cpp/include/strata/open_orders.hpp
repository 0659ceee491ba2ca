#pragma once

/**
 * Per-owner Open Orders record
 *
 * One persisted region per trading owner. Tracks up to MAX_OPEN_ORDERS
 * resting order ids plus the owner's base/quote balances:
 *
 *   total  = everything the market holds on the owner's behalf
 *   free   = withdrawable part of total
 *   locked = total - free (backing resting orders and unconsumed fills)
 *
 * Balances only move through lock/unlock at order entry and through
 * apply_event when the event queue is consumed.
 */

#include <cstddef>
#include <cstdint>
#include <optional>

#include "common.hpp"
#include "error.hpp"
#include "events.hpp"

namespace strata::market {

static constexpr char OPEN_ORDERS_MAGIC[8] = {'S', 'T', 'R', 'A', 'T', 'A', 'O', 'O'};
static constexpr uint32_t OPEN_ORDERS_VERSION = 1;

enum OpenOrdersFlags : uint32_t {
    OPEN_ORDERS_FLAG_INITIALIZED = 1u << 0
};

struct OpenOrdersRecord {
    char magic[8];
    uint32_t version;
    uint32_t flags;
    uint64_t market_id;
    OwnerId owner;
    uint64_t authority;             // Signer allowed to act for this owner
    uint64_t base_free;
    uint64_t base_total;
    uint64_t quote_free;
    uint64_t quote_total;
    uint64_t referrer_rebates_accrued;  // Quote owed to this owner's referrer
    uint64_t free_slot_bits[2];     // 1 = slot available
    uint64_t is_bid_bits[2];
    OrderKey orders[MAX_OPEN_ORDERS];
    uint64_t client_order_ids[MAX_OPEN_ORDERS];
};

static_assert(sizeof(OpenOrdersRecord) == 3184, "OpenOrdersRecord layout changed");

class OpenOrders {
public:
    OpenOrders() = default;
    OpenOrders(uint8_t* region, size_t length) noexcept
        : record_(reinterpret_cast<OpenOrdersRecord*>(region)), length_(length) {}

    [[nodiscard]] static constexpr size_t region_size() noexcept { return sizeof(OpenOrdersRecord); }

    /**
     * Format an empty record. Fails with OPEN_ORDERS_ALREADY_INITIALIZED
     * when the region already carries the magic.
     */
    [[nodiscard]] static ErrorCode init(uint8_t* region, size_t length, uint64_t market_id,
                                        OwnerId owner, uint64_t authority) noexcept;

    /**
     * Check magic/version and that the record belongs to `market_id`
     * and to the account id it was passed under.
     */
    [[nodiscard]] ErrorCode validate(uint64_t market_id, OwnerId account_id) const noexcept;

    [[nodiscard]] OpenOrdersRecord& record() noexcept { return *record_; }
    [[nodiscard]] const OpenOrdersRecord& record() const noexcept { return *record_; }

    [[nodiscard]] OwnerId owner() const noexcept { return record_->owner; }
    [[nodiscard]] uint64_t authority() const noexcept { return record_->authority; }

    // =========================================================================
    // ORDER SLOTS
    // =========================================================================

    /**
     * Claim the lowest free slot for `key`.
     * @return slot index, std::nullopt when all slots are taken
     */
    [[nodiscard]] std::optional<uint8_t> add_order(const OrderKey& key, Side side,
                                                   uint64_t client_order_id) noexcept;

    void remove_order(uint8_t slot) noexcept;

    [[nodiscard]] bool slot_in_use(uint8_t slot) const noexcept;
    [[nodiscard]] std::optional<uint8_t> slot_of(const OrderKey& key) const noexcept;
    [[nodiscard]] std::optional<uint8_t> slot_of_client_id(uint64_t client_order_id) const noexcept;
    [[nodiscard]] Side slot_side(uint8_t slot) const noexcept;
    [[nodiscard]] const OrderKey& slot_key(uint8_t slot) const noexcept { return record_->orders[slot]; }
    [[nodiscard]] uint64_t slot_client_id(uint8_t slot) const noexcept {
        return record_->client_order_ids[slot];
    }

    [[nodiscard]] size_t order_count() const noexcept;

    /**
     * No slot in use, both totals and the referrer accrual zero (closable)
     */
    [[nodiscard]] bool is_empty() const noexcept;

    // =========================================================================
    // BALANCES
    // =========================================================================

    [[nodiscard]] uint64_t free_balance(Asset asset) const noexcept {
        return asset == Asset::BASE ? record_->base_free : record_->quote_free;
    }
    [[nodiscard]] uint64_t total_balance(Asset asset) const noexcept {
        return asset == Asset::BASE ? record_->base_total : record_->quote_total;
    }
    [[nodiscard]] uint64_t locked_balance(Asset asset) const noexcept {
        return total_balance(asset) - free_balance(asset);
    }

    /**
     * Lock `amount`: take it from free balance first, the shortfall is
     * deposited (added to total) and reported through `deposit_out`.
     */
    [[nodiscard]] ErrorCode lock(Asset asset, uint64_t amount, uint64_t& deposit_out) noexcept;

    /**
     * Return `amount` of locked balance to free
     */
    [[nodiscard]] ErrorCode unlock(Asset asset, uint64_t amount) noexcept;

    /**
     * Apply one consumed event owned by this record
     */
    [[nodiscard]] ErrorCode apply_event(const queue::Event& event) noexcept;

    /**
     * Withdraw both free balances (SettleFunds)
     */
    void settle(uint64_t& base_out, uint64_t& quote_out) noexcept;

    [[nodiscard]] uint64_t referrer_rebates() const noexcept { return record_->referrer_rebates_accrued; }
    [[nodiscard]] ErrorCode accrue_referrer_rebate(uint64_t amount) noexcept;

    /**
     * Hand over the referrer accrual, leaving zero
     */
    [[nodiscard]] uint64_t take_referrer_rebates() noexcept;

private:
    [[nodiscard]] ErrorCode apply_fill(const queue::Event& event) noexcept;
    [[nodiscard]] ErrorCode apply_out(const queue::Event& event) noexcept;
    [[nodiscard]] ErrorCode credit(Asset asset, uint64_t amount) noexcept;
    [[nodiscard]] ErrorCode debit_locked(Asset asset, uint64_t amount) noexcept;

    OpenOrdersRecord* record_{nullptr};
    size_t length_{0};
};

} // namespace strata::market
