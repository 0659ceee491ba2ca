#pragma once

/**
 * Market State - header and layout of the persisted market region
 *
 * Region layout (all offsets derived from the capacities, 8-byte aligned):
 *
 *   [MarketHeader]
 *   [bids slab   : SlabHeader + bids_capacity nodes]
 *   [asks slab   : SlabHeader + asks_capacity nodes]
 *   [requests    : QueueHeader + request_capacity Request]
 *   [events      : QueueHeader + event_capacity Event]
 *
 * Configuration is persisted in the header at InitMarket; every later
 * invocation reads policy from the region only.
 */

#include <array>
#include <cstddef>
#include <cstdint>

#include "common.hpp"
#include "error.hpp"
#include "events.hpp"
#include "order_book.hpp"
#include "ring_queue.hpp"

namespace strata::market {

static constexpr char MARKET_MAGIC[8] = {'S', 'T', 'R', 'A', 'T', 'A', 'M', 'K'};
static constexpr uint32_t MARKET_VERSION = 1;

enum MarketFlags : uint32_t {
    MARKET_FLAG_INITIALIZED = 1u << 0,
    MARKET_FLAG_IN_PROGRESS = 1u << 1      // Set for the duration of one invocation
};

struct FeeTier {
    uint32_t taker_fee_bps;
    uint32_t maker_rebate_bps;
};

// =============================================================================
// CONFIGURATION
// =============================================================================

struct MarketConfig {
    uint64_t market_id{0};
    uint64_t base_vault{0};
    uint64_t quote_vault{0};
    uint64_t fee_receiver{0};
    uint64_t prune_authority{0};
    uint64_t consume_authority{0};      // 0 = permissionless ConsumeEvents
    uint64_t referral_account{0};       // 0 = any referrer accepted

    uint8_t base_decimals{9};
    uint8_t quote_decimals{6};
    uint64_t base_lot_size{1};
    uint64_t quote_lot_size{1};

    uint16_t fee_tier_count{4};
    std::array<FeeTier, MAX_FEE_TIERS> fee_tiers{{
        {22, 3},
        {20, 3},
        {18, 3},
        {16, 3}
    }};
    // Share of each net taker fee owed to the taker's referrer
    uint32_t referrer_rebate_bps{0};

    // Slab capacities are in nodes; n resting orders need 2n - 1
    uint32_t bids_capacity{1023};
    uint32_t asks_capacity{1023};
    uint32_t request_capacity{64};
    uint32_t event_capacity{1024};

    QueueFullPolicy request_policy{QueueFullPolicy::REJECT};
    QueueFullPolicy event_policy{QueueFullPolicy::OVERWRITE_OLDEST};

    uint16_t max_match_steps{64};

    /**
     * @return first violated rule, OK when the config can be persisted
     */
    [[nodiscard]] ErrorCode validate() const noexcept;
};

// =============================================================================
// PERSISTED HEADER
// =============================================================================

struct MarketHeader {
    char magic[8];
    uint32_t version;
    uint32_t flags;

    uint64_t market_id;
    uint64_t base_vault;
    uint64_t quote_vault;
    uint64_t fee_receiver;
    uint64_t prune_authority;
    uint64_t consume_authority;
    uint64_t referral_account;

    uint8_t base_decimals;
    uint8_t quote_decimals;
    QueueFullPolicy request_policy;
    QueueFullPolicy event_policy;
    uint16_t max_match_steps;
    uint16_t fee_tier_count;
    uint64_t base_lot_size;
    uint64_t quote_lot_size;
    FeeTier fee_tiers[MAX_FEE_TIERS];
    uint32_t referrer_rebate_bps;
    uint32_t reserved;

    SeqNum next_order_seq;          // Minted into every new OrderKey
    uint64_t base_deposits_total;
    uint64_t quote_deposits_total;
    uint64_t quote_fees_accrued;

    uint32_t bids_capacity;
    uint32_t asks_capacity;
    uint32_t request_capacity;
    uint32_t event_capacity;

    uint64_t bids_offset;
    uint64_t asks_offset;
    uint64_t requests_offset;
    uint64_t events_offset;
    uint64_t total_size;
};

static_assert(sizeof(MarketHeader) == 224, "MarketHeader layout changed");

struct MarketLayout {
    uint64_t bids_offset;
    uint64_t asks_offset;
    uint64_t requests_offset;
    uint64_t events_offset;
    uint64_t total_size;

    [[nodiscard]] static MarketLayout compute(uint32_t bids_capacity, uint32_t asks_capacity,
                                              uint32_t request_capacity,
                                              uint32_t event_capacity) noexcept;

    [[nodiscard]] static MarketLayout compute(const MarketConfig& config) noexcept {
        return compute(config.bids_capacity, config.asks_capacity,
                       config.request_capacity, config.event_capacity);
    }
};

// =============================================================================
// MARKET VIEW
// =============================================================================

using RequestQueue = queue::RingQueue<queue::Request>;
using EventQueue = queue::RingQueue<queue::Event>;

class MarketState {
public:
    MarketState() = default;

    [[nodiscard]] static size_t required_size(const MarketConfig& config) noexcept {
        return static_cast<size_t>(MarketLayout::compute(config).total_size);
    }

    /**
     * Format `region` as an empty market. The config must already validate.
     */
    [[nodiscard]] static ErrorCode init(uint8_t* region, size_t length,
                                        const MarketConfig& config) noexcept;

    [[nodiscard]] static bool is_initialized(const uint8_t* region, size_t length) noexcept;

    /**
     * Bind to an initialized region, re-deriving and checking its layout
     */
    [[nodiscard]] static ErrorCode attach(uint8_t* region, size_t length, MarketState& out) noexcept;

    [[nodiscard]] MarketHeader& header() noexcept { return *header_; }
    [[nodiscard]] const MarketHeader& header() const noexcept { return *header_; }

    [[nodiscard]] book::OrderBook& book() noexcept { return book_; }
    [[nodiscard]] const book::OrderBook& book() const noexcept { return book_; }
    [[nodiscard]] RequestQueue& requests() noexcept { return requests_; }
    [[nodiscard]] const RequestQueue& requests() const noexcept { return requests_; }
    [[nodiscard]] EventQueue& events() noexcept { return events_; }
    [[nodiscard]] const EventQueue& events() const noexcept { return events_; }

    [[nodiscard]] const FeeTier* fee_tier(uint8_t tier) const noexcept {
        return tier < header_->fee_tier_count ? &header_->fee_tiers[tier] : nullptr;
    }

    [[nodiscard]] SeqNum mint_order_seq() noexcept { return header_->next_order_seq++; }

    [[nodiscard]] bool in_progress() const noexcept {
        return (header_->flags & MARKET_FLAG_IN_PROGRESS) != 0;
    }
    void set_in_progress(bool value) noexcept {
        if (value) {
            header_->flags |= MARKET_FLAG_IN_PROGRESS;
        } else {
            header_->flags &= ~static_cast<uint32_t>(MARKET_FLAG_IN_PROGRESS);
        }
    }

    [[nodiscard]] size_t size() const noexcept { return static_cast<size_t>(header_->total_size); }

private:
    MarketHeader* header_{nullptr};
    book::OrderBook book_;
    RequestQueue requests_;
    EventQueue events_;
};

} // namespace strata::market
