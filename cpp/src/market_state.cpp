#include "strata/market_state.hpp"

#include <algorithm>
#include <cstring>

#include "strata/logging.hpp"
#include "strata/slab.hpp"

namespace strata::market {

namespace {

static constexpr uint32_t MAX_CAPACITY = 1u << 31;
static constexpr uint8_t MAX_DECIMALS = 18;

[[nodiscard]] constexpr uint64_t align_up(uint64_t value) noexcept {
    return (value + 7) & ~uint64_t{7};
}

[[nodiscard]] constexpr bool valid_capacity(uint32_t capacity) noexcept {
    return capacity > 0 && capacity <= MAX_CAPACITY;
}

} // namespace

// =============================================================================
// CONFIG
// =============================================================================

ErrorCode MarketConfig::validate() const noexcept {
    if (base_lot_size == 0 || quote_lot_size == 0) {
        return ErrorCode::INVALID_LOT_SIZE;
    }
    if (base_decimals > MAX_DECIMALS || quote_decimals > MAX_DECIMALS) {
        return ErrorCode::INVALID_DECIMALS;
    }

    if (fee_tier_count == 0 || fee_tier_count > MAX_FEE_TIERS) {
        return ErrorCode::INVALID_FEE_TIER;
    }
    uint32_t min_taker = UINT32_MAX;
    uint32_t max_rebate = 0;
    for (size_t i = 0; i < fee_tier_count; ++i) {
        if (fee_tiers[i].taker_fee_bps > BPS_DENOMINATOR) {
            return ErrorCode::INVALID_FEE_TIER;
        }
        min_taker = std::min(min_taker, fee_tiers[i].taker_fee_bps);
        max_rebate = std::max(max_rebate, fee_tiers[i].maker_rebate_bps);
    }
    // Any maker may trade against any taker: no rebate may outgrow a fee
    if (max_rebate > min_taker) {
        return ErrorCode::INVALID_FEE_TIER;
    }
    if (referrer_rebate_bps > BPS_DENOMINATOR) {
        return ErrorCode::INVALID_FEE_TIER;
    }

    if (!valid_capacity(bids_capacity) || !valid_capacity(asks_capacity) ||
        !valid_capacity(request_capacity) || !valid_capacity(event_capacity) ||
        max_match_steps == 0) {
        return ErrorCode::INVALID_CAPACITY;
    }
    if (!is_valid(request_policy) || !is_valid(event_policy)) {
        return ErrorCode::INVALID_INSTRUCTION;
    }
    return ErrorCode::OK;
}

// =============================================================================
// LAYOUT
// =============================================================================

MarketLayout MarketLayout::compute(uint32_t bids_capacity, uint32_t asks_capacity,
                                   uint32_t request_capacity, uint32_t event_capacity) noexcept {
    MarketLayout layout{};
    layout.bids_offset = align_up(sizeof(MarketHeader));
    layout.asks_offset = align_up(layout.bids_offset + slab::Slab::region_size(bids_capacity));
    layout.requests_offset = align_up(layout.asks_offset + slab::Slab::region_size(asks_capacity));
    layout.events_offset = align_up(layout.requests_offset + RequestQueue::region_size(request_capacity));
    layout.total_size = align_up(layout.events_offset + EventQueue::region_size(event_capacity));
    return layout;
}

// =============================================================================
// MARKET VIEW
// =============================================================================

ErrorCode MarketState::init(uint8_t* region, size_t length, const MarketConfig& config) noexcept {
    const ErrorCode config_status = config.validate();
    if (!ok(config_status)) {
        return config_status;
    }
    if (is_initialized(region, length)) {
        return ErrorCode::MARKET_ALREADY_INITIALIZED;
    }

    const MarketLayout layout = MarketLayout::compute(config);
    if (length < layout.total_size) {
        return ErrorCode::REGION_TOO_SMALL;
    }

    std::memset(region, 0, sizeof(MarketHeader));

    ErrorCode status = slab::Slab::init(region + layout.bids_offset,
                                        layout.asks_offset - layout.bids_offset,
                                        config.bids_capacity);
    if (!ok(status)) return status;
    status = slab::Slab::init(region + layout.asks_offset,
                              layout.requests_offset - layout.asks_offset,
                              config.asks_capacity);
    if (!ok(status)) return status;
    status = RequestQueue::init(region + layout.requests_offset,
                                layout.events_offset - layout.requests_offset,
                                config.request_capacity);
    if (!ok(status)) return status;
    status = EventQueue::init(region + layout.events_offset,
                              layout.total_size - layout.events_offset,
                              config.event_capacity);
    if (!ok(status)) return status;

    auto* header = reinterpret_cast<MarketHeader*>(region);
    std::memcpy(header->magic, MARKET_MAGIC, sizeof(MARKET_MAGIC));
    header->version = MARKET_VERSION;
    header->flags = MARKET_FLAG_INITIALIZED;
    header->market_id = config.market_id;
    header->base_vault = config.base_vault;
    header->quote_vault = config.quote_vault;
    header->fee_receiver = config.fee_receiver;
    header->prune_authority = config.prune_authority;
    header->consume_authority = config.consume_authority;
    header->referral_account = config.referral_account;
    header->base_decimals = config.base_decimals;
    header->quote_decimals = config.quote_decimals;
    header->request_policy = config.request_policy;
    header->event_policy = config.event_policy;
    header->max_match_steps = config.max_match_steps;
    header->fee_tier_count = config.fee_tier_count;
    header->base_lot_size = config.base_lot_size;
    header->quote_lot_size = config.quote_lot_size;
    for (size_t i = 0; i < MAX_FEE_TIERS; ++i) {
        header->fee_tiers[i] = i < config.fee_tier_count ? config.fee_tiers[i] : FeeTier{0, 0};
    }
    header->referrer_rebate_bps = config.referrer_rebate_bps;
    header->bids_capacity = config.bids_capacity;
    header->asks_capacity = config.asks_capacity;
    header->request_capacity = config.request_capacity;
    header->event_capacity = config.event_capacity;
    header->bids_offset = layout.bids_offset;
    header->asks_offset = layout.asks_offset;
    header->requests_offset = layout.requests_offset;
    header->events_offset = layout.events_offset;
    header->total_size = layout.total_size;

    logger().info("market {} initialized: {} bytes, lots {}/{}, capacities bids={} asks={} requests={} events={}",
                  config.market_id, layout.total_size, config.base_lot_size, config.quote_lot_size,
                  config.bids_capacity, config.asks_capacity,
                  config.request_capacity, config.event_capacity);
    return ErrorCode::OK;
}

bool MarketState::is_initialized(const uint8_t* region, size_t length) noexcept {
    if (length < sizeof(MarketHeader)) {
        return false;
    }
    const auto* header = reinterpret_cast<const MarketHeader*>(region);
    return std::memcmp(header->magic, MARKET_MAGIC, sizeof(MARKET_MAGIC)) == 0 &&
           (header->flags & MARKET_FLAG_INITIALIZED) != 0;
}

ErrorCode MarketState::attach(uint8_t* region, size_t length, MarketState& out) noexcept {
    if (length < sizeof(MarketHeader)) {
        return ErrorCode::REGION_TOO_SMALL;
    }
    if (!is_initialized(region, length)) {
        return ErrorCode::MARKET_NOT_INITIALIZED;
    }

    auto* header = reinterpret_cast<MarketHeader*>(region);
    if (header->version != MARKET_VERSION) {
        return ErrorCode::CORRUPT_STATE;
    }

    // Offsets are never trusted as stored: re-derive and compare
    const MarketLayout layout = MarketLayout::compute(header->bids_capacity, header->asks_capacity,
                                                      header->request_capacity, header->event_capacity);
    if (layout.bids_offset != header->bids_offset || layout.asks_offset != header->asks_offset ||
        layout.requests_offset != header->requests_offset ||
        layout.events_offset != header->events_offset || layout.total_size != header->total_size) {
        logger().error("market {} layout does not match its capacities", header->market_id);
        return ErrorCode::CORRUPT_STATE;
    }
    if (length < layout.total_size) {
        return ErrorCode::REGION_TOO_SMALL;
    }
    if (header->fee_tier_count == 0 || header->fee_tier_count > MAX_FEE_TIERS ||
        header->base_lot_size == 0 || header->quote_lot_size == 0 ||
        header->referrer_rebate_bps > BPS_DENOMINATOR ||
        !is_valid(header->request_policy) || !is_valid(header->event_policy)) {
        return ErrorCode::CORRUPT_STATE;
    }

    const slab::Slab bids(region + layout.bids_offset, layout.asks_offset - layout.bids_offset);
    const slab::Slab asks(region + layout.asks_offset, layout.requests_offset - layout.asks_offset);
    RequestQueue requests(region + layout.requests_offset, layout.events_offset - layout.requests_offset,
                          header->request_policy, ErrorCode::REQUEST_QUEUE_FULL);
    EventQueue events(region + layout.events_offset, layout.total_size - layout.events_offset,
                      header->event_policy, ErrorCode::EVENT_QUEUE_FULL);

    for (const ErrorCode status : {bids.validate(), asks.validate(), requests.validate(), events.validate()}) {
        if (!ok(status)) {
            return status;
        }
    }

    out.header_ = header;
    out.book_ = book::OrderBook(critbit::CritbitIndex(bids), critbit::CritbitIndex(asks));
    out.requests_ = requests;
    out.events_ = events;
    return ErrorCode::OK;
}

} // namespace strata::market
