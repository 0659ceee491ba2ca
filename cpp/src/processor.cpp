#include "strata/processor.hpp"

#include <algorithm>
#include <cstring>
#include <new>
#include <utility>
#include <variant>

#include "strata/checked_math.hpp"
#include "strata/logging.hpp"

namespace strata::engine {

using codec::Instruction;
using queue::Request;
using queue::RequestKind;

namespace {

[[nodiscard]] bool overlaps(const uint8_t* a, size_t a_len, const uint8_t* b, size_t b_len) noexcept {
    return a < b + b_len && b < a + a_len;
}

} // namespace

Processor::Processor(InvocationContext context)
    : context_(std::move(context))
{
}

// =============================================================================
// INVOCATION
// =============================================================================

InvocationResult Processor::execute(const uint8_t* instruction, size_t length) {
    InvocationResult result;

    result.status = check_accounts();
    if (!ok(result.status)) {
        return result;
    }

    Instruction decoded;
    result.status = codec::decode(instruction, length, decoded);
    if (!ok(result.status)) {
        logger().debug("undecodable instruction ({} bytes)", length);
        return result;
    }

    const bool initializing = std::holds_alternative<codec::InitMarket>(decoded);
    size_t market_bytes = context_.market_length;
    if (!initializing) {
        result.status = market::MarketState::attach(context_.market, context_.market_length, market_);
        if (!ok(result.status)) {
            return result;
        }
        if (market_.in_progress()) {
            logger().warn("market {} re-entered during an invocation", market_.header().market_id);
            result.status = ErrorCode::REENTRANT_INVOCATION;
            return result;
        }
        market_bytes = market_.size();
    }

    take_snapshot(market_bytes);
    if (!initializing) {
        market_.set_in_progress(true);
    }

    ErrorCode status = ErrorCode::OK;
    try {
        status = dispatch(decoded, result);
    } catch (const std::bad_alloc&) {
        restore_snapshot();
        logger().error("{} ran out of memory, state rolled back",
                       codec::instruction_name(codec::tag_of(decoded)));
        throw;
    }

    if (ok(status) && !initializing) {
        market_.set_in_progress(false);
    }
    if (!ok(status)) {
        restore_snapshot();
        logger().debug("{} rejected with {}, state rolled back",
                       codec::instruction_name(codec::tag_of(decoded)), error_name(status));
        result = InvocationResult{};
    }
    market_snapshot_.clear();
    account_snapshots_.clear();

    result.status = status;
    return result;
}

ErrorCode Processor::check_accounts() const noexcept {
    const auto& regions = context_.open_orders;
    for (size_t i = 0; i < regions.size(); ++i) {
        if (regions[i].data == nullptr) {
            return ErrorCode::MISSING_OPEN_ORDERS;
        }
        if (overlaps(regions[i].data, regions[i].length, context_.market, context_.market_length)) {
            return ErrorCode::DUPLICATE_ACCOUNT;
        }
        for (size_t j = i + 1; j < regions.size(); ++j) {
            if (regions[i].id == regions[j].id ||
                overlaps(regions[i].data, regions[i].length, regions[j].data, regions[j].length)) {
                return ErrorCode::DUPLICATE_ACCOUNT;
            }
        }
    }
    return ErrorCode::OK;
}

ErrorCode Processor::dispatch(const Instruction& instruction, InvocationResult& result) {
    return std::visit([this, &result](const auto& ix) { return handle(ix, result); }, instruction);
}

void Processor::take_snapshot(size_t market_bytes) {
    market_snapshot_.assign(context_.market, context_.market + market_bytes);
    account_snapshots_.clear();
    account_snapshots_.reserve(context_.open_orders.size());
    for (const AccountRegion& region : context_.open_orders) {
        const size_t bytes = std::min(region.length, market::OpenOrders::region_size());
        account_snapshots_.emplace_back(region.data, region.data + bytes);
    }
}

void Processor::restore_snapshot() noexcept {
    if (!market_snapshot_.empty()) {
        std::memcpy(context_.market, market_snapshot_.data(), market_snapshot_.size());
    }
    for (size_t i = 0; i < account_snapshots_.size(); ++i) {
        std::memcpy(context_.open_orders[i].data, account_snapshots_[i].data(), account_snapshots_[i].size());
    }
}

// =============================================================================
// ACCOUNTS AND FUNDS
// =============================================================================

const AccountRegion* Processor::find_region(OwnerId id) const noexcept {
    for (const AccountRegion& region : context_.open_orders) {
        if (region.id == id) {
            return &region;
        }
    }
    return nullptr;
}

ErrorCode Processor::open_orders_for(OwnerId id, market::OpenOrders& out) const noexcept {
    const AccountRegion* region = find_region(id);
    if (region == nullptr) {
        return ErrorCode::MISSING_OPEN_ORDERS;
    }
    out = market::OpenOrders(region->data, region->length);
    return out.validate(market_.header().market_id, id);
}

ErrorCode Processor::authorize(const market::OpenOrders& account) const noexcept {
    return context_.signer == account.authority() ? ErrorCode::OK : ErrorCode::UNAUTHORIZED;
}

ErrorCode Processor::deposit(OwnerId owner, Asset asset, uint64_t amount, InvocationResult& result) {
    // Deposits already promised earlier in this invocation reduce what is left
    uint64_t pending = 0;
    for (const TokenTransfer& t : result.transfers) {
        if (t.kind == TransferKind::DEPOSIT && t.account == owner && t.asset == asset) {
            pending += t.amount;
        }
    }
    const uint64_t available = context_.funding ? context_.funding->available(owner, asset) : 0;
    if (pending > available || amount > available - pending) {
        return ErrorCode::INSUFFICIENT_FUNDS;
    }

    market::MarketHeader& header = market_.header();
    uint64_t& total = asset == Asset::BASE ? header.base_deposits_total : header.quote_deposits_total;
    if (!checked_add(total, amount, total)) {
        return ErrorCode::ARITHMETIC_OVERFLOW;
    }
    result.transfers.push_back(TokenTransfer{TransferKind::DEPOSIT, asset, owner, amount});
    return ErrorCode::OK;
}

ErrorCode Processor::withdraw(uint64_t account, Asset asset, uint64_t amount, InvocationResult& result) {
    if (amount == 0) {
        return ErrorCode::OK;
    }
    market::MarketHeader& header = market_.header();
    uint64_t& total = asset == Asset::BASE ? header.base_deposits_total : header.quote_deposits_total;
    if (amount > total) {
        logger().error("withdrawal of {} exceeds market deposits {}", amount, total);
        return ErrorCode::CORRUPT_STATE;
    }
    total -= amount;
    result.transfers.push_back(TokenTransfer{TransferKind::WITHDRAW, asset, account, amount});
    return ErrorCode::OK;
}

// =============================================================================
// REQUEST QUEUE
// =============================================================================

ErrorCode Processor::drain_requests(size_t limit, bool require_accounts, InvocationResult& result) {
    Matcher matcher(market_);
    market::RequestQueue& requests = market_.requests();

    for (size_t processed = 0; processed < limit; ++processed) {
        const Request* front = requests.front();
        if (front == nullptr) break;

        market::OpenOrders owner;
        ErrorCode status = open_orders_for(front->owner, owner);
        if (status == ErrorCode::MISSING_OPEN_ORDERS && !require_accounts) {
            break;
        }
        if (!ok(status)) return status;

        const Request request = *front;
        requests.pop();

        if (request.kind == RequestKind::NEW_ORDER) {
            OrderResult order;
            status = matcher.new_order(request, owner, order);
            result.order_id = order.order_id;
            result.base_filled = order.base_filled;
            result.posted_quantity = order.posted_quantity;
        } else {
            status = matcher.cancel_order(request, owner);
        }
        if (!ok(status)) return status;
        ++result.requests_processed;
    }
    return ErrorCode::OK;
}

ErrorCode Processor::submit_cancel(const market::OpenOrders& owner, const OrderKey& key,
                                   InvocationResult& result) {
    Request request{};
    request.kind = RequestKind::CANCEL_ORDER;
    request.order_id = key;
    request.owner = owner.owner();

    const ErrorCode status = market_.requests().push(request);
    if (!ok(status)) return status;
    return drain_requests(market_.requests().size(), true, result);
}

// =============================================================================
// INSTRUCTION HANDLERS
// =============================================================================

ErrorCode Processor::handle(const codec::InitMarket& ix, InvocationResult&) {
    return market::MarketState::init(context_.market, context_.market_length, ix.config);
}

ErrorCode Processor::handle(const codec::InitOpenOrders& ix, InvocationResult&) {
    const AccountRegion* region = find_region(ix.owner);
    if (region == nullptr) {
        return ErrorCode::MISSING_OPEN_ORDERS;
    }
    if (context_.signer != ix.authority) {
        return ErrorCode::UNAUTHORIZED;
    }
    const ErrorCode status = market::OpenOrders::init(region->data, region->length,
                                                      market_.header().market_id, ix.owner, ix.authority);
    if (ok(status)) {
        logger().info("open orders {} initialized on market {}", ix.owner, market_.header().market_id);
    }
    return status;
}

ErrorCode Processor::handle(const codec::CloseOpenOrders& ix, InvocationResult&) {
    market::OpenOrders account;
    ErrorCode status = open_orders_for(ix.owner, account);
    if (!ok(status)) return status;
    status = authorize(account);
    if (!ok(status)) return status;
    if (!account.is_empty() || has_queued_work(ix.owner)) {
        return ErrorCode::OPEN_ORDERS_NOT_EMPTY;
    }
    std::memset(&account.record(), 0, market::OpenOrders::region_size());
    return ErrorCode::OK;
}

ErrorCode Processor::handle(const codec::NewOrder& ix, InvocationResult& result) {
    market::OpenOrders account;
    ErrorCode status = open_orders_for(ix.owner, account);
    if (!ok(status)) return status;
    status = authorize(account);
    if (!ok(status)) return status;

    Request request{};
    request.kind = RequestKind::NEW_ORDER;
    request.side = ix.side;
    request.order_type = ix.order_type;
    request.self_trade = ix.self_trade;
    request.fee_tier = ix.fee_tier;
    request.match_limit = ix.match_limit;
    request.owner = ix.owner;
    request.limit_price = ix.limit_price;
    request.max_base_qty = ix.max_base_qty;
    request.max_quote_qty = ix.max_quote_qty;
    request.client_order_id = ix.client_order_id;

    const market::MarketHeader& header = market_.header();
    status = Matcher::validate_order(header, request);
    if (!ok(status)) return status;

    uint64_t lock = 0;
    status = Matcher::required_lock(header, ix.side, ix.limit_price, ix.max_base_qty,
                                    ix.max_quote_qty, ix.fee_tier, lock);
    if (!ok(status)) return status;

    const Asset asset = ix.side == Side::BID ? Asset::QUOTE : Asset::BASE;
    uint64_t shortfall = 0;
    status = account.lock(asset, lock, shortfall);
    if (!ok(status)) return status;
    if (shortfall > 0) {
        status = deposit(ix.owner, asset, shortfall, result);
        if (!ok(status)) return status;
    }

    if (ix.side == Side::BID) {
        request.max_quote_qty = lock;
    }
    status = market_.requests().push(request);
    if (!ok(status)) return status;
    return drain_requests(market_.requests().size(), true, result);
}

ErrorCode Processor::handle(const codec::CancelOrder& ix, InvocationResult& result) {
    market::OpenOrders account;
    ErrorCode status = open_orders_for(ix.owner, account);
    if (!ok(status)) return status;
    status = authorize(account);
    if (!ok(status)) return status;
    return submit_cancel(account, ix.order_id, result);
}

ErrorCode Processor::handle(const codec::CancelOrderByClientId& ix, InvocationResult& result) {
    market::OpenOrders account;
    ErrorCode status = open_orders_for(ix.owner, account);
    if (!ok(status)) return status;
    status = authorize(account);
    if (!ok(status)) return status;

    const auto slot = account.slot_of_client_id(ix.client_order_id);
    if (!slot) {
        return ErrorCode::ORDER_NOT_FOUND;
    }
    return submit_cancel(account, account.slot_key(*slot), result);
}

ErrorCode Processor::handle(const codec::Prune& ix, InvocationResult& result) {
    if (context_.signer != market_.header().prune_authority) {
        return ErrorCode::UNAUTHORIZED;
    }
    market::OpenOrders account;
    ErrorCode status = open_orders_for(ix.owner, account);
    if (!ok(status)) return status;

    const size_t limit = ix.limit == 0 ? MAX_OPEN_ORDERS : ix.limit;
    size_t canceled = 0;
    for (size_t i = 0; i < MAX_OPEN_ORDERS && canceled < limit; ++i) {
        const auto slot = static_cast<uint8_t>(i);
        if (!account.slot_in_use(slot)) continue;
        // Skip slots whose order already left the book (Out not yet consumed)
        if (market_.book().find_order(account.slot_side(slot), account.slot_key(slot)) == nullptr) continue;

        status = submit_cancel(account, account.slot_key(slot), result);
        if (!ok(status)) return status;
        ++canceled;
    }
    return ErrorCode::OK;
}

ErrorCode Processor::handle(const codec::ConsumeEvents& ix, InvocationResult& result) {
    if (market_.header().consume_authority != 0) {
        return ErrorCode::UNAUTHORIZED;
    }
    return consume_events(ix.limit, result);
}

ErrorCode Processor::handle(const codec::ConsumeEventsPermissioned& ix, InvocationResult& result) {
    const uint64_t authority = market_.header().consume_authority;
    if (authority == 0 || context_.signer != authority) {
        return ErrorCode::UNAUTHORIZED;
    }
    return consume_events(ix.limit, result);
}

ErrorCode Processor::consume_events(size_t limit, InvocationResult& result) {
    market::EventQueue& events = market_.events();

    while (result.events_consumed < limit) {
        const queue::Event* event = events.front();
        if (event == nullptr) break;

        market::OpenOrders owner;
        ErrorCode status = open_orders_for(event->owner, owner);
        if (status == ErrorCode::MISSING_OPEN_ORDERS) {
            // Retry once the crank passes this owner's region
            break;
        }
        if (!ok(status)) return status;

        const uint64_t gap = events.gap_before_front();
        if (gap > 0) {
            logger().warn("event queue skipped {} overwritten events before seq {}", gap, event->seq_num);
        }

        status = owner.apply_event(*event);
        if (!ok(status)) return status;
        events.pop();
        ++result.events_consumed;
    }
    return ErrorCode::OK;
}

ErrorCode Processor::handle(const codec::SettleFunds& ix, InvocationResult& result) {
    market::OpenOrders account;
    ErrorCode status = open_orders_for(ix.owner, account);
    if (!ok(status)) return status;
    status = authorize(account);
    if (!ok(status)) return status;

    market::MarketHeader& header = market_.header();
    if (ix.referrer != 0 && header.referral_account != 0 && ix.referrer != header.referral_account) {
        return ErrorCode::INVALID_REFERRER;
    }

    uint64_t base = 0;
    uint64_t quote = 0;
    account.settle(base, quote);
    status = withdraw(ix.owner, Asset::BASE, base, result);
    if (!ok(status)) return status;
    status = withdraw(ix.owner, Asset::QUOTE, quote, result);
    if (!ok(status)) return status;

    // Without a referrer the rebate falls back to the fee pool
    const uint64_t rebates = account.take_referrer_rebates();
    if (ix.referrer != 0) {
        return withdraw(ix.referrer, Asset::QUOTE, rebates, result);
    }
    uint64_t pool = 0;
    if (!checked_add(header.quote_fees_accrued, rebates, pool)) {
        return ErrorCode::ARITHMETIC_OVERFLOW;
    }
    header.quote_fees_accrued = pool;
    return ErrorCode::OK;
}

ErrorCode Processor::handle(const codec::SweepFees&, InvocationResult& result) {
    market::MarketHeader& header = market_.header();
    if (context_.signer != header.fee_receiver) {
        return ErrorCode::UNAUTHORIZED;
    }
    const uint64_t fees = header.quote_fees_accrued;
    header.quote_fees_accrued = 0;
    return withdraw(header.fee_receiver, Asset::QUOTE, fees, result);
}

ErrorCode Processor::handle(const codec::MatchOrders& ix, InvocationResult& result) {
    return drain_requests(ix.limit, false, result);
}

bool Processor::has_queued_work(OwnerId owner) const noexcept {
    const market::EventQueue& events = market_.events();
    for (size_t i = 0; i < events.size(); ++i) {
        if (events.at(i)->owner == owner) return true;
    }
    const market::RequestQueue& requests = market_.requests();
    for (size_t i = 0; i < requests.size(); ++i) {
        if (requests.at(i)->owner == owner) return true;
    }
    return false;
}

} // namespace strata::engine
