#pragma once

/**
 * Invocation processor - the boundary with the execution host
 *
 * One call to execute() is one invocation:
 *   1. reject duplicate or overlapping account regions
 *   2. decode the instruction
 *   3. attach the market region, refuse reentry (persisted in-progress flag)
 *   4. snapshot every region, dispatch, restore all of them on any error
 *
 * The host persists the regions only when the returned status is OK and
 * only then applies the reported token transfers.
 */

#include <cstddef>
#include <cstdint>
#include <vector>

#include "common.hpp"
#include "error.hpp"
#include "instruction.hpp"
#include "market_state.hpp"
#include "matching.hpp"
#include "open_orders.hpp"

namespace strata::engine {

enum class TransferKind : uint8_t { DEPOSIT = 0, WITHDRAW = 1 };

/**
 * Vault movement the host must perform after a successful invocation
 */
struct TokenTransfer {
    TransferKind kind;
    Asset asset;
    uint64_t account;
    uint64_t amount;

    bool operator==(const TokenTransfer&) const = default;
};

/**
 * Host-side view of owners' external token balances
 */
class FundingSource {
public:
    virtual ~FundingSource() = default;
    [[nodiscard]] virtual uint64_t available(uint64_t account, Asset asset) const = 0;
};

struct AccountRegion {
    OwnerId id;
    uint8_t* data;
    size_t length;
};

struct InvocationContext {
    uint8_t* market{nullptr};
    size_t market_length{0};
    std::vector<AccountRegion> open_orders;
    uint64_t signer{0};
    const FundingSource* funding{nullptr};
};

struct InvocationResult {
    ErrorCode status{ErrorCode::OK};
    std::vector<TokenTransfer> transfers;
    uint32_t events_consumed{0};
    uint32_t requests_processed{0};
    OrderKey order_id{};
    Quantity base_filled{0};
    Quantity posted_quantity{0};

    [[nodiscard]] bool ok() const noexcept { return status == ErrorCode::OK; }
};

class Processor {
public:
    explicit Processor(InvocationContext context);

    // Non-copyable: holds the invocation's snapshots
    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;

    [[nodiscard]] InvocationResult execute(const uint8_t* instruction, size_t length);

    [[nodiscard]] const InvocationContext& context() const noexcept { return context_; }

private:
    [[nodiscard]] ErrorCode check_accounts() const noexcept;
    [[nodiscard]] ErrorCode dispatch(const codec::Instruction& instruction, InvocationResult& result);

    [[nodiscard]] ErrorCode handle(const codec::InitMarket& ix, InvocationResult& result);
    [[nodiscard]] ErrorCode handle(const codec::NewOrder& ix, InvocationResult& result);
    [[nodiscard]] ErrorCode handle(const codec::CancelOrder& ix, InvocationResult& result);
    [[nodiscard]] ErrorCode handle(const codec::CancelOrderByClientId& ix, InvocationResult& result);
    [[nodiscard]] ErrorCode handle(const codec::ConsumeEvents& ix, InvocationResult& result);
    [[nodiscard]] ErrorCode handle(const codec::SettleFunds& ix, InvocationResult& result);
    [[nodiscard]] ErrorCode handle(const codec::InitOpenOrders& ix, InvocationResult& result);
    [[nodiscard]] ErrorCode handle(const codec::CloseOpenOrders& ix, InvocationResult& result);
    [[nodiscard]] ErrorCode handle(const codec::Prune& ix, InvocationResult& result);
    [[nodiscard]] ErrorCode handle(const codec::SweepFees& ix, InvocationResult& result);
    [[nodiscard]] ErrorCode handle(const codec::MatchOrders& ix, InvocationResult& result);
    [[nodiscard]] ErrorCode handle(const codec::ConsumeEventsPermissioned& ix, InvocationResult& result);

    [[nodiscard]] const AccountRegion* find_region(OwnerId id) const noexcept;
    [[nodiscard]] ErrorCode open_orders_for(OwnerId id, market::OpenOrders& out) const noexcept;
    [[nodiscard]] ErrorCode authorize(const market::OpenOrders& account) const noexcept;

    [[nodiscard]] ErrorCode deposit(OwnerId owner, Asset asset, uint64_t amount, InvocationResult& result);
    [[nodiscard]] ErrorCode withdraw(uint64_t account, Asset asset, uint64_t amount, InvocationResult& result);

    /**
     * Run queued requests in FIFO order. With `require_accounts` a request
     * whose owner region is absent fails the invocation, otherwise it stops
     * the drain.
     */
    [[nodiscard]] ErrorCode drain_requests(size_t limit, bool require_accounts, InvocationResult& result);
    [[nodiscard]] ErrorCode consume_events(size_t limit, InvocationResult& result);

    // Events or requests still queued for `owner`
    [[nodiscard]] bool has_queued_work(OwnerId owner) const noexcept;

    [[nodiscard]] ErrorCode submit_cancel(const market::OpenOrders& owner, const OrderKey& key,
                                          InvocationResult& result);

    void take_snapshot(size_t market_bytes);
    void restore_snapshot() noexcept;

    InvocationContext context_;
    market::MarketState market_;
    std::vector<uint8_t> market_snapshot_;
    std::vector<std::vector<uint8_t>> account_snapshots_;
};

} // namespace strata::engine
