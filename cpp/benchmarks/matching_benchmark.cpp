/**
 * Strata Matching Benchmark Suite
 *
 * Methodology:
 * 1. Seed phase: build realistic resting depth on both sides
 * 2. Warmup phase: stabilize caches and branch predictors
 * 3. Per-operation timing with steady_clock, event crank outside the timed region
 * 4. Statistical analysis: mean, stddev, percentiles
 *
 * Every timed call is a full invocation: decode, attach, snapshot, match, emit.
 */

#include "strata/critbit.hpp"
#include "strata/logging.hpp"
#include "strata/processor.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <vector>

using namespace strata;

// =============================================================================
// STATISTICAL ANALYSIS
// =============================================================================

struct BenchmarkStats {
    double mean;
    double stddev;
    double min_val;
    double max_val;
    double p50;
    double p90;
    double p99;
    double p999;
    size_t sample_count;
};

BenchmarkStats compute_stats(std::vector<int64_t>& samples) {
    BenchmarkStats stats{};
    stats.sample_count = samples.size();
    if (samples.empty()) return stats;

    std::sort(samples.begin(), samples.end());
    stats.min_val = static_cast<double>(samples.front());
    stats.max_val = static_cast<double>(samples.back());

    const double sum = std::accumulate(samples.begin(), samples.end(), 0.0);
    stats.mean = sum / samples.size();

    double sq_sum = 0;
    for (auto v : samples) {
        const double diff = static_cast<double>(v) - stats.mean;
        sq_sum += diff * diff;
    }
    stats.stddev = std::sqrt(sq_sum / samples.size());

    auto percentile = [&samples](double p) {
        size_t idx = static_cast<size_t>(samples.size() * p);
        if (idx >= samples.size()) idx = samples.size() - 1;
        return static_cast<double>(samples[idx]);
    };
    stats.p50 = percentile(0.50);
    stats.p90 = percentile(0.90);
    stats.p99 = percentile(0.99);
    stats.p999 = percentile(0.999);
    return stats;
}

void print_stats(const std::string& name, const BenchmarkStats& stats, const std::string& unit = "ns") {
    std::cout << name << ":\n";
    std::cout << "  Mean:        " << std::fixed << std::setprecision(2) << stats.mean << " " << unit << "\n";
    std::cout << "  Stddev:      " << stats.stddev << " " << unit << "\n";
    std::cout << "  Min:         " << stats.min_val << " " << unit << "\n";
    std::cout << "  Max:         " << stats.max_val << " " << unit << "\n";
    std::cout << "  P50:         " << stats.p50 << " " << unit << "\n";
    std::cout << "  P90:         " << stats.p90 << " " << unit << "\n";
    std::cout << "  P99:         " << stats.p99 << " " << unit << "\n";
    std::cout << "  P99.9:       " << stats.p999 << " " << unit << "\n";
    std::cout << "  Samples:     " << stats.sample_count << "\n";
}

// =============================================================================
// BENCH MARKET
// =============================================================================

class UnlimitedFunding : public engine::FundingSource {
public:
    [[nodiscard]] uint64_t available(uint64_t, Asset) const override { return UINT64_MAX / 4; }
};

/**
 * One market region plus a fixed set of funded owners
 */
class BenchMarket {
public:
    static constexpr size_t OWNERS = 64;

    BenchMarket() {
        config_.market_id = 1;
        config_.bids_capacity = 16383;
        config_.asks_capacity = 16383;
        config_.event_capacity = 8192;
        config_.request_capacity = 16;
        config_.max_match_steps = 256;
        market_.assign(market::MarketState::required_size(config_), 0);
        for (size_t i = 0; i < OWNERS; ++i) {
            accounts_.emplace_back(market::OpenOrders::region_size(), 0);
        }
        require(execute(0, codec::InitMarket{config_}));
        for (size_t i = 0; i < OWNERS; ++i) {
            require(execute(i + 1, codec::InitOpenOrders{i + 1, i + 1}));
        }
    }

    engine::InvocationResult execute(uint64_t signer, const codec::Instruction& ix) {
        uint8_t buf[codec::MAX_INSTRUCTION_SIZE];
        const size_t n = codec::encode(ix, buf, sizeof(buf));

        engine::InvocationContext ctx;
        ctx.market = market_.data();
        ctx.market_length = market_.size();
        ctx.signer = signer;
        ctx.funding = &funding_;
        ctx.open_orders.reserve(OWNERS);
        for (size_t i = 0; i < OWNERS; ++i) {
            ctx.open_orders.push_back(engine::AccountRegion{i + 1, accounts_[i].data(), accounts_[i].size()});
        }
        engine::Processor processor(std::move(ctx));
        return processor.execute(buf, n);
    }

    void crank() { require(execute(0, codec::ConsumeEvents{UINT16_MAX})); }

    [[nodiscard]] uint64_t resting_orders() {
        market::MarketState state;
        if (!ok(market::MarketState::attach(market_.data(), market_.size(), state))) return 0;
        return state.book().order_count();
    }

private:
    static void require(const engine::InvocationResult& result) {
        if (!result.ok()) {
            std::cerr << "setup invocation failed: " << error_name(result.status) << "\n";
            std::exit(1);
        }
    }

    market::MarketConfig config_;
    std::vector<uint8_t> market_;
    std::vector<std::vector<uint8_t>> accounts_;
    UnlimitedFunding funding_;
};

codec::NewOrder make_order(std::mt19937_64& rng, OwnerId owner, Side side, Price price, Quantity qty) {
    codec::NewOrder ix;
    ix.owner = owner;
    ix.side = side;
    ix.self_trade = (rng() & 1) ? SelfTradeBehavior::CANCEL_OLDEST : SelfTradeBehavior::DECREMENT_AND_CANCEL;
    ix.limit_price = price;
    ix.max_base_qty = qty;
    ix.max_quote_qty = side == Side::BID ? UINT64_MAX : 0;
    ix.client_order_id = rng();
    return ix;
}

// =============================================================================
// BENCHMARK: NEW ORDER LATENCY
// =============================================================================

void benchmark_new_order_latency() {
    std::cout << "\n=== BENCHMARK: NEW ORDER LATENCY ===\n\n";

    constexpr int WARMUP_ITERATIONS = 1000;
    constexpr int BENCHMARK_ITERATIONS = 20000;

    BenchMarket bench;
    std::mt19937_64 rng(42);
    std::uniform_int_distribution<uint64_t> price_dist(9900, 10100);
    std::uniform_int_distribution<uint64_t> qty_dist(1, 100);
    std::uniform_int_distribution<uint64_t> owner_dist(1, BenchMarket::OWNERS);

    auto next_order = [&](int i) {
        const Side side = (i % 2 == 0) ? Side::BID : Side::ASK;
        const uint64_t price = price_dist(rng) + (side == Side::BID ? -60 : 60);
        return make_order(rng, owner_dist(rng), side, price, qty_dist(rng));
    };

    size_t warmup_rejected = 0;
    std::cout << "Phase 1: Seeding and warmup (" << WARMUP_ITERATIONS << " orders)...\n";
    for (int i = 0; i < WARMUP_ITERATIONS; ++i) {
        const codec::NewOrder ix = next_order(i);
        if (!bench.execute(ix.owner, ix).ok()) ++warmup_rejected;
        if (i % 16 == 0) bench.crank();
    }
    bench.crank();
    std::cout << "  Book depth: " << bench.resting_orders() << " resting orders, "
              << warmup_rejected << " rejected\n\n";

    std::cout << "Phase 2: Benchmark (" << BENCHMARK_ITERATIONS << " orders)...\n";
    std::vector<int64_t> latencies;
    latencies.reserve(BENCHMARK_ITERATIONS);
    size_t rejected = 0;

    for (int i = 0; i < BENCHMARK_ITERATIONS; ++i) {
        const codec::NewOrder ix = next_order(i);
        const auto start = std::chrono::steady_clock::now();
        const auto result = bench.execute(ix.owner, ix);
        const auto end = std::chrono::steady_clock::now();
        latencies.push_back(std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
        if (!result.ok()) ++rejected;
        if (i % 16 == 0) bench.crank();
    }

    auto stats = compute_stats(latencies);
    std::cout << "\nRESULTS: NEW ORDER LATENCY\n";
    std::cout << "-------------------------------------------\n";
    print_stats("Per-invocation latency", stats);
    std::cout << "  Rejected:    " << rejected << "\n";
    std::cout << "\nTHROUGHPUT: " << std::fixed << std::setprecision(0) << (1e9 / stats.mean)
              << " invocations/sec\n";
}

// =============================================================================
// BENCHMARK: CANCEL LATENCY
// =============================================================================

void benchmark_cancel_latency() {
    std::cout << "\n=== BENCHMARK: CANCEL ORDER LATENCY ===\n\n";

    BenchMarket bench;
    std::mt19937_64 rng(7);
    std::uniform_int_distribution<uint64_t> qty_dist(1, 100);

    // Far from the spread so nothing matches
    std::vector<codec::CancelOrder> cancels;
    for (OwnerId owner = 1; owner <= BenchMarket::OWNERS; ++owner) {
        for (int i = 0; i < 60; ++i) {
            const Side side = (i % 2 == 0) ? Side::BID : Side::ASK;
            const Price price = side == Side::BID ? 9000 - rng() % 500 : 11000 + rng() % 500;
            const auto result = bench.execute(owner, make_order(rng, owner, side, price, qty_dist(rng)));
            if (result.ok() && result.posted_quantity > 0) {
                cancels.push_back(codec::CancelOrder{owner, result.order_id});
            }
        }
    }
    std::cout << "  Created " << cancels.size() << " resting orders\n\n";
    std::shuffle(cancels.begin(), cancels.end(), rng);

    std::vector<int64_t> latencies;
    latencies.reserve(cancels.size());
    for (size_t i = 0; i < cancels.size(); ++i) {
        const auto start = std::chrono::steady_clock::now();
        const auto result = bench.execute(cancels[i].owner, cancels[i]);
        const auto end = std::chrono::steady_clock::now();
        if (result.ok()) {
            latencies.push_back(std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
        }
        if (i % 64 == 0) bench.crank();
    }

    auto stats = compute_stats(latencies);
    std::cout << "RESULTS: CANCEL ORDER LATENCY\n";
    std::cout << "-------------------------------------------\n";
    print_stats("Per-cancel latency", stats);
}

// =============================================================================
// BENCHMARK: CRITBIT INDEX
// =============================================================================

void benchmark_critbit() {
    std::cout << "\n=== BENCHMARK: CRITBIT INSERT / REMOVE ===\n\n";

    constexpr uint32_t CAPACITY = 1u << 16;
    constexpr int ORDERS = 20000;

    std::vector<uint8_t> region(slab::Slab::region_size(CAPACITY));
    if (!ok(slab::Slab::init(region.data(), region.size(), CAPACITY))) {
        std::cerr << "slab init failed\n";
        return;
    }
    critbit::CritbitIndex index(slab::Slab(region.data(), region.size()));

    std::mt19937_64 rng(99);
    std::vector<OrderKey> keys;
    keys.reserve(ORDERS);
    for (int i = 0; i < ORDERS; ++i) {
        keys.push_back(OrderKey::make(Side::ASK, 10000 + rng() % 1000, static_cast<SeqNum>(i)));
    }

    std::vector<int64_t> inserts;
    inserts.reserve(ORDERS);
    for (const OrderKey& key : keys) {
        slab::LeafNode leaf{};
        leaf.key = key;
        leaf.quantity = 1;
        leaf.owner_slot = NO_SLOT;
        const auto start = std::chrono::steady_clock::now();
        const ErrorCode status = index.insert(leaf);
        const auto end = std::chrono::steady_clock::now();
        if (ok(status)) {
            inserts.push_back(std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
        }
    }

    std::shuffle(keys.begin(), keys.end(), rng);
    std::vector<int64_t> removes;
    removes.reserve(ORDERS);
    for (const OrderKey& key : keys) {
        const auto start = std::chrono::steady_clock::now();
        const auto removed = index.remove(key);
        const auto end = std::chrono::steady_clock::now();
        if (removed) {
            removes.push_back(std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
        }
    }

    auto insert_stats = compute_stats(inserts);
    auto remove_stats = compute_stats(removes);
    print_stats("Insert latency", insert_stats);
    print_stats("Remove latency (random order)", remove_stats);
}

int main() {
    std::cout << "============================================================\n";
    std::cout << "            STRATA MATCHING ENGINE - BENCHMARK SUITE        \n";
    std::cout << "============================================================\n";

    set_log_level(spdlog::level::warn);

    benchmark_critbit();
    benchmark_new_order_latency();
    benchmark_cancel_latency();

    std::cout << "\n============================================================\n";
    std::cout << "                    BENCHMARK COMPLETE                      \n";
    std::cout << "============================================================\n";
    return 0;
}
