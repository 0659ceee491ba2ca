#pragma once

/**
 * Strata - Persisted Central Limit Order Book
 *
 * Shared vocabulary for every module: compiler hints, scalar aliases,
 * order enums and the 128-bit sort key.
 *
 * Memory Model:
 * - The whole market lives in one flat, externally persisted byte region
 * - No pointers are ever stored in that region, only node indices
 * - All multi-byte fields use native (little-endian) byte order
 */

#include <bit>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace strata {

static_assert(std::endian::native == std::endian::little,
              "Persisted layout is defined as little-endian");

// =============================================================================
// COMPILER HINTS FOR HOT PATH OPTIMIZATION
// =============================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define STRATA_FORCE_INLINE __attribute__((always_inline)) inline
    #define STRATA_EXPECT(expr, val) __builtin_expect((expr), (val))
#else
    #define STRATA_FORCE_INLINE inline
    #define STRATA_EXPECT(expr, val) (expr)
#endif

#define STRATA_UNLIKELY(x) STRATA_EXPECT(!!(x), 0)

// =============================================================================
// SCALAR ALIASES AND CONSTANTS
// =============================================================================

using NodeHandle = uint32_t;     // Stable index of a slab node
using OwnerId = uint64_t;        // Identity of an open-orders record
using Price = uint64_t;          // Quote lots per base lot
using Quantity = uint64_t;       // Base lots
using SeqNum = uint64_t;

static constexpr NodeHandle NIL_NODE = std::numeric_limits<NodeHandle>::max();
static constexpr uint8_t NO_SLOT = 0xFF;
static constexpr size_t MAX_OPEN_ORDERS = 128;
static constexpr size_t MAX_FEE_TIERS = 4;
static constexpr uint64_t BPS_DENOMINATOR = 10'000;

// =============================================================================
// ENUMS
// =============================================================================

enum class Side : uint8_t { BID = 0, ASK = 1 };

enum class OrderType : uint8_t {
    LIMIT = 0,
    IMMEDIATE_OR_CANCEL = 1,
    POST_ONLY = 2
};

enum class SelfTradeBehavior : uint8_t {
    CANCEL_OLDEST = 0,          // Remove the resting order, keep matching
    CANCEL_NEWEST = 1,          // Stop the incoming order
    DECREMENT_AND_CANCEL = 2,   // Cancel the smaller side, shrink the larger
    ABORT_TRANSACTION = 3       // Fail the whole instruction
};

enum class QueueFullPolicy : uint8_t {
    REJECT = 0,
    OVERWRITE_OLDEST = 1
};

enum class Asset : uint8_t { BASE = 0, QUOTE = 1 };

[[nodiscard]] constexpr Side opposite(Side side) noexcept {
    return side == Side::BID ? Side::ASK : Side::BID;
}

[[nodiscard]] constexpr bool is_valid(Side side) noexcept {
    return static_cast<uint8_t>(side) <= 1;
}

[[nodiscard]] constexpr bool is_valid(OrderType type) noexcept {
    return static_cast<uint8_t>(type) <= 2;
}

[[nodiscard]] constexpr bool is_valid(SelfTradeBehavior stb) noexcept {
    return static_cast<uint8_t>(stb) <= 3;
}

[[nodiscard]] constexpr bool is_valid(QueueFullPolicy policy) noexcept {
    return static_cast<uint8_t>(policy) <= 1;
}

// =============================================================================
// ORDER KEY
// 128-bit sort key, also used as the order id.
// hi = price, lo = sequence number (bitwise-NOT for bids) so that for both
// sides the best order is reached first: find_max on bids, find_min on asks.
// =============================================================================

struct OrderKey {
    uint64_t hi;
    uint64_t lo;

    [[nodiscard]] static constexpr OrderKey make(Side side, Price price, SeqNum seq) noexcept {
        return OrderKey{price, side == Side::BID ? ~seq : seq};
    }

    [[nodiscard]] constexpr Price price() const noexcept { return hi; }

    [[nodiscard]] constexpr SeqNum seq_num(Side side) const noexcept {
        return side == Side::BID ? ~lo : lo;
    }

    /**
     * Bit at `depth`, counted from the most significant bit (depth 0)
     */
    [[nodiscard]] constexpr unsigned bit_at(uint32_t depth) const noexcept {
        return depth < 64
            ? static_cast<unsigned>((hi >> (63 - depth)) & 1u)
            : static_cast<unsigned>((lo >> (127 - depth)) & 1u);
    }

    /**
     * Number of leading bits shared with `other` (128 when equal)
     */
    [[nodiscard]] constexpr uint32_t common_prefix_len(const OrderKey& other) const noexcept {
        const uint64_t high_diff = hi ^ other.hi;
        if (high_diff != 0) {
            return static_cast<uint32_t>(std::countl_zero(high_diff));
        }
        return 64u + static_cast<uint32_t>(std::countl_zero(lo ^ other.lo));
    }

    friend constexpr bool operator==(const OrderKey&, const OrderKey&) = default;
    friend constexpr auto operator<=>(const OrderKey&, const OrderKey&) = default;
};

static_assert(sizeof(OrderKey) == 16, "OrderKey must be 16 bytes");

} // namespace strata
