#pragma once

/**
 * Overflow-checked arithmetic on native amounts.
 * Every helper returns false (and leaves `out` unspecified) on overflow.
 */

#include <cstdint>

#include "common.hpp"

namespace strata {

namespace detail {
__extension__ typedef unsigned __int128 uint128;
} // namespace detail

[[nodiscard]] STRATA_FORCE_INLINE bool checked_add(uint64_t a, uint64_t b, uint64_t& out) noexcept {
    return !__builtin_add_overflow(a, b, &out);
}

[[nodiscard]] STRATA_FORCE_INLINE bool checked_sub(uint64_t a, uint64_t b, uint64_t& out) noexcept {
    return !__builtin_sub_overflow(a, b, &out);
}

[[nodiscard]] STRATA_FORCE_INLINE bool checked_mul(uint64_t a, uint64_t b, uint64_t& out) noexcept {
    return !__builtin_mul_overflow(a, b, &out);
}

[[nodiscard]] inline bool checked_mul3(uint64_t a, uint64_t b, uint64_t c, uint64_t& out) noexcept {
    uint64_t partial = 0;
    return checked_mul(a, b, partial) && checked_mul(partial, c, out);
}

/**
 * ceil(amount * bps / 10'000), computed in 128 bits
 */
[[nodiscard]] inline bool fee_ceil(uint64_t amount, uint64_t bps, uint64_t& out) noexcept {
    using u128 = detail::uint128;
    const u128 scaled = static_cast<u128>(amount) * bps;
    const u128 fee = (scaled + BPS_DENOMINATOR - 1) / BPS_DENOMINATOR;
    if (fee > UINT64_MAX) return false;
    out = static_cast<uint64_t>(fee);
    return true;
}

/**
 * floor(amount * bps / 10'000), computed in 128 bits
 */
[[nodiscard]] inline bool fee_floor(uint64_t amount, uint64_t bps, uint64_t& out) noexcept {
    using u128 = detail::uint128;
    const u128 fee = static_cast<u128>(amount) * bps / BPS_DENOMINATOR;
    if (fee > UINT64_MAX) return false;
    out = static_cast<uint64_t>(fee);
    return true;
}

} // namespace strata
