#pragma once

#include <cstdint>
#include <limits>
#include <optional>

namespace vault_ledger {

// Monetary amounts are 1e6-scaled integers (6 decimal places).
using Amount = uint64_t;
using Shares = uint64_t;
using SignedAmount = int64_t;
using UnixSeconds = int64_t;
using u128 = unsigned __int128;

constexpr Amount AMOUNT_SCALE = 1000000;
constexpr uint32_t BPS_DENOMINATOR = 10000;

namespace fixed {

inline std::optional<uint64_t> checked_add(uint64_t a, uint64_t b) {
    uint64_t out = 0;
    if (__builtin_add_overflow(a, b, &out)) return std::nullopt;
    return out;
}

inline std::optional<uint64_t> checked_sub(uint64_t a, uint64_t b) {
    if (b > a) return std::nullopt;
    return a - b;
}

inline uint64_t saturating_sub(uint64_t a, uint64_t b) {
    return b > a ? 0 : a - b;
}

/**
 * floor(a * b / d) with a 128-bit intermediate product.
 * nullopt on division by zero or when the quotient does not fit 64 bits.
 */
inline std::optional<uint64_t> mul_div_floor(uint64_t a, uint64_t b, uint64_t d) {
    if (d == 0) return std::nullopt;
    u128 q = static_cast<u128>(a) * static_cast<u128>(b) / d;
    if (q > std::numeric_limits<uint64_t>::max()) return std::nullopt;
    return static_cast<uint64_t>(q);
}

/**
 * ceil(a * b / d); rounds against the caller when burning shares.
 */
inline std::optional<uint64_t> mul_div_ceil(uint64_t a, uint64_t b, uint64_t d) {
    if (d == 0) return std::nullopt;
    u128 num = static_cast<u128>(a) * static_cast<u128>(b);
    u128 q = num / d;
    if (num % d != 0) ++q;
    if (q > std::numeric_limits<uint64_t>::max()) return std::nullopt;
    return static_cast<uint64_t>(q);
}

// Basis-point share of an amount, rounded down.
inline std::optional<uint64_t> bps_of(uint64_t amount, uint32_t bps) {
    return mul_div_floor(amount, bps, BPS_DENOMINATOR);
}

inline uint64_t abs_of(int64_t v) {
    // Two's complement magnitude; well defined for INT64_MIN.
    return v < 0 ? static_cast<uint64_t>(0) - static_cast<uint64_t>(v) : static_cast<uint64_t>(v);
}

} // namespace fixed
} // namespace vault_ledger
