#pragma once

#include <string>
#include <ctime>
#include <sstream>
#include <iomanip>
#include <optional>
#include <cctype>
#include "fixed_point.hpp"

namespace vault_ledger {

/**
 * Shared helpers for the control surface and log output.
 */
namespace utils {

/**
 * Format Unix seconds as ISO 8601 (e.g., "2024-01-15T10:30:00Z"). Empty for 0.
 */
inline std::string sec_to_iso(int64_t sec) {
    if (sec <= 0) return "";
    std::time_t t = static_cast<std::time_t>(sec);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

/**
 * Parse "2024-01-15T10:30:00Z" or "2024-01-15T10:30:00" to Unix seconds.
 */
inline std::optional<int64_t> parse_iso_sec(const std::string& s) {
    if (s.empty()) return std::nullopt;
    std::tm tm{};
    std::istringstream ss(s);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) return std::nullopt;
    return static_cast<int64_t>(timegm(&tm));
}

/**
 * 1e6-scaled amount as a decimal string, e.g. 12500000 -> "12.500000".
 */
inline std::string format_amount(Amount v) {
    std::ostringstream ss;
    ss << (v / AMOUNT_SCALE) << "." << std::setw(6) << std::setfill('0') << (v % AMOUNT_SCALE);
    return ss.str();
}

inline std::string format_signed_amount(SignedAmount v) {
    std::string body = format_amount(fixed::abs_of(v));
    return v < 0 ? "-" + body : body;
}

/**
 * Parse a decimal string ("12", "12.5", "0.000001") into 1e6 units.
 * Rejects more than six fractional digits, signs, and values that overflow.
 */
inline std::optional<Amount> parse_amount(const std::string& s) {
    if (s.empty()) return std::nullopt;
    Amount whole = 0;
    Amount frac = 0;
    size_t frac_digits = 0;
    bool seen_dot = false;
    bool seen_digit = false;
    for (char c : s) {
        if (c == '.') {
            if (seen_dot) return std::nullopt;
            seen_dot = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        seen_digit = true;
        Amount digit = static_cast<Amount>(c - '0');
        if (seen_dot) {
            if (++frac_digits > 6) return std::nullopt;
            frac = frac * 10 + digit;
        } else {
            auto scaled = fixed::mul_div_floor(whole, 10, 1);
            if (!scaled) return std::nullopt;
            auto next = fixed::checked_add(*scaled, digit);
            if (!next) return std::nullopt;
            whole = *next;
        }
    }
    if (!seen_digit) return std::nullopt;
    for (size_t i = frac_digits; i < 6; ++i) frac *= 10;
    auto whole_units = fixed::mul_div_floor(whole, AMOUNT_SCALE, 1);
    if (!whole_units) return std::nullopt;
    return fixed::checked_add(*whole_units, frac);
}

} // namespace utils
} // namespace vault_ledger
