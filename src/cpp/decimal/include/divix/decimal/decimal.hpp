/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <bdldfp_decimal.h>
#include <bdldfp_decimalconvertutil.h>
#include <bdldfp_decimalutil.h>
#include <fmt/format.h>

#include <cstdint>
#include <limits>
#include <source_location>
#include <spanstream>
#include <stdexcept>

//-------------------------------------------------------------------------

#define DEC(lit) BDLDFP_DECIMAL_DD(lit)

//-------------------------------------------------------------------------

namespace divix
{

using decimal_t = BloombergLP::bdldfp::Decimal64;

// Fixed point amount counted in minor units of some decimal precision.
using units_t = int64_t;

enum class RoundingMode : uint32_t
{
    HALF_AWAY_FROM_ZERO,
    HALF_EVEN
};

}  // namespace divix

//-------------------------------------------------------------------------

namespace divix::util
{

inline constexpr uint32_t kMaxDecimalPlaces = 18;

[[nodiscard]] inline double decimal2double(decimal_t val)
{
    return BloombergLP::bdldfp::DecimalConvertUtil::decimalToDouble(val);
}

[[nodiscard]] inline decimal_t abs(decimal_t val) noexcept
{
    return val < decimal_t{} ? -val : val;
}

[[nodiscard]] constexpr units_t pow10(uint32_t exponent)
{
    if (exponent > kMaxDecimalPlaces) {
        throw std::out_of_range{"pow10: exponent exceeds 18"};
    }
    units_t res = 1;
    for (uint32_t i = 0; i < exponent; ++i) {
        res *= 10;
    }
    return res;
}

// Rounds the integer quotient `quot` of some division whose remainder was `rem`
// and divisor `div` (both signs follow the dividend).
[[nodiscard]] constexpr units_t roundQuotient(
    units_t quot, units_t rem, units_t div, RoundingMode mode) noexcept
{
    if (rem == 0) {
        return quot;
    }
    const units_t sign = rem < 0 ? -1 : 1;
    const units_t twiceRem = (rem < 0 ? -rem : rem) * 2;
    switch (mode) {
        case RoundingMode::HALF_EVEN:
            if (twiceRem > div || (twiceRem == div && quot % 2 != 0)) {
                return quot + sign;
            }
            return quot;
        case RoundingMode::HALF_AWAY_FROM_ZERO:
        default:
            return twiceRem >= div ? quot + sign : quot;
    }
}

[[nodiscard]] constexpr units_t rescale(
    units_t units, uint32_t fromDecimals, uint32_t toDecimals, RoundingMode mode)
{
    if (toDecimals >= fromDecimals) {
        const units_t factor = pow10(toDecimals - fromDecimals);
        if (units > std::numeric_limits<units_t>::max() / factor
            || units < std::numeric_limits<units_t>::min() / factor) {
            throw std::overflow_error{"rescale: result does not fit 64 bits"};
        }
        return units * factor;
    }
    const units_t div = pow10(fromDecimals - toDecimals);
    return roundQuotient(units / div, units % div, div, mode);
}

// Checked sum of two unit amounts; throws std::overflow_error past 64 bits.
[[nodiscard]] constexpr units_t addUnits(units_t lhs, units_t rhs)
{
    if ((rhs > 0 && lhs > std::numeric_limits<units_t>::max() - rhs)
        || (rhs < 0 && lhs < std::numeric_limits<units_t>::min() - rhs)) {
        throw std::overflow_error{"addUnits: result does not fit 64 bits"};
    }
    return lhs + rhs;
}

[[nodiscard]] inline units_t toUnits(
    decimal_t val,
    uint32_t decimalPlaces,
    RoundingMode mode = RoundingMode::HALF_AWAY_FROM_ZERO,
    std::source_location sl = std::source_location::current())
{
    using namespace BloombergLP::bdldfp;

    // Largest magnitude for which a decimal integer converts exactly through double.
    static const decimal_t kExactLimit{9'007'199'254'740'992ll};

    const decimal_t scaled =
        DecimalUtil::multiplyByPowerOf10(val, static_cast<int>(decimalPlaces));
    if (!(abs(scaled) < kExactLimit)) {
        throw std::overflow_error{fmt::format(
            "{}: cannot represent {} with {} decimal places in 64-bit units",
            sl.function_name(), decimal2double(val), decimalPlaces)};
    }
    const decimal_t integral = DecimalUtil::trunc(scaled);
    const auto quot = static_cast<units_t>(decimal2double(integral));
    const decimal_t twiceFrac = abs(scaled - integral) * decimal_t{2};
    if (twiceFrac == decimal_t{}) {
        return quot;
    }
    const units_t sign = scaled < decimal_t{} ? -1 : 1;
    if (mode == RoundingMode::HALF_EVEN) {
        return twiceFrac > decimal_t{1} || (twiceFrac == decimal_t{1} && quot % 2 != 0)
            ? quot + sign
            : quot;
    }
    return twiceFrac >= decimal_t{1} ? quot + sign : quot;
}

// Drops digits beyond `decimalPlaces` instead of rounding them.
[[nodiscard]] inline units_t truncToUnits(decimal_t val, uint32_t decimalPlaces)
{
    using namespace BloombergLP::bdldfp;
    const decimal_t scaled =
        DecimalUtil::multiplyByPowerOf10(val, static_cast<int>(decimalPlaces));
    return toUnits(DecimalUtil::trunc(scaled), 0);
}

[[nodiscard]] inline decimal_t fromUnits(units_t units, uint32_t decimalPlaces)
{
    return BloombergLP::bdldfp::DecimalUtil::multiplyByPowerOf10(
        decimal_t{static_cast<long long>(units)}, -static_cast<int>(decimalPlaces));
}

[[nodiscard]] inline bool fitsDecimalPlaces(decimal_t val, uint32_t decimalPlaces)
{
    using namespace BloombergLP::bdldfp;
    const decimal_t scaled =
        DecimalUtil::multiplyByPowerOf10(val, static_cast<int>(decimalPlaces));
    return DecimalUtil::trunc(scaled) == scaled;
}

}  // namespace divix::util

//-------------------------------------------------------------------------

namespace divix::literals
{

[[nodiscard]] constexpr decimal_t operator"" _dec(unsigned long long int val)
{
    return decimal_t{val};
}

}  // namespace divix::literals

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<divix::decimal_t>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(divix::decimal_t val, FormatContext& ctx) const
    {
        using namespace divix::literals;
        char buf[32]{};
        std::ospanstream oss{buf};
        if (val == 0_dec) [[unlikely]] {
            oss << "0.0";
        } else {
            oss << val;
        }
        return fmt::format_to(ctx.out(), "{}", buf);
    }
};

//-------------------------------------------------------------------------
