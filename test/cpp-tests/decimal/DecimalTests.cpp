/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "divix/decimal/decimal.hpp"
#include "test-common/formatting.hpp"

#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace divix;

using namespace testing;

//-------------------------------------------------------------------------

struct ToUnitsTestParams
{
    decimal_t value;
    uint32_t decimalPlaces;
    RoundingMode mode;
    units_t refUnits;
};

void PrintTo(const ToUnitsTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.value = {}, .decimalPlaces = {}, .mode = {}, .refUnits = {}}}",
        params.value,
        params.decimalPlaces,
        magic_enum::enum_name(params.mode),
        params.refUnits);
}

struct ToUnitsTest : TestWithParam<ToUnitsTestParams> {};

TEST_P(ToUnitsTest, WorksCorrectly)
{
    const auto [value, decimalPlaces, mode, refUnits] = GetParam();
    EXPECT_EQ(util::toUnits(value, decimalPlaces, mode), refUnits);
}

INSTANTIATE_TEST_SUITE_P(
    DecimalTests,
    ToUnitsTest,
    Values(
        ToUnitsTestParams{
            .value = DEC(12.34), .decimalPlaces = 2,
            .mode = RoundingMode::HALF_AWAY_FROM_ZERO, .refUnits = 1234
        },
        ToUnitsTestParams{
            .value = DEC(1.005), .decimalPlaces = 2,
            .mode = RoundingMode::HALF_AWAY_FROM_ZERO, .refUnits = 101
        },
        ToUnitsTestParams{
            .value = DEC(1.005), .decimalPlaces = 2,
            .mode = RoundingMode::HALF_EVEN, .refUnits = 100
        },
        ToUnitsTestParams{
            .value = DEC(1.015), .decimalPlaces = 2,
            .mode = RoundingMode::HALF_EVEN, .refUnits = 102
        },
        ToUnitsTestParams{
            .value = -DEC(2.5), .decimalPlaces = 0,
            .mode = RoundingMode::HALF_AWAY_FROM_ZERO, .refUnits = -3
        },
        ToUnitsTestParams{
            .value = -DEC(2.5), .decimalPlaces = 0,
            .mode = RoundingMode::HALF_EVEN, .refUnits = -2
        },
        ToUnitsTestParams{
            .value = DEC(0.0), .decimalPlaces = 9,
            .mode = RoundingMode::HALF_AWAY_FROM_ZERO, .refUnits = 0
        },
        ToUnitsTestParams{
            .value = DEC(0.00004), .decimalPlaces = 4,
            .mode = RoundingMode::HALF_AWAY_FROM_ZERO, .refUnits = 0
        },
        ToUnitsTestParams{
            .value = 1'000'000'000_dec, .decimalPlaces = 4,
            .mode = RoundingMode::HALF_EVEN, .refUnits = 10'000'000'000'000
        }
    ));

TEST(DecimalTests, ToUnitsThrowsBeyondExactRange)
{
    EXPECT_THROW(
        [[maybe_unused]] auto units = util::toUnits(DEC(1e20), 4), std::overflow_error);
}

//-------------------------------------------------------------------------

struct RescaleTestParams
{
    units_t units;
    uint32_t from;
    uint32_t to;
    RoundingMode mode;
    units_t refUnits;
};

void PrintTo(const RescaleTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.units = {}, .from = {}, .to = {}, .mode = {}, .refUnits = {}}}",
        params.units,
        params.from,
        params.to,
        magic_enum::enum_name(params.mode),
        params.refUnits);
}

struct RescaleTest : TestWithParam<RescaleTestParams> {};

TEST_P(RescaleTest, WorksCorrectly)
{
    const auto [units, from, to, mode, refUnits] = GetParam();
    EXPECT_EQ(util::rescale(units, from, to, mode), refUnits);
}

INSTANTIATE_TEST_SUITE_P(
    DecimalTests,
    RescaleTest,
    Values(
        RescaleTestParams{12345, 4, 2, RoundingMode::HALF_AWAY_FROM_ZERO, 123},
        RescaleTestParams{12350, 4, 2, RoundingMode::HALF_AWAY_FROM_ZERO, 124},
        RescaleTestParams{12350, 4, 2, RoundingMode::HALF_EVEN, 124},
        RescaleTestParams{12250, 4, 2, RoundingMode::HALF_EVEN, 122},
        RescaleTestParams{12251, 4, 2, RoundingMode::HALF_EVEN, 123},
        RescaleTestParams{-12350, 4, 2, RoundingMode::HALF_AWAY_FROM_ZERO, -124},
        RescaleTestParams{-12250, 4, 2, RoundingMode::HALF_EVEN, -122},
        RescaleTestParams{5, 2, 4, RoundingMode::HALF_AWAY_FROM_ZERO, 500},
        RescaleTestParams{777, 3, 3, RoundingMode::HALF_EVEN, 777}
    ));

TEST(DecimalTests, RescaleThrowsOnOverflow)
{
    EXPECT_THROW(
        [[maybe_unused]] auto units = util::rescale(
            std::numeric_limits<units_t>::max() / 10, 0, 2, RoundingMode::HALF_EVEN),
        std::overflow_error);
}

TEST(DecimalTests, AddUnits)
{
    static_assert(util::addUnits(2, -5) == -3);
    constexpr units_t max = std::numeric_limits<units_t>::max();
    constexpr units_t min = std::numeric_limits<units_t>::min();
    EXPECT_EQ(util::addUnits(max - 1, 1), max);
    EXPECT_EQ(util::addUnits(min + 1, -1), min);
    EXPECT_THROW([[maybe_unused]] auto units = util::addUnits(max, 1), std::overflow_error);
    EXPECT_THROW([[maybe_unused]] auto units = util::addUnits(min, -1), std::overflow_error);
}

//-------------------------------------------------------------------------

TEST(DecimalTests, Pow10)
{
    static_assert(util::pow10(0) == 1);
    static_assert(util::pow10(2) == 100);
    EXPECT_EQ(util::pow10(18), 1'000'000'000'000'000'000);
    EXPECT_THROW([[maybe_unused]] auto p = util::pow10(19), std::out_of_range);
}

TEST(DecimalTests, FromUnits)
{
    EXPECT_EQ(util::fromUnits(1234, 2), DEC(12.34));
    EXPECT_EQ(util::fromUnits(-5, 4), -DEC(0.0005));
    EXPECT_EQ(util::fromUnits(0, 2), 0_dec);
}

TEST(DecimalTests, TruncToUnits)
{
    EXPECT_EQ(util::truncToUnits(DEC(3.339), 2), 333);
    EXPECT_EQ(util::truncToUnits(-DEC(3.339), 2), -333);
    EXPECT_EQ(util::truncToUnits(DEC(3.33), 2), 333);
}

TEST(DecimalTests, FitsDecimalPlaces)
{
    EXPECT_TRUE(util::fitsDecimalPlaces(DEC(10.25), 2));
    EXPECT_TRUE(util::fitsDecimalPlaces(10_dec, 0));
    EXPECT_FALSE(util::fitsDecimalPlaces(DEC(10.255), 2));
    EXPECT_FALSE(util::fitsDecimalPlaces(DEC(0.00001), 4));
}

//-------------------------------------------------------------------------
