/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "divix/ledger/BalanceAggregator.hpp"
#include "divix/ledger/balance_utils.hpp"
#include "divix/settlement/ExactSettlementMatcher.hpp"
#include "divix/settlement/GreedySettlementMatcher.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdlib>

//-------------------------------------------------------------------------

using namespace divix;
using namespace divix::ledger;
using namespace divix::settlement;
using namespace testing;

//-------------------------------------------------------------------------

struct ExactSettlementMatcherTest : Test
{
    const std::vector<UserBalance> pairedBalances{
        {"A", 50'000, "USD"},
        {"C", 30'000, "USD"},
        {"D", -30'000, "USD"},
        {"B", -50'000, "USD"}};
    ExactSettlementMatcher exact{RoundParams{}};
    GreedySettlementMatcher greedy{RoundParams{}};
};

TEST_F(ExactSettlementMatcherTest, FindsZeroSumGroups)
{
    EXPECT_THAT(
        exact.zeroSumGroups(pairedBalances),
        ElementsAre(ElementsAre(0, 3), ElementsAre(1, 2)));
}

TEST_F(ExactSettlementMatcherTest, BeatsGreedyWhenGroupsExist)
{
    EXPECT_EQ(greedy.match(pairedBalances).size(), 3);
    EXPECT_THAT(
        exact.match(pairedBalances),
        ElementsAre(
            Settlement{"B", "A", 5_dec, "USD"},
            Settlement{"D", "C", 3_dec, "USD"}));
}

TEST_F(ExactSettlementMatcherTest, ThreeCycleStillNeedsTwoSettlements)
{
    const std::vector<UserBalance> balances{
        {"A", -50'000, "USD"},
        {"B", -50'000, "USD"},
        {"C", 100'000, "USD"}};

    EXPECT_EQ(exact.match(balances), greedy.match(balances));
}

TEST_F(ExactSettlementMatcherTest, IgnoresSettledParticipants)
{
    const std::vector<UserBalance> balances{
        {"A", 50'000, "USD"},
        {"idle", 0, "USD"},
        {"dust", 50, "USD"},
        {"B", -50'000, "USD"},
        {"crumb", -50, "USD"}};

    EXPECT_THAT(exact.match(balances), ElementsAre(Settlement{"B", "A", 5_dec, "USD"}));
}

TEST_F(ExactSettlementMatcherTest, SubCentGroupsAreSettledInWholeUnits)
{
    const std::vector<UserBalance> balances{
        {"A", 150, "USD"},
        {"B", -150, "USD"},
        {"C", 30'050, "USD"},
        {"D", -30'050, "USD"}};

    const auto res = exact.match(balances);

    EXPECT_THAT(
        res,
        ElementsAre(
            Settlement{"B", "A", DEC(0.02), "USD"},
            Settlement{"D", "C", DEC(3.01), "USD"}));
    for (const auto& bal : applySettlements(balances, res, exact.roundParams())) {
        EXPECT_LT(std::abs(bal.balance), exact.roundParams().epsilon()) << fmt::format("{}", bal);
    }
}

TEST_F(ExactSettlementMatcherTest, EmptyInputYieldsNothing)
{
    EXPECT_THAT(exact.match({}), IsEmpty());
    EXPECT_THAT(exact.zeroSumGroups({}), IsEmpty());
}

TEST_F(ExactSettlementMatcherTest, FallsBackToGreedyAboveParticipantLimit)
{
    const ExactSettlementMatcher limited{RoundParams{}, 2};

    EXPECT_EQ(limited.match(pairedBalances), greedy.match(pairedBalances));
}

TEST_F(ExactSettlementMatcherTest, FallsBackToGreedyOnUnbalancedInput)
{
    const std::vector<UserBalance> balances{
        {"A", 50'000, "USD"},
        {"B", -20'000, "USD"},
        {"C", -10'000, "USD"}};

    EXPECT_EQ(exact.match(balances), greedy.match(balances));
}

TEST(ExactSettlementMatcherConfigTest, RejectsInvalidParticipantLimit)
{
    EXPECT_THROW((ExactSettlementMatcher{RoundParams{}, 0}), std::invalid_argument);
    EXPECT_THROW(
        (ExactSettlementMatcher{RoundParams{}, ExactSettlementMatcher::kParticipantLimit + 1}),
        std::invalid_argument);
    EXPECT_NO_THROW((ExactSettlementMatcher{RoundParams{}, ExactSettlementMatcher::kParticipantLimit}));
}

//-------------------------------------------------------------------------

struct ExactPropertiesTest : TestWithParam<std::vector<Debt>> {};

TEST_P(ExactPropertiesTest, NeverWorseThanGreedyAndDischargesAll)
{
    const auto aggregated = BalanceAggregator{}.aggregate(GetParam());
    ASSERT_EQ(aggregated.size(), 1);
    const auto& balances = aggregated[0].balances;
    const ExactSettlementMatcher exact{RoundParams{}};

    const auto res = exact.match(balances);

    EXPECT_LE(res.size(), GreedySettlementMatcher{RoundParams{}}.match(balances).size());
    for (const auto& settlement : res) {
        EXPECT_GT(settlement.amount, 0_dec);
    }
    for (const auto& bal : applySettlements(balances, res, exact.roundParams())) {
        EXPECT_LE(std::abs(bal.balance), exact.roundParams().epsilon());
    }
}

INSTANTIATE_TEST_SUITE_P(
    ExactSettlementMatcherTest,
    ExactPropertiesTest,
    Values(
        std::vector<Debt>{
            {"B", "A", 5_dec, "USD"},
            {"D", "C", 3_dec, "USD"},
            {"D", "A", 1_dec, "USD"},
            {"A", "D", 1_dec, "USD"}},
        std::vector<Debt>{
            {"a", "b", 4_dec, "USD"},
            {"c", "d", 6_dec, "USD"},
            {"e", "f", DEC(2.5), "USD"},
            {"g", "h", DEC(7.25), "USD"},
            {"b", "c", 1_dec, "USD"},
            {"f", "a", 3_dec, "USD"}},
        std::vector<Debt>{
            {"A", "B", 10_dec, "USD"},
            {"B", "C", 15_dec, "USD"},
            {"C", "A", 5_dec, "USD"}},
        std::vector<Debt>{
            {"D", "C1", DEC(0.015), "USD"},
            {"D", "C2", DEC(0.015), "USD"},
            {"D", "C3", DEC(0.015), "USD"},
            {"E", "F", DEC(0.0125), "USD"}}));

//-------------------------------------------------------------------------
