/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "divix/ledger/LedgerException.hpp"
#include "divix/settlement/SettlementEngine.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <fstream>
#include <thread>

//-------------------------------------------------------------------------

using namespace divix;
using namespace divix::ledger;
using namespace divix::settlement;
using namespace testing;

//-------------------------------------------------------------------------

namespace
{

const std::vector<Debt> kThreeCycle{
    {"A", "B", 10_dec, "USD"},
    {"B", "C", 15_dec, "USD"},
    {"C", "A", 5_dec, "USD"}};

std::vector<Debt> makeMultiCurrencyDebts()
{
    static constexpr std::array kCurrencies{"USD", "EUR", "JPY", "GBP", "CHF", "SEK"};
    std::vector<Debt> debts;
    for (const auto [i, currency] : views::enumerate(kCurrencies)) {
        for (int k = 0; k < 12; ++k) {
            debts.push_back({
                .from = fmt::format("user{}", (k * 7 + static_cast<int>(i)) % 10),
                .to = fmt::format("user{}", (k * 3 + 1) % 10),
                .amount = decimal_t{k + 1 + static_cast<int>(i)},
                .currency = currency
            });
        }
    }
    return debts;
}

}  // namespace

//-------------------------------------------------------------------------

TEST(SettlementEngineTest, SimplifiesThreeCycle)
{
    SettlementEngine engine;

    const auto res = engine.simplify(kThreeCycle);

    ASSERT_TRUE(res.has_value());
    EXPECT_THAT(
        *res,
        ElementsAre(
            Settlement{"A", "C", 5_dec, "USD"},
            Settlement{"B", "C", 5_dec, "USD"}));
    EXPECT_EQ(engine.matcher().name(), "greedy");
}

TEST(SettlementEngineTest, EmptyInputYieldsNothing)
{
    SettlementEngine engine;

    const auto res = engine.simplify({});

    ASSERT_TRUE(res.has_value());
    EXPECT_THAT(*res, IsEmpty());
}

TEST(SettlementEngineTest, OrdersAcrossCurrencies)
{
    const std::vector<Debt> debts{
        {"X", "Y", 20_dec, "USD"},
        {"X", "Y", 5_dec, "EUR"},
        {"A", "B", 20_dec, "EUR"}};
    SettlementEngine engine;

    const auto res = engine.simplify(debts);

    ASSERT_TRUE(res.has_value());
    EXPECT_THAT(
        *res,
        ElementsAre(
            Settlement{"A", "B", 20_dec, "EUR"},
            Settlement{"X", "Y", 5_dec, "EUR"},
            Settlement{"X", "Y", 20_dec, "USD"}));
}

TEST(SettlementEngineTest, ThreadCountDoesNotChangeResult)
{
    const auto debts = makeMultiCurrencyDebts();
    SettlementEngine sequential;
    SettlementEngine parallel{{.threadCount = 4}};

    const auto expected = sequential.simplify(debts);
    ASSERT_TRUE(expected.has_value());
    EXPECT_THAT(*expected, Not(IsEmpty()));

    for (int run = 0; run < 5; ++run) {
        EXPECT_EQ(parallel.simplify(debts), expected);
    }
}

TEST(SettlementEngineTest, StopRequestYieldsNoResult)
{
    const auto debts = makeMultiCurrencyDebts();
    std::stop_source stopSource;
    stopSource.request_stop();

    for (uint32_t threadCount : {1u, 3u}) {
        SettlementEngine engine{{.threadCount = threadCount}};
        int emitted = 0;
        bs2::scoped_connection conn = engine.signals().settled.connect(
            [&](std::span<const Settlement>) { ++emitted; });

        EXPECT_FALSE(engine.simplify(debts, stopSource.get_token()).has_value());
        EXPECT_EQ(emitted, 0);
    }
}

TEST(SettlementEngineTest, InvalidDebtsFollowPolicy)
{
    const std::vector<Debt> debts{
        {"A", "B", 10_dec, "USD"},
        {"B", "A", -2_dec, "USD"}};

    SettlementEngine strict;
    EXPECT_THROW([[maybe_unused]] auto res = strict.simplify(debts), InvalidDebtAmount);

    SettlementEngine lenient{{.invalidDebts = InvalidDebtPolicy::SKIP}};
    const auto res = lenient.simplify(debts);
    ASSERT_TRUE(res.has_value());
    EXPECT_THAT(*res, ElementsAre(Settlement{"A", "B", 10_dec, "USD"}));
}

TEST(SettlementEngineTest, FailFastValidationThrows)
{
    const std::vector<Debt> debts{
        {"A", "B", 10_dec, "USD"},
        {"C", "C", 3_dec, "USD"}};

    SettlementEngine advisory;
    EXPECT_TRUE(advisory.simplify(debts).has_value());
    EXPECT_FALSE(advisory.validate(debts).isValid);

    SettlementEngine failFast{{.validation = ValidationPolicy::FAIL_FAST}};
    try {
        [[maybe_unused]] auto res = failFast.simplify(debts);
        FAIL() << "Expected LedgerValidationError";
    }
    catch (const LedgerValidationError& exc) {
        ASSERT_EQ(exc.report().issues.size(), 1);
        EXPECT_EQ(exc.report().issues[0].kind, IssueKind::SELF_DEBT);
    }
}

TEST(SettlementEngineTest, ExactMatcherIsOptIn)
{
    const std::vector<Debt> debts{
        {"C", "A", 2_dec, "USD"},
        {"B", "A", 3_dec, "USD"},
        {"D", "C", 2_dec, "USD"}};
    SettlementEngine engine{{.matcher = {.type = MatcherType::EXACT}}};

    const auto res = engine.simplify(debts);

    EXPECT_EQ(engine.matcher().name(), "exact");
    ASSERT_TRUE(res.has_value());
    EXPECT_THAT(
        *res,
        ElementsAre(
            Settlement{"B", "A", 3_dec, "USD"},
            Settlement{"D", "A", 2_dec, "USD"}));
}

TEST(SettlementEngineTest, DelegatesAuxiliaryQueries)
{
    SettlementEngine engine;

    const auto balances = engine.balances(kThreeCycle);
    ASSERT_EQ(balances.size(), 1);
    EXPECT_THAT(
        balances[0].balances,
        ElementsAre(
            UserBalance{"A", -50'000, "USD"},
            UserBalance{"B", -50'000, "USD"},
            UserBalance{"C", 100'000, "USD"}));

    const auto exposure = engine.exposure("B", kThreeCycle);
    EXPECT_THAT(exposure.owedToUser, UnorderedElementsAre(Pair("USD", 10_dec)));
    EXPECT_THAT(exposure.owedByUser, UnorderedElementsAre(Pair("USD", 15_dec)));

    EXPECT_TRUE(engine.validate(kThreeCycle).isValid);
}

TEST(SettlementEngineTest, SettledSignalCarriesResult)
{
    SettlementEngine engine;
    std::vector<Settlement> received;
    bs2::scoped_connection conn = engine.signals().settled.connect(
        [&](std::span<const Settlement> settlements) {
            received.assign(settlements.begin(), settlements.end());
        });

    const auto res = engine.simplify(kThreeCycle);

    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(received, *res);
}

TEST(SettlementEngineTest, SettledSignalFiresOnCallingThread)
{
    SettlementEngine engine{{.threadCount = 4}};
    std::vector<std::thread::id> slotThreads;
    bs2::scoped_connection conn = engine.signals().settled.connect(
        [&](std::span<const Settlement>) { slotThreads.push_back(std::this_thread::get_id()); });

    ASSERT_TRUE(engine.simplify(makeMultiCurrencyDebts()).has_value());

    EXPECT_THAT(slotThreads, ElementsAre(std::this_thread::get_id()));
}

TEST(SettlementEngineTest, EnginePerThreadRunsConcurrently)
{
    const auto debts = makeMultiCurrencyDebts();
    const auto expected = SettlementEngine{}.simplify(debts);
    ASSERT_TRUE(expected.has_value());

    static constexpr size_t kThreads = 4;
    std::array<std::optional<std::vector<Settlement>>, kThreads> results;
    std::array<int, kThreads> emitted{};
    {
        std::vector<std::jthread> threads;
        for (size_t t = 0; t < kThreads; ++t) {
            threads.emplace_back([&, t] {
                SettlementEngine engine{{.threadCount = 2}};
                bs2::scoped_connection conn = engine.signals().settled.connect(
                    [&](std::span<const Settlement>) { ++emitted[t]; });
                results[t] = engine.simplify(debts);
            });
        }
    }

    for (size_t t = 0; t < kThreads; ++t) {
        EXPECT_EQ(results[t], expected);
        EXPECT_EQ(emitted[t], 1);
    }
}

//-------------------------------------------------------------------------

struct SettlementLoggerTest : Test
{
    virtual void SetUp() override
    {
        path = fs::temp_directory_path() / fmt::format(
            "divix-{}.csv", UnitTest::GetInstance()->current_test_info()->name());
    }

    virtual void TearDown() override
    {
        std::error_code ec;
        fs::remove(path, ec);
    }

    std::vector<std::string> readLines() const
    {
        std::ifstream ifs{path};
        std::vector<std::string> lines;
        for (std::string line; std::getline(ifs, line);) {
            lines.push_back(line);
        }
        return lines;
    }

    fs::path path;
};

TEST_F(SettlementLoggerTest, WritesHeaderAndOneLinePerSettlement)
{
    SettlementEngine engine{{.settlementLog = path}};
    ASSERT_NE(engine.settlementLogger(), nullptr);
    EXPECT_EQ(engine.settlementLogger()->filepath(), path);

    ASSERT_TRUE(engine.simplify(kThreeCycle).has_value());
    ASSERT_TRUE(engine.simplify(std::vector<Debt>{{"X", "Y", 1_dec, "EUR"}}).has_value());

    const auto lines = readLines();
    ASSERT_EQ(lines.size(), 4);
    EXPECT_EQ(lines[0], "currency,from,to,amount");
    EXPECT_THAT(lines[1], StartsWith("USD,A,C,"));
    EXPECT_THAT(lines[2], StartsWith("USD,B,C,"));
    EXPECT_THAT(lines[3], StartsWith("EUR,X,Y,"));
}

TEST_F(SettlementLoggerTest, NoLogUnlessConfigured)
{
    SettlementEngine engine;

    EXPECT_EQ(engine.settlementLogger(), nullptr);
}

//-------------------------------------------------------------------------
