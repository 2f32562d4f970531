/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <benchmark/benchmark.h>
#include <fmt/format.h>

#include "divix/ledger/BalanceAggregator.hpp"
#include "divix/settlement/ExactSettlementMatcher.hpp"
#include "divix/settlement/GreedySettlementMatcher.hpp"
#include "divix/settlement/SettlementEngine.hpp"

#include <random>

//-------------------------------------------------------------------------

using namespace divix;
using namespace divix::ledger;
using namespace divix::settlement;

//-------------------------------------------------------------------------

static std::vector<Debt> makeDebts(int64_t userCount, int64_t debtCount, int64_t currencyCount)
{
    std::mt19937 rng{42};
    std::uniform_int_distribution<int64_t> user{0, userCount - 1};
    std::uniform_int_distribution<int64_t> currency{0, currencyCount - 1};
    std::uniform_int_distribution<int64_t> cents{1, 100'000};

    std::vector<Debt> debts;
    debts.reserve(debtCount);
    for (int64_t i = 0; i < debtCount; ++i) {
        const auto from = user(rng);
        const auto to = (from + 1 + user(rng) % (userCount - 1)) % userCount;
        debts.push_back({
            .from = fmt::format("user{}", from),
            .to = fmt::format("user{}", to),
            .amount = util::fromUnits(cents(rng), 2),
            .currency = fmt::format("C{:02}", currency(rng))
        });
    }
    return debts;
}

//-------------------------------------------------------------------------

struct MatchFixture : benchmark::Fixture
{
    void SetUp(benchmark::State& state) override
    {
        const auto aggregated =
            BalanceAggregator{}.aggregate(makeDebts(state.range(0), state.range(0) * 8, 1));
        balances = aggregated.front().balances;
    }

    std::vector<UserBalance> balances;
};

BENCHMARK_DEFINE_F(MatchFixture, Greedy)(benchmark::State& state)
{
    const GreedySettlementMatcher matcher{RoundParams{}};
    for (auto _ : state) {
        benchmark::DoNotOptimize(matcher.match(balances));
    }
}
BENCHMARK_REGISTER_F(MatchFixture, Greedy)->RangeMultiplier(4)->Range(4, 4096);

BENCHMARK_DEFINE_F(MatchFixture, Exact)(benchmark::State& state)
{
    const ExactSettlementMatcher matcher{RoundParams{}, ExactSettlementMatcher::kParticipantLimit};
    for (auto _ : state) {
        benchmark::DoNotOptimize(matcher.match(balances));
    }
}
BENCHMARK_REGISTER_F(MatchFixture, Exact)->DenseRange(4, 16, 4);

//-------------------------------------------------------------------------

static void BM_Simplify(benchmark::State& state)
{
    const auto debts = makeDebts(200, 20'000, state.range(0));
    SettlementEngine engine{{.threadCount = static_cast<uint32_t>(state.range(1))}};
    for (auto _ : state) {
        benchmark::DoNotOptimize(engine.simplify(debts));
    }
}
BENCHMARK(BM_Simplify)->ArgsProduct({{1, 8, 32}, {1, 4}});

//-------------------------------------------------------------------------

BENCHMARK_MAIN();
