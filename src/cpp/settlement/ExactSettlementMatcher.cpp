/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "divix/settlement/ExactSettlementMatcher.hpp"
#include "divix/ledger/balance_utils.hpp"

#include <spdlog/spdlog.h>

#include <bit>
#include <cstdlib>

//-------------------------------------------------------------------------

namespace divix::settlement
{

//-------------------------------------------------------------------------

ExactSettlementMatcher::ExactSettlementMatcher(
    const ledger::RoundParams& roundParams, uint32_t maxParticipants)
    : SettlementMatcher{roundParams}, m_maxParticipants{maxParticipants}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (m_maxParticipants == 0 || m_maxParticipants > kParticipantLimit) {
        throw std::invalid_argument{fmt::format(
            "{}: maxParticipants should be within [1, {}], was {}",
            ctx, kParticipantLimit, m_maxParticipants)};
    }
}

//-------------------------------------------------------------------------

std::vector<ledger::Settlement> ExactSettlementMatcher::match(
    std::span<const ledger::UserBalance> balances) const
{
    static constexpr auto ctx = std::source_location::current().function_name();

    checkSingleCurrency(balances);

    std::vector<ledger::Settlement> settlements;

    const auto active = settleableBalances(balances);

    if (active.size() > m_maxParticipants) {
        spdlog::warn(
            "{}: {} participants in {} exceed the limit of {}, using greedy matching",
            ctx, active.size(), balances.front().currency, m_maxParticipants);
        matchSettleable(active, settlements);
        return settlements;
    }
    if (const units_t total = ledger::netTotal(active); total != 0) {
        spdlog::warn(
            "{}: balances in {} sum to {} ledger units instead of zero, using greedy matching",
            ctx, balances.front().currency, total);
        matchSettleable(active, settlements);
        return settlements;
    }

    for (const auto& group : zeroSumGroups(active)) {
        const auto members = group
            | views::transform([&](size_t idx) { return active[idx]; })
            | ranges::to<std::vector>;
        matchSettleable(members, settlements);
    }
    return settlements;
}

//-------------------------------------------------------------------------

std::vector<std::vector<size_t>> ExactSettlementMatcher::zeroSumGroups(
    std::span<const ledger::UserBalance> balances) const
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const auto n = static_cast<uint32_t>(balances.size());
    if (n > kParticipantLimit) {
        throw std::invalid_argument{fmt::format(
            "{}: {} balances exceed the limit of {}", ctx, n, kParticipantLimit)};
    }
    if (n == 0) {
        return {};
    }

    const uint32_t full = (1u << n) - 1;

    // sums[mask]: net of the subset; groups[mask]: most zero-sum groups it splits into.
    std::vector<units_t> sums(full + 1, 0);
    std::vector<uint8_t> groups(full + 1, 0);
    for (uint32_t mask = 1; mask <= full; ++mask) {
        const uint32_t low = mask & (~mask + 1);
        sums[mask] = sums[mask ^ low] + balances[std::countr_zero(low)].balance;
        uint8_t best = 0;
        for (uint32_t rest = mask; rest != 0; rest &= rest - 1) {
            best = std::max(best, groups[mask ^ (rest & (~rest + 1))]);
        }
        groups[mask] = best + (isSettled(sums[mask]) ? 1 : 0);
    }

    // Peel members off the full set along an optimal path; reversed, every
    // prefix that sums to zero closes a group.
    std::vector<size_t> order;
    order.reserve(n);
    for (uint32_t mask = full; mask != 0;) {
        const uint8_t closing = isSettled(sums[mask]) ? 1 : 0;
        for (uint32_t rest = mask; rest != 0; rest &= rest - 1) {
            const uint32_t bit = rest & (~rest + 1);
            if (groups[mask ^ bit] + closing == groups[mask]) {
                order.push_back(std::countr_zero(bit));
                mask ^= bit;
                break;
            }
        }
    }
    ranges::reverse(order);

    std::vector<std::vector<size_t>> res;
    std::vector<size_t> current;
    uint32_t prefix = 0;
    for (size_t idx : order) {
        prefix |= 1u << idx;
        current.push_back(idx);
        if (isSettled(sums[prefix])) {
            ranges::sort(current);
            res.push_back(std::exchange(current, {}));
        }
    }
    if (!current.empty()) {
        ranges::sort(current);
        res.push_back(std::move(current));
    }

    ranges::sort(res, {}, [](const auto& group) { return group.front(); });
    return res;
}

//-------------------------------------------------------------------------

}  // namespace divix::settlement

//-------------------------------------------------------------------------
