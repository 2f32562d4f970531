/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "divix/ledger/balance_utils.hpp"

#include <cstdlib>

//-------------------------------------------------------------------------

namespace divix::ledger
{

//-------------------------------------------------------------------------

std::vector<UserBalance> applySettlements(
    std::span<const UserBalance> balances,
    std::span<const Settlement> settlements,
    const RoundParams& roundParams)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    std::vector<UserBalance> res{balances.begin(), balances.end()};

    auto find = [&](const UserId& userId, const CurrencyCode& currency) -> UserBalance& {
        auto it = ranges::find_if(res, [&](const UserBalance& bal) {
            return bal.userId == userId && bal.currency == currency;
        });
        if (it == res.end()) {
            throw std::invalid_argument{fmt::format(
                "{}: no balance for user '{}' in {}", ctx, userId, currency)};
        }
        return *it;
    };

    for (const auto& settlement : settlements) {
        if (ranges::none_of(res, [&](const UserBalance& bal) {
            return bal.currency == settlement.currency;
        })) {
            continue;
        }
        const units_t amount = roundParams.toLedgerUnits(settlement.amount);
        find(settlement.from, settlement.currency).balance += amount;
        find(settlement.to, settlement.currency).balance -= amount;
    }

    return res;
}

//-------------------------------------------------------------------------

units_t netTotal(std::span<const UserBalance> balances) noexcept
{
    return ranges::accumulate(
        balances | views::transform(&UserBalance::balance), units_t{});
}

//-------------------------------------------------------------------------

std::vector<units_t> apportionSettlementUnits(
    std::span<const UserBalance> balances, const RoundParams& roundParams)
{
    const units_t epsilon = roundParams.epsilon();
    auto isActive = [&](size_t idx) { return std::abs(balances[idx].balance) > epsilon; };

    // errors[i]: start minus balance, in ledger units.
    std::vector<units_t> units, errors;
    units.reserve(balances.size());
    errors.reserve(balances.size());
    for (const auto [idx, bal] : views::enumerate(balances)) {
        const units_t start = isActive(idx) ? roundParams.toSettlementUnits(bal.balance) : 0;
        units.push_back(start);
        errors.push_back(start * epsilon - bal.balance);
    }

    units_t excess = ranges::accumulate(units, units_t{})
        - roundParams.toSettlementUnits(netTotal(balances));
    if (excess == 0) {
        return units;
    }

    const units_t step = excess > 0 ? 1 : -1;
    auto candidates = views::iota(size_t{}, units.size())
        | views::filter([&](size_t idx) { return errors[idx] * step > 0; })
        | ranges::to<std::vector>;
    ranges::stable_sort(candidates, [&](size_t lhs, size_t rhs) {
        return std::pair{isActive(lhs), errors[lhs] * step}
            > std::pair{isActive(rhs), errors[rhs] * step};
    });

    for (size_t n = 0; n < candidates.size() && excess != 0; ++n, excess -= step) {
        units[candidates[n]] -= step;
    }

    return units;
}

//-------------------------------------------------------------------------

}  // namespace divix::ledger

//-------------------------------------------------------------------------
