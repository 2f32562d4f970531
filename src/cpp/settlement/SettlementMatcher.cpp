/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "divix/settlement/SettlementMatcher.hpp"
#include "divix/ledger/balance_utils.hpp"

#include <algorithm>
#include <cstdlib>

//-------------------------------------------------------------------------

namespace divix::settlement
{

//-------------------------------------------------------------------------

namespace
{

struct Position
{
    const UserId* userId;
    units_t balance;
};

}  // namespace

//-------------------------------------------------------------------------

SettlementMatcher::SettlementMatcher(const ledger::RoundParams& roundParams)
    : m_roundParams{ledger::validateRoundParams(roundParams)},
      m_epsilon{m_roundParams.epsilon()}
{}

//-------------------------------------------------------------------------

void SettlementMatcher::matchGreedy(
    std::span<const ledger::UserBalance> balances,
    std::vector<ledger::Settlement>& out) const
{
    matchSettleable(settleableBalances(balances), out);
}

//-------------------------------------------------------------------------

void SettlementMatcher::matchSettleable(
    std::span<const ledger::UserBalance> settleable,
    std::vector<ledger::Settlement>& out) const
{
    if (settleable.empty()) {
        return;
    }

    std::vector<Position> creditors, debtors;
    for (const auto& bal : settleable) {
        const units_t units = bal.balance / m_epsilon;
        if (units > 0) {
            creditors.push_back({.userId = &bal.userId, .balance = units});
        } else {
            debtors.push_back({.userId = &bal.userId, .balance = units});
        }
    }

    const CurrencyCode& currency = settleable.front().currency;

    size_t i = 0, j = 0;
    while (i < creditors.size() && j < debtors.size()) {
        auto& creditor = creditors[i];
        auto& debtor = debtors[j];

        const units_t transfer = std::min(creditor.balance, -debtor.balance);
        out.push_back({
            .from = *debtor.userId,
            .to = *creditor.userId,
            .amount = m_roundParams.fromSettlementUnits(transfer),
            .currency = currency
        });

        creditor.balance -= transfer;
        debtor.balance += transfer;

        if (creditor.balance == 0) {
            ++i;
        }
        if (debtor.balance == 0) {
            ++j;
        }
    }
}

//-------------------------------------------------------------------------

std::vector<ledger::UserBalance> SettlementMatcher::settleableBalances(
    std::span<const ledger::UserBalance> balances) const
{
    const auto units = ledger::apportionSettlementUnits(balances, m_roundParams);

    std::vector<ledger::UserBalance> res;
    for (const auto& [bal, amount] : views::zip(balances, units)) {
        if (amount != 0) {
            res.push_back({
                .userId = bal.userId,
                .balance = amount * m_epsilon,
                .currency = bal.currency
            });
        }
    }
    return res;
}

//-------------------------------------------------------------------------

void SettlementMatcher::checkSingleCurrency(std::span<const ledger::UserBalance> balances) const
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (balances.empty()) {
        return;
    }
    const CurrencyCode& currency = balances.front().currency;
    if (auto it = ranges::find_if(
            balances, [&](const auto& bal) { return bal.currency != currency; });
        it != balances.end()) {
        throw std::invalid_argument{fmt::format(
            "{}: balances mix currencies {} and {}", ctx, currency, it->currency)};
    }
}

//-------------------------------------------------------------------------

bool SettlementMatcher::isSettled(units_t balance) const noexcept
{
    return std::abs(balance) < m_epsilon;
}

//-------------------------------------------------------------------------

}  // namespace divix::settlement

//-------------------------------------------------------------------------
