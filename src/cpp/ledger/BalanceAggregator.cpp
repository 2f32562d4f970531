/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "divix/ledger/BalanceAggregator.hpp"

#include <unordered_map>

//-------------------------------------------------------------------------

namespace divix::ledger
{

//-------------------------------------------------------------------------

namespace
{

class CurrencyReducer
{
public:
    explicit CurrencyReducer(CurrencyCode currency) noexcept
    {
        m_result.currency = std::move(currency);
    }

    void apply(const UserId& from, const UserId& to, units_t amount)
    {
        UserBalance& debtor = slot(from);
        debtor.balance = util::addUnits(debtor.balance, -amount);
        UserBalance& creditor = slot(to);
        creditor.balance = util::addUnits(creditor.balance, amount);
    }

    [[nodiscard]] CurrencyBalances release() noexcept { return std::move(m_result); }

private:
    UserBalance& slot(const UserId& userId)
    {
        auto [it, inserted] = m_index.try_emplace(userId, m_result.balances.size());
        if (inserted) {
            m_result.balances.push_back(
                {.userId = userId, .balance = 0, .currency = m_result.currency});
        }
        return m_result.balances[it->second];
    }

    CurrencyBalances m_result;
    std::unordered_map<UserId, size_t> m_index;
};

}  // namespace

//-------------------------------------------------------------------------

BalanceAggregator::BalanceAggregator(const RoundParams& roundParams, InvalidDebtPolicy policy)
    : m_roundParams{validateRoundParams(roundParams)}, m_policy{policy}
{}

//-------------------------------------------------------------------------

std::vector<CurrencyBalances> BalanceAggregator::aggregate(std::span<const Debt> debts) const
{
    std::vector<CurrencyReducer> reducers;
    std::unordered_map<CurrencyCode, size_t> currencyIndex;

    for (const auto& debt : debts) {
        if (!admitDebt(debt, m_policy, m_roundParams.ledgerDecimals)) {
            continue;
        }
        const units_t amount = m_roundParams.toLedgerUnits(debt.amount);
        auto [it, inserted] = currencyIndex.try_emplace(debt.currency, reducers.size());
        if (inserted) {
            reducers.emplace_back(debt.currency);
        }
        reducers[it->second].apply(debt.from, debt.to, amount);
    }

    std::vector<CurrencyBalances> res;
    res.reserve(reducers.size());
    for (auto& reducer : reducers) {
        res.push_back(reducer.release());
    }
    return res;
}

//-------------------------------------------------------------------------

}  // namespace divix::ledger

//-------------------------------------------------------------------------
