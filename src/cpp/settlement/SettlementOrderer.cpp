/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "divix/settlement/SettlementOrderer.hpp"

//-------------------------------------------------------------------------

namespace divix::settlement
{

//-------------------------------------------------------------------------

std::vector<ledger::Settlement> SettlementOrderer::order(
    std::span<const ledger::Settlement> settlements) const
{
    std::vector<ledger::Settlement> res{settlements.begin(), settlements.end()};
    ranges::stable_sort(res, &SettlementOrderer::precedes);
    return res;
}

//-------------------------------------------------------------------------

bool SettlementOrderer::precedes(
    const ledger::Settlement& lhs, const ledger::Settlement& rhs) noexcept
{
    if (lhs.currency != rhs.currency) {
        return lhs.currency < rhs.currency;
    }
    return lhs.amount > rhs.amount;
}

//-------------------------------------------------------------------------

}  // namespace divix::settlement

//-------------------------------------------------------------------------
