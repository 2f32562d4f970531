/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "divix/settlement/GreedySettlementMatcher.hpp"

//-------------------------------------------------------------------------

namespace divix::settlement
{

//-------------------------------------------------------------------------

std::vector<ledger::Settlement> GreedySettlementMatcher::match(
    std::span<const ledger::UserBalance> balances) const
{
    checkSingleCurrency(balances);
    std::vector<ledger::Settlement> settlements;
    matchGreedy(balances, settlements);
    return settlements;
}

//-------------------------------------------------------------------------

}  // namespace divix::settlement

//-------------------------------------------------------------------------
