/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "divix/ledger/Debt.hpp"
#include "divix/ledger/RoundParams.hpp"

#include <variant>

//-------------------------------------------------------------------------

namespace divix::ledger
{

//-------------------------------------------------------------------------

struct EqualSplit {};

struct ExactSplit
{
    std::map<UserId, decimal_t> shares;
};

struct PercentageSplit
{
    std::map<UserId, decimal_t> percentages;
};

using SplitMethod = std::variant<EqualSplit, ExactSplit, PercentageSplit>;

//-------------------------------------------------------------------------

struct Expense
{
    UserId payer;
    decimal_t amount;
    CurrencyCode currency;
    std::vector<UserId> participants;
    SplitMethod split = EqualSplit{};
};

//-------------------------------------------------------------------------

// Per-participant shares in settlement units, in participant order.
[[nodiscard]] std::vector<units_t> computeShares(
    const Expense& expense, const RoundParams& roundParams);

/**
 * Turns an expense into the debts it creates: every participant other than the
 * payer owes the payer their share. Shares are computed in settlement units and
 * always add up to the expense amount; leftover units after an even or
 * percentage division go one each to the first participants.
 *
 * Throws InvalidSplit on a non-positive amount, an empty or duplicated
 * participant list, or split data that does not match the participants.
 */
[[nodiscard]] std::vector<Debt> splitExpense(
    const Expense& expense, const RoundParams& roundParams = {});

//-------------------------------------------------------------------------

}  // namespace divix::ledger

//-------------------------------------------------------------------------
