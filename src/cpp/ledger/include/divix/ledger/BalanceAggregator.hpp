/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "divix/ledger/Debt.hpp"
#include "divix/ledger/RoundParams.hpp"
#include "divix/ledger/UserBalance.hpp"

//-------------------------------------------------------------------------

namespace divix::ledger
{

//-------------------------------------------------------------------------

/**
 * Reduces directed debts to one net balance per user per currency.
 *
 * Currencies appear in the order they are first seen in the input, users within
 * a currency in the order they are first referenced (debtor before creditor of
 * the same debt). That order drives tie-breaking in the matchers. Every amount
 * moved off a debtor is added to a creditor, so each currency sums to exactly
 * zero.
 *
 * Amounts that are not positive or have more than ledgerDecimals decimals go
 * through the InvalidDebtPolicy. A balance that leaves the int64 ledger-unit
 * range throws std::overflow_error.
 */
class BalanceAggregator
{
public:
    explicit BalanceAggregator(
        const RoundParams& roundParams = {},
        InvalidDebtPolicy policy = InvalidDebtPolicy::REJECT);

    [[nodiscard]] std::vector<CurrencyBalances> aggregate(std::span<const Debt> debts) const;

    [[nodiscard]] const RoundParams& roundParams() const noexcept { return m_roundParams; }
    [[nodiscard]] InvalidDebtPolicy policy() const noexcept { return m_policy; }

private:
    RoundParams m_roundParams;
    InvalidDebtPolicy m_policy;
};

//-------------------------------------------------------------------------

}  // namespace divix::ledger

//-------------------------------------------------------------------------
