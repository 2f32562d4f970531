/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "divix/ledger/Debt.hpp"

//-------------------------------------------------------------------------

namespace divix::ledger
{

//-------------------------------------------------------------------------

class InvalidDebtAmount : public std::invalid_argument
{
public:
    InvalidDebtAmount(
        const Debt& debt, std::source_location sl = std::source_location::current());

    [[nodiscard]] const UserId& from() const noexcept { return m_debt.from; }
    [[nodiscard]] const UserId& to() const noexcept { return m_debt.to; }
    [[nodiscard]] decimal_t amount() const noexcept { return m_debt.amount; }
    [[nodiscard]] const CurrencyCode& currency() const noexcept { return m_debt.currency; }

private:
    Debt m_debt;
};

//-------------------------------------------------------------------------

class InvalidSplit : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

//-------------------------------------------------------------------------

}  // namespace divix::ledger

//-------------------------------------------------------------------------
