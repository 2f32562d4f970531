/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "divix/ledger/Debt.hpp"
#include "divix/ledger/ExpenseSplitter.hpp"
#include "divix/ledger/RoundParams.hpp"

//-------------------------------------------------------------------------

namespace divix::ledger
{

//-------------------------------------------------------------------------

// Accumulates the debts implied by shared expenses and recorded payments.
class Ledger
{
public:
    explicit Ledger(
        const RoundParams& roundParams = {},
        InvalidDebtPolicy policy = InvalidDebtPolicy::REJECT);

    void addExpense(const Expense& expense);
    void addPayment(const Payment& payment);
    void addDebt(const Debt& debt);
    void clear() noexcept { m_debts.clear(); }

    [[nodiscard]] std::span<const Debt> debts() const noexcept { return m_debts; }
    [[nodiscard]] const RoundParams& roundParams() const noexcept { return m_roundParams; }

private:
    RoundParams m_roundParams;
    InvalidDebtPolicy m_policy;
    std::vector<Debt> m_debts;
};

//-------------------------------------------------------------------------

}  // namespace divix::ledger

//-------------------------------------------------------------------------
