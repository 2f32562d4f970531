/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "divix/ledger/Ledger.hpp"

//-------------------------------------------------------------------------

namespace divix::ledger
{

//-------------------------------------------------------------------------

Ledger::Ledger(const RoundParams& roundParams, InvalidDebtPolicy policy)
    : m_roundParams{validateRoundParams(roundParams)}, m_policy{policy}
{}

//-------------------------------------------------------------------------

void Ledger::addExpense(const Expense& expense)
{
    ranges::push_back(m_debts, splitExpense(expense, m_roundParams));
}

//-------------------------------------------------------------------------

void Ledger::addPayment(const Payment& payment)
{
    addDebt(payment.asDebt());
}

//-------------------------------------------------------------------------

void Ledger::addDebt(const Debt& debt)
{
    if (admitDebt(debt, m_policy, m_roundParams.ledgerDecimals)) {
        m_debts.push_back(debt);
    }
}

//-------------------------------------------------------------------------

}  // namespace divix::ledger

//-------------------------------------------------------------------------
