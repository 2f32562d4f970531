/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "divix/ledger/ExposureCalculator.hpp"

//-------------------------------------------------------------------------

namespace divix::ledger
{

//-------------------------------------------------------------------------

ExposureCalculator::ExposureCalculator(const RoundParams& roundParams, InvalidDebtPolicy policy)
    : m_roundParams{validateRoundParams(roundParams)}, m_policy{policy}
{}

//-------------------------------------------------------------------------

Exposure ExposureCalculator::exposure(const UserId& userId, std::span<const Debt> debts) const
{
    std::map<CurrencyCode, units_t> owedTo, owedBy;

    for (const auto& debt : debts) {
        if (debt.to != userId && debt.from != userId) {
            continue;
        }
        if (!admitDebt(debt, m_policy, m_roundParams.ledgerDecimals)) {
            continue;
        }
        const units_t amount = m_roundParams.toLedgerUnits(debt.amount);
        // A self-referential debt counts once, on the owed-to side.
        auto& total = debt.to == userId ? owedTo[debt.currency] : owedBy[debt.currency];
        total = util::addUnits(total, amount);
    }

    auto toDecimals = [this](const std::map<CurrencyCode, units_t>& totals) {
        return totals
            | views::transform([this](const auto& entry) {
                return std::pair{entry.first, m_roundParams.fromLedgerUnits(entry.second)};
            })
            | ranges::to<std::map<CurrencyCode, decimal_t>>;
    };

    return {.owedToUser = toDecimals(owedTo), .owedByUser = toDecimals(owedBy)};
}

//-------------------------------------------------------------------------

}  // namespace divix::ledger

//-------------------------------------------------------------------------
