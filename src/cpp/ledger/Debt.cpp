/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "divix/ledger/Debt.hpp"
#include "divix/ledger/LedgerException.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace divix::ledger
{

//-------------------------------------------------------------------------

bool admitDebt(
    const Debt& debt, InvalidDebtPolicy policy, uint32_t decimalPlaces, std::source_location sl)
{
    const bool positive = debt.amount > 0_dec;
    if (positive && util::fitsDecimalPlaces(debt.amount, decimalPlaces)) [[likely]] {
        return true;
    }
    if (policy == InvalidDebtPolicy::REJECT) {
        throw InvalidDebtAmount{debt, sl};
    }
    spdlog::warn(
        "{}: skipping debt with {} ({})",
        sl.function_name(),
        positive ? fmt::format("more than {} decimal places", decimalPlaces)
                 : std::string{"non-positive amount"},
        debt);
    return false;
}

//-------------------------------------------------------------------------

InvalidDebtAmount::InvalidDebtAmount(const Debt& debt, std::source_location sl)
    : std::invalid_argument{fmt::format(
        "{}: Invalid debt amount: {} between {} and {} ({})",
        sl.function_name(), debt.amount, debt.from, debt.to, debt.currency)},
      m_debt{debt}
{}

//-------------------------------------------------------------------------

}  // namespace divix::ledger

//-------------------------------------------------------------------------
