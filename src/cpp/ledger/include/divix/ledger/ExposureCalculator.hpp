/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "divix/ledger/Debt.hpp"
#include "divix/ledger/RoundParams.hpp"

//-------------------------------------------------------------------------

namespace divix::ledger
{

//-------------------------------------------------------------------------

// Raw, un-netted obligations of a single user, per currency.
struct Exposure
{
    std::map<CurrencyCode, decimal_t> owedToUser;
    std::map<CurrencyCode, decimal_t> owedByUser;
};

//-------------------------------------------------------------------------

// Invalid amounts follow the InvalidDebtPolicy; a total past the int64
// ledger-unit range throws std::overflow_error.
class ExposureCalculator
{
public:
    explicit ExposureCalculator(
        const RoundParams& roundParams = {},
        InvalidDebtPolicy policy = InvalidDebtPolicy::REJECT);

    [[nodiscard]] Exposure exposure(const UserId& userId, std::span<const Debt> debts) const;

private:
    RoundParams m_roundParams;
    InvalidDebtPolicy m_policy;
};

//-------------------------------------------------------------------------

}  // namespace divix::ledger

//-------------------------------------------------------------------------
