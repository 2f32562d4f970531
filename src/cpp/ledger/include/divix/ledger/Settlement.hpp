/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "divix/common.hpp"

//-------------------------------------------------------------------------

namespace divix::ledger
{

//-------------------------------------------------------------------------

// Recommended transfer of `amount` from the debtor `from` to the creditor `to`.
struct Settlement
{
    UserId from;
    UserId to;
    decimal_t amount;
    CurrencyCode currency;

    bool operator==(const Settlement&) const = default;
};

//-------------------------------------------------------------------------

}  // namespace divix::ledger

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<divix::ledger::Settlement>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const divix::ledger::Settlement& settlement, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "{} pays {} {} {}",
            settlement.from,
            settlement.to,
            settlement.amount,
            settlement.currency);
    }
};

//-------------------------------------------------------------------------
