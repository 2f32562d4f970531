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

// Net position of a user within one currency, in ledger units. Positive means
// the user is owed money, negative that the user owes money.
struct UserBalance
{
    UserId userId;
    units_t balance{};
    CurrencyCode currency;

    bool operator==(const UserBalance&) const = default;
};

struct CurrencyBalances
{
    CurrencyCode currency;
    std::vector<UserBalance> balances;
};

//-------------------------------------------------------------------------

}  // namespace divix::ledger

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<divix::ledger::UserBalance>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const divix::ledger::UserBalance& bal, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}={}u {}", bal.userId, bal.balance, bal.currency);
    }
};

//-------------------------------------------------------------------------
