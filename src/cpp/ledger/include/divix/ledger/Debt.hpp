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

// `from` owes `to` the given amount.
struct Debt
{
    UserId from;
    UserId to;
    decimal_t amount;
    CurrencyCode currency;

    bool operator==(const Debt&) const = default;
};

// Money already transferred from `from` to `to`; offsets their obligations.
struct Payment
{
    UserId from;
    UserId to;
    decimal_t amount;
    CurrencyCode currency;

    [[nodiscard]] Debt asDebt() const { return {to, from, amount, currency}; }
};

//-------------------------------------------------------------------------

enum class InvalidDebtPolicy : uint32_t
{
    REJECT,
    SKIP
};

/**
 * Applies `policy` to a debt whose amount is not positive or carries more than
 * `decimalPlaces` decimals. Such amounts are never rounded into the ledger.
 *
 * Returns true when the debt takes part in the computation. Under REJECT an
 * invalid debt throws InvalidDebtAmount; under SKIP it is logged and excluded.
 */
[[nodiscard]] bool admitDebt(
    const Debt& debt,
    InvalidDebtPolicy policy,
    uint32_t decimalPlaces,
    std::source_location sl = std::source_location::current());

//-------------------------------------------------------------------------

}  // namespace divix::ledger

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<divix::ledger::Debt>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const divix::ledger::Debt& debt, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(), "{} -> {}: {} {}", debt.from, debt.to, debt.amount, debt.currency);
    }
};

//-------------------------------------------------------------------------
