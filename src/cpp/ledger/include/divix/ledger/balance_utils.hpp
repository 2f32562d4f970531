/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "divix/ledger/RoundParams.hpp"
#include "divix/ledger/Settlement.hpp"
#include "divix/ledger/UserBalance.hpp"

//-------------------------------------------------------------------------

namespace divix::ledger
{

/**
 * Returns `balances` after executing `settlements`: the payer's balance rises
 * by the amount and the payee's falls by it. Settlements in another currency
 * than a balance's are ignored for it; an unknown user throws
 * std::invalid_argument.
 */
[[nodiscard]] std::vector<UserBalance> applySettlements(
    std::span<const UserBalance> balances,
    std::span<const Settlement> settlements,
    const RoundParams& roundParams);

// Sum of the balances, in ledger units.
[[nodiscard]] units_t netTotal(std::span<const UserBalance> balances) noexcept;

/**
 * Splits the balances into whole settlement units that add up to the rounded
 * net total.
 *
 * A balance beyond epsilon starts at its value rounded under
 * `roundParams.rounding`; one within epsilon starts at zero. Single units are
 * then moved onto or off the starts that lie furthest from their balance in
 * the direction of the shortfall, balances beyond epsilon first, ties in input
 * order. Every result is strictly within one settlement unit of its balance,
 * and a balance beyond epsilon keeps its sign.
 */
[[nodiscard]] std::vector<units_t> apportionSettlementUnits(
    std::span<const UserBalance> balances, const RoundParams& roundParams);

}  // namespace divix::ledger

//-------------------------------------------------------------------------
