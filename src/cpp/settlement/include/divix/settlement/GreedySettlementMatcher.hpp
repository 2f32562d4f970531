/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "divix/settlement/SettlementMatcher.hpp"

//-------------------------------------------------------------------------

namespace divix::settlement
{

//-------------------------------------------------------------------------

// Default matcher: linear-time greedy heuristic, see SettlementMatcher::matchGreedy.
class GreedySettlementMatcher : public SettlementMatcher
{
public:
    using SettlementMatcher::SettlementMatcher;

    [[nodiscard]] virtual std::vector<ledger::Settlement> match(
        std::span<const ledger::UserBalance> balances) const override;

    [[nodiscard]] virtual std::string_view name() const noexcept override { return "greedy"; }
};

//-------------------------------------------------------------------------

}  // namespace divix::settlement

//-------------------------------------------------------------------------
