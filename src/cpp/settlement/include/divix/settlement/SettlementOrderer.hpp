/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "divix/ledger/Settlement.hpp"

//-------------------------------------------------------------------------

namespace divix::settlement
{

//-------------------------------------------------------------------------

// Currency code ascending, then amount descending; ties keep their input order.
class SettlementOrderer
{
public:
    [[nodiscard]] std::vector<ledger::Settlement> order(
        std::span<const ledger::Settlement> settlements) const;

    [[nodiscard]] static bool precedes(
        const ledger::Settlement& lhs, const ledger::Settlement& rhs) noexcept;
};

//-------------------------------------------------------------------------

}  // namespace divix::settlement

//-------------------------------------------------------------------------
