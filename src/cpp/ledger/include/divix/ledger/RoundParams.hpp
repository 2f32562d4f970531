/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "divix/common.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace divix::ledger
{

//-------------------------------------------------------------------------

/**
 * Precision rules shared by every component of the engine.
 *
 * Balances accumulate in ledger units (10^-ledgerDecimals). Settlements are
 * emitted in settlement units (10^-settlementDecimals); one settlement unit is
 * the epsilon below which a balance or a transfer counts as zero.
 */
struct RoundParams
{
    uint32_t ledgerDecimals = 4;
    uint32_t settlementDecimals = 2;
    RoundingMode rounding = RoundingMode::HALF_AWAY_FROM_ZERO;

    [[nodiscard]] units_t epsilon() const;
    [[nodiscard]] units_t toLedgerUnits(decimal_t amount) const;
    [[nodiscard]] decimal_t fromLedgerUnits(units_t units) const;
    [[nodiscard]] units_t toSettlementUnits(units_t ledgerUnits) const;
    [[nodiscard]] decimal_t fromSettlementUnits(units_t units) const;

    [[nodiscard]] static RoundParams fromXML(pugi::xml_node node);
};

// Throws std::invalid_argument when the decimals are inconsistent.
const RoundParams& validateRoundParams(
    const RoundParams& params, std::source_location sl = std::source_location::current());

//-------------------------------------------------------------------------

}  // namespace divix::ledger

//-------------------------------------------------------------------------
