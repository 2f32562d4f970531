/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "divix/ledger/RoundParams.hpp"
#include "divix/util/xml_util.hpp"

//-------------------------------------------------------------------------

namespace divix::ledger
{

//-------------------------------------------------------------------------

units_t RoundParams::epsilon() const
{
    return util::pow10(ledgerDecimals - settlementDecimals);
}

//-------------------------------------------------------------------------

units_t RoundParams::toLedgerUnits(decimal_t amount) const
{
    return util::toUnits(amount, ledgerDecimals, rounding);
}

//-------------------------------------------------------------------------

decimal_t RoundParams::fromLedgerUnits(units_t units) const
{
    return util::fromUnits(units, ledgerDecimals);
}

//-------------------------------------------------------------------------

units_t RoundParams::toSettlementUnits(units_t ledgerUnits) const
{
    return util::rescale(ledgerUnits, ledgerDecimals, settlementDecimals, rounding);
}

//-------------------------------------------------------------------------

decimal_t RoundParams::fromSettlementUnits(units_t units) const
{
    return util::fromUnits(units, settlementDecimals);
}

//-------------------------------------------------------------------------

RoundParams RoundParams::fromXML(pugi::xml_node node)
{
    const RoundParams params{
        .ledgerDecimals = node.attribute("ledgerDecimals").as_uint(4),
        .settlementDecimals = node.attribute("settlementDecimals").as_uint(2),
        .rounding = util::enumAttribute(node, "rounding", RoundingMode::HALF_AWAY_FROM_ZERO)
    };

    return validateRoundParams(params);
}

//-------------------------------------------------------------------------

const RoundParams& validateRoundParams(const RoundParams& params, std::source_location sl)
{
    if (!(params.settlementDecimals > 0)) {
        throw std::invalid_argument{fmt::format(
            "{}: settlementDecimals should be > 0, was {}",
            sl.function_name(), params.settlementDecimals)};
    }
    if (params.ledgerDecimals < params.settlementDecimals) {
        throw std::invalid_argument{fmt::format(
            "{}: ledgerDecimals ({}) cannot be less than settlementDecimals ({})",
            sl.function_name(), params.ledgerDecimals, params.settlementDecimals)};
    }
    if (params.ledgerDecimals > 9) {
        throw std::invalid_argument{fmt::format(
            "{}: ledgerDecimals should be <= 9, was {}",
            sl.function_name(), params.ledgerDecimals)};
    }
    return params;
}

//-------------------------------------------------------------------------

}  // namespace divix::ledger

//-------------------------------------------------------------------------
