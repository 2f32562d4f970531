/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "divix/settlement/EngineConfig.hpp"
#include "divix/settlement/SettlementMatcher.hpp"

//-------------------------------------------------------------------------

namespace divix::settlement
{

//-------------------------------------------------------------------------

class SettlementMatcherFactory
{
public:
    [[nodiscard]] static std::unique_ptr<SettlementMatcher> create(
        const MatcherConfig& config, const ledger::RoundParams& roundParams);

    [[nodiscard]] static std::unique_ptr<SettlementMatcher> createFromXML(
        pugi::xml_node node, const ledger::RoundParams& roundParams);

private:
    SettlementMatcherFactory() noexcept = default;
};

//-------------------------------------------------------------------------

}  // namespace divix::settlement

//-------------------------------------------------------------------------
