/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "divix/settlement/SettlementMatcherFactory.hpp"

#include "divix/settlement/ExactSettlementMatcher.hpp"
#include "divix/settlement/GreedySettlementMatcher.hpp"

//-------------------------------------------------------------------------

namespace divix::settlement
{

//-------------------------------------------------------------------------

std::unique_ptr<SettlementMatcher> SettlementMatcherFactory::create(
    const MatcherConfig& config, const ledger::RoundParams& roundParams)
{
    switch (config.type) {
        case MatcherType::GREEDY:
            return std::make_unique<GreedySettlementMatcher>(roundParams);
        case MatcherType::EXACT:
            return std::make_unique<ExactSettlementMatcher>(roundParams, config.maxParticipants);
    }
    throw std::invalid_argument{fmt::format(
        "{}: unknown matcher type {}",
        std::source_location::current().function_name(),
        std::to_underlying(config.type))};
}

//-------------------------------------------------------------------------

std::unique_ptr<SettlementMatcher> SettlementMatcherFactory::createFromXML(
    pugi::xml_node node, const ledger::RoundParams& roundParams)
{
    return create(MatcherConfig::fromXML(node), roundParams);
}

//-------------------------------------------------------------------------

}  // namespace divix::settlement

//-------------------------------------------------------------------------
