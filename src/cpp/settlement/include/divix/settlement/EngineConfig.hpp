/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "divix/ledger/Debt.hpp"
#include "divix/ledger/RoundParams.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace divix::settlement
{

//-------------------------------------------------------------------------

enum class MatcherType : uint32_t
{
    GREEDY,
    EXACT
};

enum class ValidationPolicy : uint32_t
{
    ADVISORY,
    FAIL_FAST
};

struct MatcherConfig
{
    MatcherType type = MatcherType::GREEDY;
    uint32_t maxParticipants = 16;

    [[nodiscard]] static MatcherConfig fromXML(pugi::xml_node node);
};

struct EngineConfig
{
    ledger::RoundParams roundParams;
    ledger::InvalidDebtPolicy invalidDebts = ledger::InvalidDebtPolicy::REJECT;
    ValidationPolicy validation = ValidationPolicy::ADVISORY;
    uint32_t threadCount = 1;
    MatcherConfig matcher;
    std::optional<fs::path> settlementLog;
};

/**
 * Reads a <Settlement> node:
 *
 *   <Settlement ledgerDecimals="4" settlementDecimals="2" rounding="HALF_EVEN"
 *               invalidDebts="REJECT" validation="ADVISORY" threadCount="4">
 *     <Matcher type="exact" maxParticipants="12"/>
 *     <Logging settlementLog="settlements.csv"/>
 *   </Settlement>
 *
 * Every attribute is optional.
 */
[[nodiscard]] EngineConfig makeEngineConfig(pugi::xml_node node);

[[nodiscard]] EngineConfig loadEngineConfig(const fs::path& path);

//-------------------------------------------------------------------------

}  // namespace divix::settlement

//-------------------------------------------------------------------------
