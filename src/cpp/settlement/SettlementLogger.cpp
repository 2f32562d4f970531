/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "divix/settlement/SettlementLogger.hpp"

#include <spdlog/sinks/basic_file_sink.h>

//-------------------------------------------------------------------------

namespace divix::settlement
{

//-------------------------------------------------------------------------

SettlementLogger::SettlementLogger(
    const fs::path& filepath, decltype(SettlementSignals::settled)& signal)
    : m_filepath{filepath}
{
    m_logger = std::make_unique<spdlog::logger>(
        "SettlementLogger",
        std::make_shared<spdlog::sinks::basic_file_sink_st>(m_filepath.string(), true));
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");

    m_feed = signal.connect(
        [this](std::span<const ledger::Settlement> settlements) { log(settlements); });

    m_logger->trace("currency,from,to,amount");
    m_logger->flush();
}

//-------------------------------------------------------------------------

void SettlementLogger::log(std::span<const ledger::Settlement> settlements) const
{
    for (const auto& settlement : settlements) {
        m_logger->trace(
            "{},{},{},{}",
            settlement.currency,
            settlement.from,
            settlement.to,
            settlement.amount);
    }
    m_logger->flush();
}

//-------------------------------------------------------------------------

}  // namespace divix::settlement

//-------------------------------------------------------------------------
