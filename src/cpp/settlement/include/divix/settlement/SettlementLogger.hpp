/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "divix/settlement/SettlementSignals.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace divix::settlement
{

//-------------------------------------------------------------------------

class SettlementLogger
{
public:
    SettlementLogger(const fs::path& filepath, decltype(SettlementSignals::settled)& signal);

    [[nodiscard]] const fs::path& filepath() const noexcept { return m_filepath; }

    void log(std::span<const ledger::Settlement> settlements) const;

private:
    std::unique_ptr<spdlog::logger> m_logger;
    fs::path m_filepath;
    bs2::scoped_connection m_feed;
};

//-------------------------------------------------------------------------

}  // namespace divix::settlement

//-------------------------------------------------------------------------
