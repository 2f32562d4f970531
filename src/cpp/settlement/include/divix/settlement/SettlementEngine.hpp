/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "divix/ledger/BalanceAggregator.hpp"
#include "divix/ledger/ExposureCalculator.hpp"
#include "divix/ledger/LedgerValidator.hpp"
#include "divix/settlement/EngineConfig.hpp"
#include "divix/settlement/SettlementLogger.hpp"
#include "divix/settlement/SettlementMatcher.hpp"
#include "divix/settlement/SettlementOrderer.hpp"
#include "divix/settlement/SettlementSignals.hpp"

#include <boost/asio/thread_pool.hpp>

#include <stop_token>

//-------------------------------------------------------------------------

namespace divix::settlement
{

//-------------------------------------------------------------------------

/**
 * Aggregate -> match per currency -> order.
 *
 * Currencies are matched independently; with threadCount > 1 they are spread
 * over a worker pool and joined before ordering, so the result does not depend
 * on the thread count.
 *
 * An engine is not thread-safe. signals() is an unsynchronized signal emitted
 * on the thread calling simplify(), so concurrent simplify() calls, or
 * connecting slots while one runs, need a separate engine per thread or
 * external locking.
 */
class SettlementEngine
{
public:
    explicit SettlementEngine(EngineConfig config = {});
    ~SettlementEngine() noexcept;

    // Returns std::nullopt if a stop was requested before matching completed.
    [[nodiscard]] std::optional<std::vector<ledger::Settlement>> simplify(
        std::span<const ledger::Debt> debts, std::stop_token stopToken = {});

    [[nodiscard]] std::vector<ledger::CurrencyBalances> balances(
        std::span<const ledger::Debt> debts) const;
    [[nodiscard]] ledger::Exposure exposure(
        const UserId& userId, std::span<const ledger::Debt> debts) const;
    [[nodiscard]] ledger::ValidationReport validate(std::span<const ledger::Debt> debts) const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return m_config; }
    [[nodiscard]] const SettlementMatcher& matcher() const noexcept { return *m_matcher; }
    [[nodiscard]] SettlementSignals& signals() noexcept { return m_signals; }
    [[nodiscard]] const SettlementLogger* settlementLogger() const noexcept
    {
        return m_settlementLogger.get();
    }

private:
    [[nodiscard]] bool matchAll(
        std::span<const ledger::CurrencyBalances> currencies,
        std::span<std::vector<ledger::Settlement>> slots,
        std::stop_token stopToken);

    EngineConfig m_config;
    ledger::BalanceAggregator m_aggregator;
    ledger::ExposureCalculator m_exposureCalculator;
    ledger::LedgerValidator m_validator;
    std::unique_ptr<SettlementMatcher> m_matcher;
    SettlementOrderer m_orderer;
    SettlementSignals m_signals;
    std::unique_ptr<boost::asio::thread_pool> m_threadPool;
    std::unique_ptr<SettlementLogger> m_settlementLogger;
};

//-------------------------------------------------------------------------

}  // namespace divix::settlement

//-------------------------------------------------------------------------
