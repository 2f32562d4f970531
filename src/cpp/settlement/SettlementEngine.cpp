/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "divix/settlement/SettlementEngine.hpp"

#include "divix/settlement/SettlementMatcherFactory.hpp"

#include <boost/asio/post.hpp>

#include <atomic>
#include <exception>
#include <latch>
#include <mutex>

//-------------------------------------------------------------------------

namespace divix::settlement
{

//-------------------------------------------------------------------------

SettlementEngine::SettlementEngine(EngineConfig config)
    : m_config{std::move(config)},
      m_aggregator{m_config.roundParams, m_config.invalidDebts},
      m_exposureCalculator{m_config.roundParams, m_config.invalidDebts},
      m_validator{m_config.roundParams},
      m_matcher{SettlementMatcherFactory::create(m_config.matcher, m_config.roundParams)}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (m_config.threadCount == 0) {
        throw std::invalid_argument{fmt::format("{}: threadCount should be > 0", ctx)};
    }
    if (m_config.threadCount > 1) {
        m_threadPool = std::make_unique<boost::asio::thread_pool>(m_config.threadCount);
    }
    if (m_config.settlementLog) {
        m_settlementLogger = std::make_unique<SettlementLogger>(
            *m_config.settlementLog, m_signals.settled);
    }
}

//-------------------------------------------------------------------------

SettlementEngine::~SettlementEngine() noexcept
{
    if (m_threadPool) {
        m_threadPool->join();
    }
}

//-------------------------------------------------------------------------

std::optional<std::vector<ledger::Settlement>> SettlementEngine::simplify(
    std::span<const ledger::Debt> debts, std::stop_token stopToken)
{
    if (m_config.validation == ValidationPolicy::FAIL_FAST) {
        if (auto report = m_validator.validate(debts); !report.isValid) {
            throw ledger::LedgerValidationError{std::move(report)};
        }
    }

    const auto currencies = m_aggregator.aggregate(debts);
    std::vector<std::vector<ledger::Settlement>> slots(currencies.size());

    if (!matchAll(currencies, slots, stopToken) || stopToken.stop_requested()) {
        return std::nullopt;
    }

    auto settlements = m_orderer.order(slots | views::join | ranges::to<std::vector>);
    m_signals.settled(settlements);
    return settlements;
}

//-------------------------------------------------------------------------

std::vector<ledger::CurrencyBalances> SettlementEngine::balances(
    std::span<const ledger::Debt> debts) const
{
    return m_aggregator.aggregate(debts);
}

//-------------------------------------------------------------------------

ledger::Exposure SettlementEngine::exposure(
    const UserId& userId, std::span<const ledger::Debt> debts) const
{
    return m_exposureCalculator.exposure(userId, debts);
}

//-------------------------------------------------------------------------

ledger::ValidationReport SettlementEngine::validate(std::span<const ledger::Debt> debts) const
{
    return m_validator.validate(debts);
}

//-------------------------------------------------------------------------

bool SettlementEngine::matchAll(
    std::span<const ledger::CurrencyBalances> currencies,
    std::span<std::vector<ledger::Settlement>> slots,
    std::stop_token stopToken)
{
    if (!m_threadPool || currencies.size() < 2) {
        for (auto&& [currency, slot] : views::zip(currencies, slots)) {
            if (stopToken.stop_requested()) {
                return false;
            }
            slot = m_matcher->match(currency.balances);
        }
        return true;
    }

    std::latch latch{static_cast<std::ptrdiff_t>(currencies.size())};
    std::atomic_bool stopped{false};
    std::exception_ptr failure;
    std::mutex failureMutex;

    for (size_t i = 0; i < currencies.size(); ++i) {
        boost::asio::post(
            *m_threadPool,
            [&, i] {
                if (stopToken.stop_requested()) {
                    stopped = true;
                } else {
                    try {
                        slots[i] = m_matcher->match(currencies[i].balances);
                    }
                    catch (...) {
                        std::lock_guard lock{failureMutex};
                        if (!failure) {
                            failure = std::current_exception();
                        }
                    }
                }
                latch.count_down();
            });
    }
    latch.wait();

    if (failure) {
        std::rethrow_exception(failure);
    }
    return !stopped;
}

//-------------------------------------------------------------------------

}  // namespace divix::settlement

//-------------------------------------------------------------------------
