/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "divix/ledger/RoundParams.hpp"
#include "divix/ledger/Settlement.hpp"
#include "divix/ledger/UserBalance.hpp"

//-------------------------------------------------------------------------

namespace divix::settlement
{

//-------------------------------------------------------------------------

/**
 * Turns the net balances of a single currency into transfers that discharge
 * them. Implementations never mutate their input and hold no state between
 * calls, so distinct currencies may be matched concurrently.
 */
class SettlementMatcher
{
public:
    explicit SettlementMatcher(const ledger::RoundParams& roundParams);
    virtual ~SettlementMatcher() noexcept = default;

    [[nodiscard]] virtual std::vector<ledger::Settlement> match(
        std::span<const ledger::UserBalance> balances) const = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    [[nodiscard]] const ledger::RoundParams& roundParams() const noexcept { return m_roundParams; }

protected:
    // matchSettleable() over settleableBalances().
    void matchGreedy(
        std::span<const ledger::UserBalance> balances,
        std::vector<ledger::Settlement>& out) const;

    /**
     * Two-pointer greedy matching in input order over balances that are whole
     * multiples of epsilon, as returned by settleableBalances().
     *
     * Creditors and debtors keep their relative order; each step moves
     * min(credit, debt) from the current debtor to the current creditor, so
     * every transfer is a whole number of settlement units and balances that
     * net to zero are discharged exactly. Emits at most one settlement fewer
     * than there are parties. This is a heuristic: the count is not minimal in
     * general.
     */
    void matchSettleable(
        std::span<const ledger::UserBalance> settleable,
        std::vector<ledger::Settlement>& out) const;

    /**
     * Parties apportioned a nonzero number of settlement units by
     * ledger::apportionSettlementUnits, carrying that amount as their balance
     * in ledger units. Each stays strictly within epsilon of the original
     * balance, so settling these discharges the originals.
     */
    [[nodiscard]] std::vector<ledger::UserBalance> settleableBalances(
        std::span<const ledger::UserBalance> balances) const;

    // Throws std::invalid_argument if the balances span several currencies.
    void checkSingleCurrency(std::span<const ledger::UserBalance> balances) const;

    [[nodiscard]] bool isSettled(units_t balance) const noexcept;

    ledger::RoundParams m_roundParams;
    units_t m_epsilon;
};

//-------------------------------------------------------------------------

}  // namespace divix::settlement

//-------------------------------------------------------------------------
