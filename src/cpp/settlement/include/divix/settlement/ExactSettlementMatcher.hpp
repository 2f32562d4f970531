/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "divix/settlement/SettlementMatcher.hpp"

//-------------------------------------------------------------------------

namespace divix::settlement
{

//-------------------------------------------------------------------------

/**
 * Opt-in matcher producing the minimum number of settlements.
 *
 * With n unsettled participants, the minimum is n - k where k is the largest
 * number of disjoint zero-sum groups the participants can be split into. k is
 * found by a dynamic program over all 2^n subsets (O(n * 2^n) time and memory),
 * after which the greedy kernel settles every group on its own.
 *
 * Above `maxParticipants`, or when the unsettled balances do not sum to zero,
 * the greedy matcher result is returned instead and a warning is logged.
 */
class ExactSettlementMatcher : public SettlementMatcher
{
public:
    static constexpr uint32_t kDefaultMaxParticipants = 16;
    static constexpr uint32_t kParticipantLimit = 20;

    explicit ExactSettlementMatcher(
        const ledger::RoundParams& roundParams,
        uint32_t maxParticipants = kDefaultMaxParticipants);

    [[nodiscard]] virtual std::vector<ledger::Settlement> match(
        std::span<const ledger::UserBalance> balances) const override;

    [[nodiscard]] virtual std::string_view name() const noexcept override { return "exact"; }

    [[nodiscard]] uint32_t maxParticipants() const noexcept { return m_maxParticipants; }

    // Indices into `balances` of each zero-sum group, groups ordered by first member.
    [[nodiscard]] std::vector<std::vector<size_t>> zeroSumGroups(
        std::span<const ledger::UserBalance> balances) const;

private:
    uint32_t m_maxParticipants;
};

//-------------------------------------------------------------------------

}  // namespace divix::settlement

//-------------------------------------------------------------------------
