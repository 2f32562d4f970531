/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "divix/ledger/Debt.hpp"
#include "divix/ledger/RoundParams.hpp"

//-------------------------------------------------------------------------

namespace divix::ledger
{

//-------------------------------------------------------------------------

enum class IssueKind : uint32_t
{
    NON_POSITIVE_AMOUNT,
    SELF_DEBT,
    BLANK_IDENTIFIER,
    EXCESS_PRECISION,
    AMOUNT_OUT_OF_RANGE,
    UNBALANCED_CURRENCY
};

struct ValidationIssue
{
    IssueKind kind;
    std::string description;
};

struct ValidationReport
{
    bool isValid{true};
    std::vector<ValidationIssue> issues;

    [[nodiscard]] std::string toString() const;
};

//-------------------------------------------------------------------------

class LedgerValidationError : public std::runtime_error
{
public:
    explicit LedgerValidationError(
        ValidationReport report, std::source_location sl = std::source_location::current());

    [[nodiscard]] const ValidationReport& report() const noexcept { return m_report; }

private:
    ValidationReport m_report;
};

//-------------------------------------------------------------------------

/**
 * Advisory structural checks over a debt list.
 *
 * Never throws on malformed debts; every finding becomes an issue in the
 * report. The per-currency conservation check recomputes net positions on its
 * own rather than through BalanceAggregator, so it guards against regressions
 * in the aggregation step.
 */
class LedgerValidator
{
public:
    explicit LedgerValidator(const RoundParams& roundParams = {});

    [[nodiscard]] ValidationReport validate(std::span<const Debt> debts) const;

private:
    RoundParams m_roundParams;
};

// Sum of all net positions per currency, in ledger units, first-seen order.
// Debts with a non-positive or unrepresentable amount are left out.
[[nodiscard]] std::vector<std::pair<CurrencyCode, units_t>> currencyTotals(
    std::span<const Debt> debts, const RoundParams& roundParams);

//-------------------------------------------------------------------------

}  // namespace divix::ledger

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<divix::ledger::ValidationIssue>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const divix::ledger::ValidationIssue& issue, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(), "[{}] {}", magic_enum::enum_name(issue.kind), issue.description);
    }
};

//-------------------------------------------------------------------------
