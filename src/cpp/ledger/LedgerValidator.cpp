/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "divix/ledger/LedgerValidator.hpp"

#include <boost/algorithm/string.hpp>

#include <cstdlib>
#include <unordered_map>

//-------------------------------------------------------------------------

namespace divix::ledger
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] bool isBlank(std::string_view str)
{
    return boost::algorithm::all(str, boost::algorithm::is_space());
}

}  // namespace

//-------------------------------------------------------------------------

std::string ValidationReport::toString() const
{
    if (isValid) {
        return "ledger is valid";
    }
    return fmt::format("{} issue(s): {}", issues.size(), fmt::join(issues, "; "));
}

//-------------------------------------------------------------------------

LedgerValidationError::LedgerValidationError(ValidationReport report, std::source_location sl)
    : std::runtime_error{fmt::format("{}: {}", sl.function_name(), report.toString())},
      m_report{std::move(report)}
{}

//-------------------------------------------------------------------------

LedgerValidator::LedgerValidator(const RoundParams& roundParams)
    : m_roundParams{validateRoundParams(roundParams)}
{}

//-------------------------------------------------------------------------

ValidationReport LedgerValidator::validate(std::span<const Debt> debts) const
{
    ValidationReport report;
    auto addIssue = [&](IssueKind kind, std::string description) {
        report.issues.push_back({.kind = kind, .description = std::move(description)});
    };

    for (const auto& debt : debts) {
        if (isBlank(debt.from) || isBlank(debt.to) || isBlank(debt.currency)) {
            addIssue(
                IssueKind::BLANK_IDENTIFIER,
                fmt::format(
                    "Blank identifier in debt '{}' -> '{}' in currency '{}'",
                    debt.from, debt.to, debt.currency));
        }
        if (!(debt.amount > 0_dec)) {
            addIssue(
                IssueKind::NON_POSITIVE_AMOUNT,
                fmt::format(
                    "Invalid debt amount: {} between {} and {}",
                    debt.amount, debt.from, debt.to));
            continue;
        }
        if (debt.from == debt.to) {
            addIssue(
                IssueKind::SELF_DEBT,
                fmt::format(
                    "Self-referential debt of {} {} for {}",
                    debt.amount, debt.currency, debt.from));
        }
        if (!util::fitsDecimalPlaces(debt.amount, m_roundParams.ledgerDecimals)) {
            addIssue(
                IssueKind::EXCESS_PRECISION,
                fmt::format(
                    "Debt amount {} between {} and {} has more than {} decimal places",
                    debt.amount, debt.from, debt.to, m_roundParams.ledgerDecimals));
        }
        try {
            [[maybe_unused]] const auto units = m_roundParams.toLedgerUnits(debt.amount);
        }
        catch (const std::overflow_error& exc) {
            addIssue(
                IssueKind::AMOUNT_OUT_OF_RANGE,
                fmt::format(
                    "Debt amount {} between {} and {} is out of range: {}",
                    debt.amount, debt.from, debt.to, exc.what()));
        }
    }

    const units_t epsilon = m_roundParams.epsilon();
    for (const auto& [currency, total] : currencyTotals(debts, m_roundParams)) {
        if (std::abs(total) > epsilon) {
            addIssue(
                IssueKind::UNBALANCED_CURRENCY,
                fmt::format(
                    "Currency {} total should be zero, but is {}",
                    currency, m_roundParams.fromLedgerUnits(total)));
        }
    }

    report.isValid = report.issues.empty();
    return report;
}

//-------------------------------------------------------------------------

std::vector<std::pair<CurrencyCode, units_t>> currencyTotals(
    std::span<const Debt> debts, const RoundParams& roundParams)
{
    std::vector<std::pair<CurrencyCode, std::map<UserId, units_t>>> positions;
    std::unordered_map<CurrencyCode, size_t> currencyIndex;

    for (const auto& debt : debts) {
        if (!(debt.amount > 0_dec)) {
            continue;
        }
        units_t amount;
        try {
            amount = roundParams.toLedgerUnits(debt.amount);
        }
        catch (const std::overflow_error&) {
            continue;
        }
        auto [it, inserted] = currencyIndex.try_emplace(debt.currency, positions.size());
        if (inserted) {
            positions.emplace_back(debt.currency, std::map<UserId, units_t>{});
        }
        auto& netPositions = positions[it->second].second;
        netPositions[debt.from] -= amount;
        netPositions[debt.to] += amount;
    }

    return positions
        | views::transform([](const auto& entry) {
            return std::pair{entry.first, ranges::accumulate(entry.second | views::values, units_t{})};
        })
        | ranges::to<std::vector>;
}

//-------------------------------------------------------------------------

}  // namespace divix::ledger

//-------------------------------------------------------------------------
