/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "divix/ledger/ExpenseSplitter.hpp"
#include "divix/ledger/LedgerException.hpp"

#include <concepts>
#include <set>

//-------------------------------------------------------------------------

namespace divix::ledger
{

//-------------------------------------------------------------------------

namespace
{

template<typename T>
void checkCoversParticipants(
    const std::map<UserId, T>& entries,
    std::span<const UserId> participants,
    std::string_view what,
    std::string_view ctx)
{
    if (entries.size() != participants.size()
        || !ranges::all_of(participants, [&](const auto& p) { return entries.contains(p); })) {
        throw InvalidSplit{fmt::format(
            "{}: {} [{}] must cover exactly the participants [{}]",
            ctx,
            what,
            fmt::join(entries | views::keys, ", "),
            fmt::join(participants, ", "))};
    }
}

void distributeRemainder(std::vector<units_t>& shares, units_t remainder)
{
    for (size_t i = 0; remainder > 0; i = (i + 1) % shares.size(), --remainder) {
        ++shares[i];
    }
}

}  // namespace

//-------------------------------------------------------------------------

std::vector<units_t> computeShares(const Expense& expense, const RoundParams& roundParams)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!(expense.amount > 0_dec)) {
        throw InvalidSplit{fmt::format(
            "{}: expense amount must be positive, was {}", ctx, expense.amount)};
    }
    if (expense.participants.empty()) {
        throw InvalidSplit{fmt::format("{}: expense has no participants", ctx)};
    }
    if (std::set<UserId>(expense.participants.begin(), expense.participants.end()).size()
        != expense.participants.size()) {
        throw InvalidSplit{fmt::format(
            "{}: duplicate participants in [{}]", ctx, fmt::join(expense.participants, ", "))};
    }

    const uint32_t decimals = roundParams.settlementDecimals;
    const units_t total = util::toUnits(expense.amount, decimals, roundParams.rounding);
    const auto count = static_cast<units_t>(expense.participants.size());

    return std::visit(
        [&](auto&& split) -> std::vector<units_t> {
            using T = std::remove_cvref_t<decltype(split)>;
            if constexpr (std::same_as<T, EqualSplit>) {
                std::vector<units_t> shares(expense.participants.size(), total / count);
                distributeRemainder(shares, total % count);
                return shares;
            } else if constexpr (std::same_as<T, ExactSplit>) {
                checkCoversParticipants(split.shares, expense.participants, "exact shares", ctx);
                auto shares = expense.participants
                    | views::transform([&](const UserId& p) {
                        const decimal_t share = split.shares.at(p);
                        if (share < 0_dec || !util::fitsDecimalPlaces(share, decimals)) {
                            throw InvalidSplit{fmt::format(
                                "{}: share {} of {} must be non-negative with at most {} decimals",
                                ctx, share, p, decimals)};
                        }
                        return util::toUnits(share, decimals);
                    })
                    | ranges::to<std::vector>;
                if (const units_t sum = ranges::accumulate(shares, units_t{}); sum != total) {
                    throw InvalidSplit{fmt::format(
                        "{}: exact shares sum to {} but the expense amount is {}",
                        ctx, util::fromUnits(sum, decimals), expense.amount)};
                }
                return shares;
            } else if constexpr (std::same_as<T, PercentageSplit>) {
                checkCoversParticipants(
                    split.percentages, expense.participants, "percentages", ctx);
                const decimal_t percentSum = ranges::accumulate(
                    split.percentages | views::values, 0_dec);
                if (percentSum != 100_dec
                    || ranges::any_of(
                        split.percentages | views::values, [](decimal_t v) { return v < 0_dec; })) {
                    throw InvalidSplit{fmt::format(
                        "{}: percentages must be non-negative and sum to 100, sum was {}",
                        ctx, percentSum)};
                }
                auto shares = expense.participants
                    | views::transform([&](const UserId& p) {
                        const decimal_t exact =
                            util::fromUnits(total, decimals) * split.percentages.at(p) / 100_dec;
                        return util::truncToUnits(exact, decimals);
                    })
                    | ranges::to<std::vector>;
                distributeRemainder(shares, total - ranges::accumulate(shares, units_t{}));
                return shares;
            } else {
                static_assert(false, "Unknown SplitMethod alternative");
            }
        },
        expense.split);
}

//-------------------------------------------------------------------------

std::vector<Debt> splitExpense(const Expense& expense, const RoundParams& roundParams)
{
    const auto shares = computeShares(expense, validateRoundParams(roundParams));

    std::vector<Debt> debts;
    for (const auto& [participant, share] : views::zip(expense.participants, shares)) {
        if (participant == expense.payer || share == 0) {
            continue;
        }
        debts.push_back({
            .from = participant,
            .to = expense.payer,
            .amount = util::fromUnits(share, roundParams.settlementDecimals),
            .currency = expense.currency
        });
    }
    return debts;
}

//-------------------------------------------------------------------------

}  // namespace divix::ledger

//-------------------------------------------------------------------------
