/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "divix/settlement/EngineConfig.hpp"
#include "divix/util/xml_util.hpp"

#include <thread>

//-------------------------------------------------------------------------

namespace divix::settlement
{

//-------------------------------------------------------------------------

MatcherConfig MatcherConfig::fromXML(pugi::xml_node node)
{
    return {
        .type = util::enumAttribute(node, "type", MatcherType::GREEDY),
        .maxParticipants = node.attribute("maxParticipants").as_uint(16)
    };
}

//-------------------------------------------------------------------------

EngineConfig makeEngineConfig(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const auto threadCount = [&] {
        const auto threadCount = node.attribute("threadCount").as_uint(1);
        if (threadCount == 0) {
            throw std::invalid_argument{fmt::format("{}: threadCount should be > 0", ctx)};
        }
        if (const auto available = std::thread::hardware_concurrency();
            available != 0 && threadCount > available) {
            throw std::invalid_argument{fmt::format(
                "{}: requested thread count ({}) exceeds count available ({})",
                ctx, threadCount, available)};
        }
        return threadCount;
    }();

    const auto settlementLog = [&] -> std::optional<fs::path> {
        const pugi::xml_attribute attr = node.child("Logging").attribute("settlementLog");
        if (!attr || std::string_view{attr.as_string()}.empty()) {
            return std::nullopt;
        }
        return fs::path{attr.as_string()};
    }();

    return {
        .roundParams = ledger::RoundParams::fromXML(node),
        .invalidDebts =
            util::enumAttribute(node, "invalidDebts", ledger::InvalidDebtPolicy::REJECT),
        .validation = util::enumAttribute(node, "validation", ValidationPolicy::ADVISORY),
        .threadCount = threadCount,
        .matcher = MatcherConfig::fromXML(node.child("Matcher")),
        .settlementLog = settlementLog
    };
}

//-------------------------------------------------------------------------

EngineConfig loadEngineConfig(const fs::path& path)
{
    const auto nodes = util::parseConfigFile(path, "Settlement");
    return makeEngineConfig(nodes.root);
}

//-------------------------------------------------------------------------

}  // namespace divix::settlement

//-------------------------------------------------------------------------
