/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "divix/util/xml_util.hpp"

//-------------------------------------------------------------------------

namespace divix::util
{

//-------------------------------------------------------------------------

ConfigNodes parseConfigFile(const fs::path& path, const char* rootName)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!fs::exists(path)) {
        throw std::runtime_error{fmt::format("{}: no such file '{}'", ctx, path.c_str())};
    }

    pugi::xml_document doc;
    if (pugi::xml_parse_result result = doc.load_file(path.c_str()); !result) {
        throw std::runtime_error{fmt::format(
            "{}: failed to parse '{}' at offset {}: {}",
            ctx, path.c_str(), result.offset, result.description())};
    }

    pugi::xml_node root = doc.child(rootName);
    if (!root) {
        throw std::runtime_error{fmt::format(
            "{}: missing root node '{}' in '{}'", ctx, rootName, path.c_str())};
    }

    return {.doc = std::move(doc), .root = root};
}

//-------------------------------------------------------------------------

}  // namespace divix::util

//-------------------------------------------------------------------------
