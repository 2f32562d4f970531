/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "divix/common.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace divix::util
{

//-------------------------------------------------------------------------

/**
 * Reads the enumerator named by attribute `name` of `node`, ignoring case.
 * Returns `fallback` when the attribute is absent and throws
 * std::invalid_argument when it names no enumerator of E.
 */
template<typename E>
requires std::is_enum_v<E>
[[nodiscard]] E enumAttribute(
    pugi::xml_node node,
    const char* name,
    E fallback,
    std::source_location sl = std::source_location::current())
{
    pugi::xml_attribute attr = node.attribute(name);
    if (!attr) {
        return fallback;
    }
    const std::string_view value = attr.as_string();
    const auto res = magic_enum::enum_cast<E>(value, magic_enum::case_insensitive);
    if (!res.has_value()) {
        throw std::invalid_argument{fmt::format(
            "{}: invalid value '{}' for attribute '{}' of <{}>, expected one of {}",
            sl.function_name(),
            value,
            name,
            node.name(),
            fmt::join(magic_enum::enum_names<E>(), ", "))};
    }
    return res.value();
}

struct ConfigNodes
{
    pugi::xml_document doc;
    pugi::xml_node root;
};

// Loads `path` and returns its root element named `rootName`.
[[nodiscard]] ConfigNodes parseConfigFile(const fs::path& path, const char* rootName);

//-------------------------------------------------------------------------

}  // namespace divix::util

//-------------------------------------------------------------------------
