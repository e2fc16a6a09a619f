/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace perpx::util
{

//-------------------------------------------------------------------------

struct XmlFile
{
    pugi::xml_document doc;
    pugi::xml_node root;
};

/**
 * Parses the file and locates its root element; throws std::invalid_argument
 * when either fails.
 */
[[nodiscard]] XmlFile loadXML(const fs::path& path, const char* rootName);

[[nodiscard]] pugi::xml_attribute getAttr(
    pugi::xml_node node,
    const char* name,
    std::source_location sl = std::source_location::current());

[[nodiscard]] decimal_t getDecimalAttr(
    pugi::xml_node node,
    const char* name,
    std::source_location sl = std::source_location::current());

[[nodiscard]] decimal_t getDecimalAttrOr(
    pugi::xml_node node, const char* name, const decimal_t& fallback);

//-------------------------------------------------------------------------

}  // namespace perpx::util

//-------------------------------------------------------------------------
