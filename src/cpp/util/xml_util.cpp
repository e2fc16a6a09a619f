/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "xml_util.hpp"

//-------------------------------------------------------------------------

namespace perpx::util
{

//-------------------------------------------------------------------------

XmlFile loadXML(const fs::path& path, const char* rootName)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    XmlFile file;
    pugi::xml_parse_result result = file.doc.load_file(path.c_str());
    if (!result) {
        throw std::invalid_argument{fmt::format(
            "{}: Failed to parse '{}': {} at offset {}",
            ctx, path.string(), result.description(), result.offset)};
    }
    file.root = file.doc.child(rootName);
    if (!file.root) {
        throw std::invalid_argument{fmt::format(
            "{}: '{}' has no <{}> element", ctx, path.string(), rootName)};
    }
    return file;
}

//-------------------------------------------------------------------------

pugi::xml_attribute getAttr(pugi::xml_node node, const char* name, std::source_location sl)
{
    if (pugi::xml_attribute attr = node.attribute(name)) {
        return attr;
    }
    throw std::invalid_argument{fmt::format(
        "{}: Missing required attribute '{}' on <{}>", sl.function_name(), name, node.name())};
}

//-------------------------------------------------------------------------

decimal_t getDecimalAttr(pugi::xml_node node, const char* name, std::source_location sl)
{
    return decimal_t::fromString(getAttr(node, name, sl).as_string());
}

//-------------------------------------------------------------------------

decimal_t getDecimalAttrOr(pugi::xml_node node, const char* name, const decimal_t& fallback)
{
    pugi::xml_attribute attr = node.attribute(name);
    return attr ? decimal_t::fromString(attr.as_string()) : fallback;
}

//-------------------------------------------------------------------------

}  // namespace perpx::util

//-------------------------------------------------------------------------
