/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>
#include <msgpack.hpp>

#include <source_location>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace perpx::serialization
{

//-------------------------------------------------------------------------

struct MsgPackError : msgpack::type_error
{
    std::string message;

    explicit MsgPackError(
        std::string_view detail = {},
        std::source_location sl = std::source_location::current()) noexcept
    {
        message = fmt::format(
            "{}#L{}: {}{}{}",
            sl.file_name(),
            sl.line(),
            msgpack::type_error::what(),
            detail.empty() ? "" : ": ",
            detail);
    }

    const char* what() const noexcept override { return message.c_str(); }
};

//-------------------------------------------------------------------------

[[nodiscard]] inline const msgpack::object* msgpackFind(
    const msgpack::object& o, std::string_view key)
{
    for (size_t i = 0; i < o.via.map.size; ++i) {
        const auto& k = o.via.map.ptr[i].key;
        if (k.type == msgpack::type::STR) {
            std::string_view ks{k.via.str.ptr, k.via.str.size};
            if (ks == key) {
                return &o.via.map.ptr[i].val;
            }
        }
    }
    return nullptr;
}

/**
 * Like msgpackFind, but throws MsgPackError when the key is absent.
 */
[[nodiscard]] inline const msgpack::object& msgpackAt(
    const msgpack::object& o,
    std::string_view key,
    std::source_location sl = std::source_location::current())
{
    if (o.type != msgpack::type::MAP) {
        throw MsgPackError{"expected a map", sl};
    }
    if (const msgpack::object* val = msgpackFind(o, key)) {
        return *val;
    }
    throw MsgPackError{fmt::format("missing key '{}'", key), sl};
}

//-------------------------------------------------------------------------

}  // namespace perpx::serialization

//-------------------------------------------------------------------------
