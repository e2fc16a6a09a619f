/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "perpx/decimal/decimal.hpp"
#include "perpx/serialization/msgpack_util.hpp"

//-------------------------------------------------------------------------

namespace msgpack
{

MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS)
{

namespace adaptor
{

template<>
struct convert<perpx::decimal_t>
{
    const msgpack::object& operator()(const msgpack::object& o, perpx::decimal_t& v) const
    {
        if (o.type != msgpack::type::STR) {
            throw perpx::serialization::MsgPackError{};
        }
        v = perpx::decimal_t::fromString(o.as<std::string_view>());
        return o;
    }
};

template<>
struct pack<perpx::decimal_t>
{
    template<typename Stream>
    msgpack::packer<Stream>& operator()(msgpack::packer<Stream>& o, const perpx::decimal_t& v) const
    {
        o.pack(v.toString());
        return o;
    }
};

}  // namespace adaptor

}  // MSGPACK_API_VERSION_NAMESPACE

}  // namespace msgpack

//-------------------------------------------------------------------------
