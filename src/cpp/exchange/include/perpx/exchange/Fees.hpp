/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "perpx/decimal/serialization/decimal.hpp"

#include <msgpack.hpp>

//-------------------------------------------------------------------------

namespace perpx::exchange
{

//-------------------------------------------------------------------------

struct Fees
{
    decimal_t maker{};
    decimal_t taker{};

    MSGPACK_DEFINE_MAP(maker, taker);
};

//-------------------------------------------------------------------------

}  // namespace perpx::exchange

//-------------------------------------------------------------------------
