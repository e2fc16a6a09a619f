/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace perpx::external
{

//-------------------------------------------------------------------------

struct PriceReading
{
    decimal_t price;
    bool invalid;
    RoundId roundId;
};

//-------------------------------------------------------------------------

class IPriceOracle
{
public:
    virtual ~IPriceOracle() noexcept = default;

    [[nodiscard]] virtual PriceReading currentPrice(const AssetKey& asset) const = 0;
};

//-------------------------------------------------------------------------

}  // namespace perpx::external

//-------------------------------------------------------------------------
