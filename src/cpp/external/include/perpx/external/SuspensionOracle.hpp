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

class ISuspensionOracle
{
public:
    virtual ~ISuspensionOracle() noexcept = default;

    [[nodiscard]] virtual bool isSystemSuspended() const = 0;
    [[nodiscard]] virtual bool isMarketSuspended(const MarketKey& marketKey) const = 0;
};

//-------------------------------------------------------------------------

}  // namespace perpx::external

//-------------------------------------------------------------------------
