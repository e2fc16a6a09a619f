/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "perpx/engine/EngineEvents.hpp"
#include "perpx/engine/PositionValuation.hpp"
#include "perpx/engine/Summaries.hpp"
#include "perpx/external/Treasury.hpp"

//-------------------------------------------------------------------------

namespace perpx::engine
{

//-------------------------------------------------------------------------

struct LiquidationDesc
{
    AccountId account;
    AccountId liquidator;
};

struct LiquidationResult
{
    PositionId id;
    decimal_t size;
    decimal_t liquidatorFee;
    decimal_t poolFee;
};

//-------------------------------------------------------------------------

class LiquidationEngine
{
public:
    LiquidationEngine(
        const market::ParameterStore* params,
        const PositionValuation* valuation,
        external::ITreasury* treasury) noexcept;

    /**
     * max(minKeeperFee, |size| * price * liquidationFeeRatio)
     *     + |size| * price * liquidationBufferRatio
     *
     * Throws EngineError{ZeroSizePosition} for a zero size.
     */
    [[nodiscard]] decimal_t liquidationMargin(const decimal_t& size, const decimal_t& price) const;

    [[nodiscard]] decimal_t liquidationFee(const decimal_t& size, const decimal_t& price) const;

    [[nodiscard]] bool canLiquidate(
        const accounting::MarketLedger& market,
        const accounting::Position& position,
        const Mark& mark) const;

    // Exact when the liquidation margin does not move with price.
    [[nodiscard]] LiquidationEstimate approxLiquidationPriceAndFee(
        const accounting::MarketLedger& market,
        const accounting::Position& position,
        const Mark& mark) const;

    LiquidationResult liquidate(
        accounting::MarketLedger& market,
        const LiquidationDesc& desc,
        const Mark& mark,
        EventBuffer& events) const;

private:
    const market::ParameterStore* m_params;
    const PositionValuation* m_valuation;
    external::ITreasury* m_treasury;
};

//-------------------------------------------------------------------------

}  // namespace perpx::engine

//-------------------------------------------------------------------------
