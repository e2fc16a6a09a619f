/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "perpx/engine/LiquidationEngine.hpp"

//-------------------------------------------------------------------------

namespace perpx::engine
{

//-------------------------------------------------------------------------

struct TradeParams
{
    AccountId account;
    decimal_t sizeDelta;
    decimal_t feeRate;
    std::string trackingCode;
};

//-------------------------------------------------------------------------

class TradeEngine
{
public:
    TradeEngine(
        const market::ParameterStore* params,
        const PositionValuation* valuation,
        const LiquidationEngine* liquidation,
        external::ITreasury* treasury) noexcept;

    [[nodiscard]] decimal_t orderFee(
        const decimal_t& sizeDelta, const decimal_t& price, const decimal_t& feeRate) const;

    /**
     * Projects a trade without touching the ledger. Business failures are
     * reported through TradeDetails::status, in this order: NilOrder,
     * InsufficientMargin, MaxLeverageExceeded, MaxMarketSizeExceeded,
     * CanLiquidate.
     */
    [[nodiscard]] TradeDetails postTradeDetails(
        const accounting::MarketLedger& market,
        const accounting::Position& position,
        const decimal_t& sizeDelta,
        const decimal_t& feeRate,
        const Mark& mark) const;

    [[nodiscard]] MarketSizes marketSizes(const accounting::MarketLedger& market) const;

    [[nodiscard]] MarketSizes maxOrderSizes(
        const accounting::MarketLedger& market, const decimal_t& price) const;

    TradeDetails trade(
        accounting::MarketLedger& market,
        const TradeParams& params,
        const Mark& mark,
        EventBuffer& events) const;

    [[nodiscard]] static const decimal_t& leverageHeadroom();

private:
    [[nodiscard]] decimal_t sideSizeAfter(
        const accounting::MarketLedger& market,
        const decimal_t& oldSize,
        const decimal_t& newSize) const;

    const market::ParameterStore* m_params;
    const PositionValuation* m_valuation;
    const LiquidationEngine* m_liquidation;
    external::ITreasury* m_treasury;
};

//-------------------------------------------------------------------------

}  // namespace perpx::engine

//-------------------------------------------------------------------------
