/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "perpx/accounting/Position.hpp"
#include "perpx/engine/Status.hpp"

//-------------------------------------------------------------------------

namespace perpx::engine
{

//-------------------------------------------------------------------------

/**
 * A value derived from the oracle price. When the price is invalid the value
 * is left default-constructed.
 */
template<typename T>
struct Priced
{
    T value{};
    bool priceInvalid{};
};

//-------------------------------------------------------------------------

struct MarketSizes
{
    decimal_t longSize{};
    decimal_t shortSize{};
};

struct LiquidationEstimate
{
    decimal_t price{};
    decimal_t fee{};
};

//-------------------------------------------------------------------------

struct TradeDetails
{
    decimal_t margin{};
    decimal_t size{};
    decimal_t fee{};
    Status status{Status::Ok};
};

//-------------------------------------------------------------------------

struct PositionSummary
{
    accounting::Position position;
    decimal_t profitLoss{};
    decimal_t accruedFunding{};
    // Signed; floored at zero wherever it gates leverage or liquidation.
    decimal_t remainingMargin{};
    decimal_t accessibleMargin{};
    decimal_t currentLeverage{};
    bool canLiquidate{};
    decimal_t approxLiquidationPrice{};
    decimal_t approxLiquidationFee{};
    bool priceInvalid{};
};

//-------------------------------------------------------------------------

struct MarketSummary
{
    MarketKey marketKey;
    AssetKey baseAsset;
    decimal_t price{};
    decimal_t marketSize{};
    decimal_t marketSkew{};
    decimal_t marketDebt{};
    decimal_t proportionalSkew{};
    decimal_t currentFundingRate{};
    decimal_t unrecordedFunding{};
    size_t fundingSequenceLength{};
    bool priceInvalid{};
};

//-------------------------------------------------------------------------

}  // namespace perpx::engine

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<perpx::engine::MarketSummary>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const perpx::engine::MarketSummary& summary, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "{} ({}) price {}{} | size {} | skew {} | debt {} | rate {}/day | "
            "unrecorded {} | funding entries {}",
            summary.marketKey,
            summary.baseAsset,
            summary.price,
            summary.priceInvalid ? " (invalid)" : "",
            summary.marketSize,
            summary.marketSkew,
            summary.marketDebt,
            summary.currentFundingRate,
            summary.unrecordedFunding,
            summary.fundingSequenceLength);
    }
};

//-------------------------------------------------------------------------
