/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "perpx/engine/TradeEngine.hpp"

//-------------------------------------------------------------------------

namespace perpx::engine
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] bool reducesExposure(const decimal_t& oldSize, const decimal_t& newSize)
{
    if (newSize.isZero()) return true;
    return oldSize.signum() == newSize.signum() && util::abs(newSize) < util::abs(oldSize);
}

}  // namespace

//-------------------------------------------------------------------------

TradeEngine::TradeEngine(
    const market::ParameterStore* params,
    const PositionValuation* valuation,
    const LiquidationEngine* liquidation,
    external::ITreasury* treasury) noexcept
    : m_params{params},
      m_valuation{valuation},
      m_liquidation{liquidation},
      m_treasury{treasury}
{}

//-------------------------------------------------------------------------

decimal_t TradeEngine::orderFee(
    const decimal_t& sizeDelta, const decimal_t& price, const decimal_t& feeRate) const
{
    return util::abs(sizeDelta) * price * feeRate;
}

//-------------------------------------------------------------------------

TradeDetails TradeEngine::postTradeDetails(
    const accounting::MarketLedger& market,
    const accounting::Position& position,
    const decimal_t& sizeDelta,
    const decimal_t& feeRate,
    const Mark& mark) const
{
    if (sizeDelta.isZero()) {
        return {.margin = position.margin, .size = position.size, .status = Status::NilOrder};
    }

    const auto params = m_params->market(market.key());
    const auto globals = m_params->globals();

    const decimal_t fee = orderFee(sizeDelta, mark.price, feeRate);
    const decimal_t newSize = position.size + sizeDelta;
    const decimal_t newMargin =
        m_valuation->flooredRemainingMargin(market, position, mark) - fee;

    auto fail = [&](Status status) -> TradeDetails {
        return {.margin = position.margin, .size = position.size, .fee = fee, .status = status};
    };

    if (newMargin.signum() < 0) {
        return fail(Status::InsufficientMargin);
    }
    const bool reducing = reducesExposure(position.size, newSize);
    if (!reducing && newMargin + fee < globals.minInitialMargin) {
        return fail(Status::InsufficientMargin);
    }

    if (!newSize.isZero()) {
        if (newMargin.isZero()
            || util::abs(newSize) * mark.price / newMargin
                > params.maxLeverage + leverageHeadroom()) {
            return fail(Status::MaxLeverageExceeded);
        }
    }

    const bool shrinking = util::abs(newSize) < util::abs(position.size);
    if (!newSize.isZero() && !shrinking) {
        const decimal_t sideValue =
            sideSizeAfter(market, position.size, newSize) * mark.price;
        if (sideValue > params.maxSingleSideValueUSD) {
            return fail(Status::MaxMarketSizeExceeded);
        }
    }

    if (m_liquidation->canLiquidate(market, position, mark)) {
        return fail(Status::CanLiquidate);
    }

    return {.margin = newMargin, .size = newSize, .fee = fee, .status = Status::Ok};
}

//-------------------------------------------------------------------------

MarketSizes TradeEngine::marketSizes(const accounting::MarketLedger& market) const
{
    const auto& scalars = market.scalars();
    return {.longSize = scalars.longSize(), .shortSize = scalars.shortSize()};
}

//-------------------------------------------------------------------------

MarketSizes TradeEngine::maxOrderSizes(
    const accounting::MarketLedger& market, const decimal_t& price) const
{
    const auto params = m_params->market(market.key());
    const auto [longSize, shortSize] = marketSizes(market);
    const decimal_t sideCap = params.maxSingleSideValueUSD / price;
    return {
        .longSize = util::max(sideCap - longSize, {}),
        .shortSize = util::max(sideCap - shortSize, {})
    };
}

//-------------------------------------------------------------------------

TradeDetails TradeEngine::trade(
    accounting::MarketLedger& market,
    const TradeParams& params,
    const Mark& mark,
    EventBuffer& events) const
{
    const auto& [account, sizeDelta, feeRate, trackingCode] = params;
    const accounting::Position position = market.position(account);

    const TradeDetails details = postTradeDetails(market, position, sizeDelta, feeRate, mark);
    throwIfNotOk(
        details.status, fmt::format("'{}' trading {} on {}", account, sizeDelta, position));

    auto& scalars = market.scalars();
    scalars.marketSize += util::abs(details.size) - util::abs(position.size);
    scalars.marketSkew += details.size - position.size;

    const auto& stored = m_valuation->storePosition(
        market,
        account,
        m_valuation->markedPosition(market, position, details.margin, details.size, mark));

    if (details.fee.signum() > 0) {
        m_treasury->issue(m_treasury->feePoolAccount(), details.fee);
    }

    events.push_back(PositionModifiedEvent{
        .timestamp = mark.now,
        .marketKey = market.key(),
        .id = stored.id,
        .account = account,
        .margin = stored.margin,
        .size = stored.size,
        .tradeSize = sizeDelta,
        .price = mark.price,
        .fee = details.fee
    });
    if (!trackingCode.empty()) {
        events.push_back(TrackingEvent{
            .timestamp = mark.now,
            .trackingCode = trackingCode,
            .marketKey = market.key(),
            .account = account,
            .sizeDelta = sizeDelta,
            .fee = details.fee
        });
    }

    return details;
}

//-------------------------------------------------------------------------

const decimal_t& TradeEngine::leverageHeadroom()
{
    static const decimal_t s_headroom = DEC(0.01);
    return s_headroom;
}

//-------------------------------------------------------------------------

decimal_t TradeEngine::sideSizeAfter(
    const accounting::MarketLedger& market,
    const decimal_t& oldSize,
    const decimal_t& newSize) const
{
    const auto [longSize, shortSize] = marketSizes(market);
    if (newSize.signum() > 0) {
        return longSize - util::max(oldSize, {}) + newSize;
    }
    return shortSize - util::max(-oldSize, {}) - newSize;
}

//-------------------------------------------------------------------------

}  // namespace perpx::engine

//-------------------------------------------------------------------------
