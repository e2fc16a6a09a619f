/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "perpx/engine/LiquidationEngine.hpp"

//-------------------------------------------------------------------------

namespace perpx::engine
{

//-------------------------------------------------------------------------

LiquidationEngine::LiquidationEngine(
    const market::ParameterStore* params,
    const PositionValuation* valuation,
    external::ITreasury* treasury) noexcept
    : m_params{params}, m_valuation{valuation}, m_treasury{treasury}
{}

//-------------------------------------------------------------------------

decimal_t LiquidationEngine::liquidationMargin(
    const decimal_t& size, const decimal_t& price) const
{
    if (size.isZero()) {
        throw EngineError{ErrorCode::ZeroSizePosition};
    }
    const auto globals = m_params->globals();
    const decimal_t notional = util::abs(size) * price;
    return liquidationFee(size, price) + notional * globals.liquidationBufferRatio;
}

//-------------------------------------------------------------------------

decimal_t LiquidationEngine::liquidationFee(const decimal_t& size, const decimal_t& price) const
{
    const auto globals = m_params->globals();
    const decimal_t proportionalFee = util::abs(size) * price * globals.liquidationFeeRatio;
    return util::max(globals.minKeeperFee, proportionalFee);
}

//-------------------------------------------------------------------------

bool LiquidationEngine::canLiquidate(
    const accounting::MarketLedger& market,
    const accounting::Position& position,
    const Mark& mark) const
{
    if (!position.isOpen()) return false;
    return m_valuation->flooredRemainingMargin(market, position, mark)
        <= liquidationMargin(position.size, mark.price);
}

//-------------------------------------------------------------------------

LiquidationEstimate LiquidationEngine::approxLiquidationPriceAndFee(
    const accounting::MarketLedger& market,
    const accounting::Position& position,
    const Mark& mark) const
{
    if (!position.isOpen()) return {};

    const decimal_t liqMargin = liquidationMargin(position.size, mark.price);
    const decimal_t netFunding = m_valuation->funding().netFundingPerUnit(
        market, position.lastFundingIndex, mark.price, mark.now);
    const decimal_t price =
        position.lastPrice + (liqMargin - position.margin) / position.size - netFunding;

    return {
        .price = util::max(price, {}),
        .fee = liquidationFee(position.size, mark.price)
    };
}

//-------------------------------------------------------------------------

LiquidationResult LiquidationEngine::liquidate(
    accounting::MarketLedger& market,
    const LiquidationDesc& desc,
    const Mark& mark,
    EventBuffer& events) const
{
    const auto& [account, liquidator] = desc;
    const accounting::Position position = market.position(account);

    if (!position.isOpen()) {
        throw EngineError{ErrorCode::ZeroSizePosition, account};
    }
    if (liquidator == account) {
        throw EngineError{ErrorCode::NotPermitted, fmt::format("'{}' liquidating itself", account)};
    }
    if (!canLiquidate(market, position, mark)) {
        throw EngineError{ErrorCode::PositionNotLiquidatable, account};
    }

    const decimal_t remaining = m_valuation->flooredRemainingMargin(market, position, mark);
    const decimal_t liquidatorFee =
        util::min(remaining, liquidationFee(position.size, mark.price));
    const decimal_t poolFee = util::max(remaining - liquidatorFee, {});

    auto& scalars = market.scalars();
    scalars.marketSize -= util::abs(position.size);
    scalars.marketSkew -= position.size;

    accounting::Position liquidated = m_valuation->markedPosition(market, position, {}, {}, mark);
    liquidated.lockedMargin = {};
    const PositionId id = m_valuation->storePosition(market, account, liquidated).id;

    if (liquidatorFee.signum() > 0) {
        m_treasury->issue(liquidator, liquidatorFee);
    }
    if (poolFee.signum() > 0) {
        m_treasury->issue(m_treasury->feePoolAccount(), poolFee);
    }

    events.push_back(PositionModifiedEvent{
        .timestamp = mark.now,
        .marketKey = market.key(),
        .id = id,
        .account = account,
        .margin = {},
        .size = {},
        .tradeSize = -position.size,
        .price = mark.price,
        .fee = liquidatorFee
    });
    events.push_back(PositionLiquidatedEvent{
        .timestamp = mark.now,
        .marketKey = market.key(),
        .id = id,
        .account = account,
        .liquidator = liquidator,
        .size = position.size,
        .price = mark.price,
        .fee = liquidatorFee
    });

    return {
        .id = id,
        .size = position.size,
        .liquidatorFee = liquidatorFee,
        .poolFee = poolFee
    };
}

//-------------------------------------------------------------------------

}  // namespace perpx::engine

//-------------------------------------------------------------------------
