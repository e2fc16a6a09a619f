/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "perpx/engine/PositionValuation.hpp"

//-------------------------------------------------------------------------

namespace perpx::engine
{

//-------------------------------------------------------------------------

PositionValuation::PositionValuation(const funding::FundingEngine* funding) noexcept
    : m_funding{funding}
{}

//-------------------------------------------------------------------------

decimal_t PositionValuation::profitLoss(
    const accounting::Position& position, const decimal_t& price) const
{
    if (!position.isOpen()) return {};
    return position.size * (price - position.lastPrice);
}

//-------------------------------------------------------------------------

decimal_t PositionValuation::accruedFunding(
    const accounting::MarketLedger& market,
    const accounting::Position& position,
    const Mark& mark) const
{
    return m_funding->accruedFunding(market, position, mark.price, mark.now);
}

//-------------------------------------------------------------------------

decimal_t PositionValuation::remainingMargin(
    const accounting::MarketLedger& market,
    const accounting::Position& position,
    const Mark& mark) const
{
    return position.margin
        + profitLoss(position, mark.price)
        + accruedFunding(market, position, mark);
}

//-------------------------------------------------------------------------

decimal_t PositionValuation::flooredRemainingMargin(
    const accounting::MarketLedger& market,
    const accounting::Position& position,
    const Mark& mark) const
{
    return util::max(remainingMargin(market, position, mark), {});
}

//-------------------------------------------------------------------------

decimal_t PositionValuation::currentLeverage(
    const accounting::MarketLedger& market,
    const accounting::Position& position,
    const Mark& mark) const
{
    const decimal_t remaining = flooredRemainingMargin(market, position, mark);
    if (remaining.isZero()) return {};
    return position.size * mark.price / remaining;
}

//-------------------------------------------------------------------------

decimal_t PositionValuation::debtContribution(
    const accounting::MarketLedger& market, const accounting::Position& position) const
{
    if (!position.isOpen()) return position.margin;
    return position.margin
        - position.size * (position.lastPrice + market.fundingAt(position.lastFundingIndex));
}

//-------------------------------------------------------------------------

decimal_t PositionValuation::marketDebt(
    const accounting::MarketLedger& market, const Mark& mark) const
{
    const auto& scalars = market.scalars();
    const decimal_t nextFunding = m_funding->nextFundingEntry(market, mark.price, mark.now);
    return util::max(
        scalars.marketSkew * (mark.price + nextFunding) + scalars.entryDebtCorrection, {});
}

//-------------------------------------------------------------------------

accounting::Position PositionValuation::markedPosition(
    const accounting::MarketLedger& market,
    const accounting::Position& position,
    const decimal_t& margin,
    const decimal_t& size,
    const Mark& mark) const
{
    return {
        .id = position.id,
        .lastFundingIndex = market.latestFundingIndex(),
        .margin = margin,
        .lockedMargin = position.lockedMargin,
        .lastPrice = mark.price,
        .size = size
    };
}

//-------------------------------------------------------------------------

const accounting::Position& PositionValuation::storePosition(
    accounting::MarketLedger& market,
    const AccountId& account,
    const accounting::Position& position) const
{
    const decimal_t before = debtContribution(market, market.position(account));
    const decimal_t after = debtContribution(market, position);
    market.scalars().entryDebtCorrection += after - before;
    return market.storePosition(account, position);
}

//-------------------------------------------------------------------------

}  // namespace perpx::engine

//-------------------------------------------------------------------------
