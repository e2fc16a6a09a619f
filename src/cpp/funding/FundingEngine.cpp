/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "perpx/funding/FundingEngine.hpp"

//-------------------------------------------------------------------------

namespace perpx::funding
{

//-------------------------------------------------------------------------

FundingEngine::FundingEngine(const market::ParameterStore* params) noexcept
    : m_params{params}
{}

//-------------------------------------------------------------------------

decimal_t FundingEngine::proportionalSkew(
    const accounting::MarketLedger& market, const decimal_t& price) const
{
    const auto params = m_params->market(market.key());
    const decimal_t pSkew = market.scalars().marketSkew * price / params.skewScaleUSD;
    return util::clamp(pSkew, decimal_t{-1}, decimal_t{1});
}

//-------------------------------------------------------------------------

decimal_t FundingEngine::currentFundingRate(
    const accounting::MarketLedger& market, const decimal_t& price) const
{
    const auto params = m_params->market(market.key());
    return -proportionalSkew(market, price) * params.maxFundingRate;
}

//-------------------------------------------------------------------------

decimal_t FundingEngine::unrecordedFunding(
    const accounting::MarketLedger& market, const decimal_t& price, Timestamp now) const
{
    const Timestamp last = market.scalars().fundingLastRecomputed;
    const Timestamp elapsed = now > last ? now - last : 0;
    if (elapsed == 0) return {};
    return currentFundingRate(market, price) * price * decimal_t{elapsed}
        / decimal_t{SECONDS_PER_DAY};
}

//-------------------------------------------------------------------------

decimal_t FundingEngine::nextFundingEntry(
    const accounting::MarketLedger& market, const decimal_t& price, Timestamp now) const
{
    return market.latestFunding().funding + unrecordedFunding(market, price, now);
}

//-------------------------------------------------------------------------

decimal_t FundingEngine::netFundingPerUnit(
    const accounting::MarketLedger& market,
    FundingIndex fromIndex,
    const decimal_t& price,
    Timestamp now) const
{
    return nextFundingEntry(market, price, now) - market.fundingAt(fromIndex);
}

//-------------------------------------------------------------------------

decimal_t FundingEngine::accruedFunding(
    const accounting::MarketLedger& market,
    const accounting::Position& position,
    const decimal_t& price,
    Timestamp now) const
{
    if (!position.isOpen()) return {};
    return netFundingPerUnit(market, position.lastFundingIndex, price, now) * position.size;
}

//-------------------------------------------------------------------------

FundingRecord FundingEngine::recomputeFunding(
    accounting::MarketLedger& market, const decimal_t& price, Timestamp now) const
{
    const decimal_t rate = currentFundingRate(market, price);
    const decimal_t funding = nextFundingEntry(market, price, now);
    const Timestamp timestamp = std::max(now, market.scalars().fundingLastRecomputed);
    const FundingIndex index = market.appendFunding({.funding = funding, .timestamp = timestamp});
    market.scalars().fundingLastRecomputed = timestamp;
    return {.index = index, .funding = funding, .rate = rate, .timestamp = timestamp};
}

//-------------------------------------------------------------------------

}  // namespace perpx::funding

//-------------------------------------------------------------------------
