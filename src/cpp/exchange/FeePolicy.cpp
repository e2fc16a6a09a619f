/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "perpx/exchange/FeePolicy.hpp"

//-------------------------------------------------------------------------

namespace perpx::exchange
{

//-------------------------------------------------------------------------

decimal_t FeePolicy::feeRate(const TradeDesc& tradeDesc) const
{
    const auto [marketKey, skew, sizeDelta] = tradeDesc;
    const Fees rates = getRates(marketKey);
    if (rates.maker == rates.taker || sizeDelta.isZero()) {
        return rates.taker;
    }

    const decimal_t tradeSize = util::abs(sizeDelta);
    const bool reducesSkew = skew.signum() * sizeDelta.signum() < 0;
    const decimal_t makerSize = reducesSkew ? util::min(tradeSize, util::abs(skew)) : decimal_t{};
    const decimal_t takerSize = tradeSize - makerSize;
    if (takerSize.isZero()) return rates.maker;
    if (makerSize.isZero()) return rates.taker;

    return (rates.maker * makerSize + rates.taker * takerSize) / tradeSize;
}

//-------------------------------------------------------------------------

std::unique_ptr<FeePolicy> FeePolicy::create(
    market::FeePolicyType type, const market::ParameterStore* params)
{
    switch (type) {
        case market::FeePolicyType::STATIC:
            return std::make_unique<StaticFeePolicy>(params);
        case market::FeePolicyType::SKEW:
            return std::make_unique<SkewFeePolicy>(params);
    }
    throw std::invalid_argument{fmt::format(
        "{}: Unknown fee policy type {}",
        std::source_location::current().function_name(),
        std::to_underlying(type))};
}

//-------------------------------------------------------------------------

StaticFeePolicy::StaticFeePolicy(const market::ParameterStore* params) noexcept
    : m_params{params}
{}

//-------------------------------------------------------------------------

Fees StaticFeePolicy::getRates(const MarketKey& marketKey) const
{
    const decimal_t baseFee = m_params->market(marketKey).baseFee;
    return {.maker = baseFee, .taker = baseFee};
}

//-------------------------------------------------------------------------

SkewFeePolicy::SkewFeePolicy(const market::ParameterStore* params) noexcept
    : m_params{params}
{}

//-------------------------------------------------------------------------

Fees SkewFeePolicy::getRates(const MarketKey& marketKey) const
{
    const auto params = m_params->market(marketKey);
    return {.maker = params.makerFee, .taker = params.takerFee};
}

//-------------------------------------------------------------------------

}  // namespace perpx::exchange

//-------------------------------------------------------------------------
