/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "perpx/market/MarketParameters.hpp"

#include "EngineError.hpp"
#include "xml_util.hpp"

//-------------------------------------------------------------------------

namespace perpx::market
{

//-------------------------------------------------------------------------

using util::getAttr;
using util::getDecimalAttr;
using util::getDecimalAttrOr;

namespace
{

void checkNonNegative(const decimal_t& val, std::string_view name)
{
    if (val.signum() < 0) {
        throw EngineError{
            ErrorCode::InvalidParameter, fmt::format("'{}' cannot be negative, got {}", name, val)};
    }
}

}  // namespace

//-------------------------------------------------------------------------

MarketParameters MarketParameters::fromXML(pugi::xml_node node)
{
    const decimal_t baseFee = getDecimalAttr(node, "baseFee");
    MarketParameters params{
        .baseFee = baseFee,
        .makerFee = getDecimalAttrOr(node, "makerFee", baseFee),
        .takerFee = getDecimalAttrOr(node, "takerFee", baseFee),
        .maxLeverage = getDecimalAttr(node, "maxLeverage"),
        .maxSingleSideValueUSD = getDecimalAttr(node, "maxSingleSideValueUSD"),
        .maxFundingRate = getDecimalAttr(node, "maxFundingRate"),
        .skewScaleUSD = getDecimalAttr(node, "skewScaleUSD")
    };
    validateMarketParameters(params);
    return params;
}

//-------------------------------------------------------------------------

GlobalParameters GlobalParameters::fromXML(pugi::xml_node node)
{
    GlobalParameters params{
        .minKeeperFee = getDecimalAttr(node, "minKeeperFee"),
        .minInitialMargin = getDecimalAttr(node, "minInitialMargin"),
        .liquidationFeeRatio = getDecimalAttr(node, "liquidationFeeRatio"),
        .liquidationBufferRatio = getDecimalAttr(node, "liquidationBufferRatio")
    };
    validateGlobalParameters(params);
    return params;
}

//-------------------------------------------------------------------------

MarketConfig makeMarketConfig(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const std::string_view feePolicy = node.attribute("feePolicy").as_string("static");
    return {
        .key = getAttr(node, "key").as_string(),
        .baseAsset = getAttr(node, "baseAsset").as_string(),
        .parameters = MarketParameters::fromXML(node),
        .feePolicy = [&] {
            if (feePolicy == "static") return FeePolicyType::STATIC;
            if (feePolicy == "skew") return FeePolicyType::SKEW;
            throw std::invalid_argument{fmt::format(
                "{}: Unknown fee policy '{}', expected 'static' or 'skew'", ctx, feePolicy)};
        }()
    };
}

//-------------------------------------------------------------------------

PerpsConfig PerpsConfig::fromXML(pugi::xml_node node)
{
    PerpsConfig config{.globals = GlobalParameters::fromXML(node), .markets = {}};
    for (pugi::xml_node marketNode : node.child("Markets").children("Market")) {
        config.markets.push_back(makeMarketConfig(marketNode));
    }
    return config;
}

//-------------------------------------------------------------------------

PerpsConfig PerpsConfig::fromFile(const fs::path& path)
{
    const util::XmlFile file = util::loadXML(path, "Perps");
    return fromXML(file.root);
}

//-------------------------------------------------------------------------

void validateMarketParameters(const MarketParameters& params)
{
    checkNonNegative(params.baseFee, "baseFee");
    checkNonNegative(params.makerFee, "makerFee");
    checkNonNegative(params.takerFee, "takerFee");
    checkNonNegative(params.maxSingleSideValueUSD, "maxSingleSideValueUSD");
    checkNonNegative(params.maxFundingRate, "maxFundingRate");
    if (params.maxLeverage.signum() <= 0) {
        throw EngineError{
            ErrorCode::InvalidParameter,
            fmt::format("'maxLeverage' must be positive, got {}", params.maxLeverage)};
    }
    if (params.skewScaleUSD.signum() <= 0) {
        throw EngineError{
            ErrorCode::InvalidParameter,
            fmt::format("'skewScaleUSD' must be positive, got {}", params.skewScaleUSD)};
    }
}

//-------------------------------------------------------------------------

void validateGlobalParameters(const GlobalParameters& params)
{
    checkNonNegative(params.minKeeperFee, "minKeeperFee");
    checkNonNegative(params.liquidationFeeRatio, "liquidationFeeRatio");
    checkNonNegative(params.liquidationBufferRatio, "liquidationBufferRatio");
    if (params.minInitialMargin < params.minKeeperFee) {
        throw EngineError{
            ErrorCode::MarginBelowKeeperFee,
            fmt::format(
                "'minInitialMargin' {} is below 'minKeeperFee' {}",
                params.minInitialMargin,
                params.minKeeperFee)};
    }
}

//-------------------------------------------------------------------------

}  // namespace perpx::market

//-------------------------------------------------------------------------
