/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace perpx::market
{

//-------------------------------------------------------------------------

struct MarketParameters
{
    decimal_t baseFee = DEC(0.003);
    decimal_t makerFee = DEC(0.003);
    decimal_t takerFee = DEC(0.003);
    decimal_t maxLeverage = DEC(10);
    decimal_t maxSingleSideValueUSD = DEC(100000);
    // Per day.
    decimal_t maxFundingRate = DEC(0.1);
    decimal_t skewScaleUSD = DEC(100000);

    [[nodiscard]] bool fundingDiffers(const MarketParameters& other) const noexcept
    {
        return maxFundingRate != other.maxFundingRate || skewScaleUSD != other.skewScaleUSD;
    }

    [[nodiscard]] static MarketParameters fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

struct GlobalParameters
{
    decimal_t minKeeperFee = DEC(20);
    decimal_t minInitialMargin = DEC(100);
    decimal_t liquidationFeeRatio = DEC(0.0035);
    decimal_t liquidationBufferRatio = DEC(0.0025);

    [[nodiscard]] static GlobalParameters fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

enum class FeePolicyType : uint32_t
{
    STATIC,
    SKEW
};

struct MarketConfig
{
    MarketKey key;
    AssetKey baseAsset;
    MarketParameters parameters;
    FeePolicyType feePolicy = FeePolicyType::STATIC;
};

[[nodiscard]] MarketConfig makeMarketConfig(pugi::xml_node node);

//-------------------------------------------------------------------------

struct PerpsConfig
{
    GlobalParameters globals;
    std::vector<MarketConfig> markets;

    [[nodiscard]] static PerpsConfig fromXML(pugi::xml_node node);
    [[nodiscard]] static PerpsConfig fromFile(const fs::path& path);
};

//-------------------------------------------------------------------------

void validateMarketParameters(const MarketParameters& params);
void validateGlobalParameters(const GlobalParameters& params);

//-------------------------------------------------------------------------

}  // namespace perpx::market

//-------------------------------------------------------------------------
