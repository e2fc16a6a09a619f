/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "perpx/engine/PerpsEngine.hpp"
#include "perpx/external/InMemoryPriceOracle.hpp"
#include "perpx/external/InMemoryTreasury.hpp"
#include "perpx/external/SuspensionRegistry.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

namespace perpx::test
{

//-------------------------------------------------------------------------

inline const MarketKey kMarket = "pBTC";
inline const AssetKey kAsset = "BTC";
inline constexpr Timestamp kStartTime = 1'700'000'000;

[[nodiscard]] inline market::MarketConfig makeTestMarketConfig(
    const MarketKey& key = kMarket,
    const AssetKey& asset = kAsset,
    market::FeePolicyType feePolicy = market::FeePolicyType::STATIC)
{
    return {
        .key = key,
        .baseAsset = asset,
        .parameters = {
            .baseFee = DEC(0.003),
            .makerFee = DEC(0.001),
            .takerFee = DEC(0.003),
            .maxLeverage = DEC(10),
            .maxSingleSideValueUSD = DEC(100000),
            .maxFundingRate = DEC(0.1),
            .skewScaleUSD = DEC(100000)
        },
        .feePolicy = feePolicy
    };
}

//-------------------------------------------------------------------------

/**
 * One pBTC market with the in-memory collaborators. Every account used by
 * fund() holds a large treasury balance.
 */
struct EngineFixture : ::testing::Test
{
    void SetUp() override
    {
        clock.set(kStartTime);
        engine = std::make_unique<engine::PerpsEngine>(engine::PerpsEngineDesc{
            .globals = {},
            .oracle = &oracle,
            .treasury = &treasury,
            .suspension = &suspension,
            .clock = &clock
        });
        engine->addMarket(makeTestMarketConfig());
        setPrice(DEC(100));
    }

    void setPrice(const decimal_t& price) { oracle.setPrice(kAsset, price); }

    void fund(const AccountId& account, const decimal_t& amount = DEC(1000000))
    {
        treasury.credit(account, amount);
    }

    decimal_t deposit(const AccountId& account, const decimal_t& margin)
    {
        fund(account, margin);
        return engine->transferMargin(kMarket, account, margin);
    }

    [[nodiscard]] const accounting::MarketLedger& market() const
    {
        return engine->ledger().market(kMarket);
    }

    external::ManualClock clock;
    external::InMemoryPriceOracle oracle{{.clock = &clock}};
    external::InMemoryTreasury treasury;
    external::SuspensionRegistry suspension;
    std::unique_ptr<engine::PerpsEngine> engine;
};

//-------------------------------------------------------------------------

[[nodiscard]] inline auto ThrowsEngineError(ErrorCode code)
{
    return ::testing::Throws<EngineError>(::testing::Property(&EngineError::code, code));
}

//-------------------------------------------------------------------------

}  // namespace perpx::test

//-------------------------------------------------------------------------
