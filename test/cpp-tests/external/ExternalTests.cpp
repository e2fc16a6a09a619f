/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "perpx/external/InMemoryPriceOracle.hpp"
#include "perpx/external/InMemoryTreasury.hpp"
#include "perpx/external/SuspensionRegistry.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace perpx;
using namespace perpx::external;

using namespace testing;

//-------------------------------------------------------------------------

TEST(InMemoryPriceOracleTests, UnknownAssetIsInvalid)
{
    InMemoryPriceOracle oracle;
    EXPECT_TRUE(oracle.currentPrice("BTC").invalid);
}

TEST(InMemoryPriceOracleTests, RoundsIncrementAndFlagResets)
{
    InMemoryPriceOracle oracle;
    EXPECT_EQ(oracle.setPrice("BTC", DEC(100)), 1);
    oracle.setInvalid("BTC", true);
    EXPECT_TRUE(oracle.currentPrice("BTC").invalid);

    EXPECT_EQ(oracle.setPrice("BTC", DEC(101)), 2);
    const PriceReading reading = oracle.currentPrice("BTC");
    EXPECT_FALSE(reading.invalid);
    EXPECT_EQ(reading.price, DEC(101));
    EXPECT_EQ(reading.roundId, 2);
}

TEST(InMemoryPriceOracleTests, NonPositivePriceIsInvalid)
{
    InMemoryPriceOracle oracle;
    static_cast<void>(oracle.setPrice("BTC", DEC(0)));
    EXPECT_TRUE(oracle.currentPrice("BTC").invalid);
    static_cast<void>(oracle.setPrice("BTC", DEC(-1)));
    EXPECT_TRUE(oracle.currentPrice("BTC").invalid);
}

TEST(InMemoryPriceOracleTests, StalePriceIsInvalid)
{
    ManualClock clock{1000};
    InMemoryPriceOracle oracle{{.clock = &clock, .staleAfter = 60}};
    static_cast<void>(oracle.setPrice("BTC", DEC(100)));

    clock.advance(60);
    EXPECT_FALSE(oracle.currentPrice("BTC").invalid);
    clock.advance(1);
    EXPECT_TRUE(oracle.currentPrice("BTC").invalid);

    static_cast<void>(oracle.setPrice("BTC", DEC(100)));
    EXPECT_FALSE(oracle.currentPrice("BTC").invalid);
}

TEST(InMemoryPriceOracleTests, StalenessRequiresClock)
{
    EXPECT_THROW(InMemoryPriceOracle({.clock = nullptr, .staleAfter = 60}), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(InMemoryTreasuryTests, BurnAndIssue)
{
    InMemoryTreasury treasury;
    treasury.credit("alice", DEC(1000));

    EXPECT_EQ(treasury.burn("alice", DEC(400)), DEC(400));
    treasury.issue("alice", DEC(50));
    treasury.issue(treasury.feePoolAccount(), DEC(15));

    EXPECT_EQ(treasury.balanceOf("alice"), DEC(650));
    EXPECT_EQ(treasury.balanceOf("FEE_POOL"), DEC(15));
    EXPECT_EQ(treasury.totalBurned(), DEC(400));
    EXPECT_EQ(treasury.totalIssued(), DEC(65));
}

TEST(InMemoryTreasuryTests, OverdraftThrows)
{
    InMemoryTreasury treasury;
    treasury.credit("alice", DEC(10));
    EXPECT_THAT(
        [&] { static_cast<void>(treasury.burn("alice", DEC(10.5))); },
        Throws<EngineError>(Property(&EngineError::code, ErrorCode::InsufficientBalance)));
    EXPECT_EQ(treasury.balanceOf("alice"), DEC(10));
}

TEST(InMemoryTreasuryTests, ReclamationAppliesOnce)
{
    InMemoryTreasury treasury;
    treasury.credit("alice", DEC(2000));
    treasury.setReclamation("alice", DEC(10));

    EXPECT_EQ(treasury.burn("alice", DEC(1000)), DEC(990));
    EXPECT_EQ(treasury.burn("alice", DEC(1000)), DEC(1000));
    EXPECT_EQ(treasury.balanceOf("alice"), DEC(0));
}

TEST(InMemoryTreasuryTests, ReclamationCappedAtAmount)
{
    InMemoryTreasury treasury;
    treasury.credit("alice", DEC(5));
    treasury.setReclamation("alice", DEC(10));
    EXPECT_EQ(treasury.burn("alice", DEC(5)), DEC(0));
}

//-------------------------------------------------------------------------

TEST(SuspensionRegistryTests, SuspendAndResume)
{
    SuspensionRegistry registry;
    EXPECT_FALSE(registry.isSystemSuspended());
    EXPECT_FALSE(registry.isMarketSuspended("pBTC"));

    registry.suspendMarket("pBTC");
    EXPECT_TRUE(registry.isMarketSuspended("pBTC"));
    EXPECT_FALSE(registry.isMarketSuspended("pETH"));

    registry.suspendSystem();
    EXPECT_TRUE(registry.isSystemSuspended());

    registry.resumeMarket("pBTC");
    registry.resumeSystem();
    EXPECT_FALSE(registry.isSystemSuspended());
    EXPECT_FALSE(registry.isMarketSuspended("pBTC"));
}

//-------------------------------------------------------------------------
