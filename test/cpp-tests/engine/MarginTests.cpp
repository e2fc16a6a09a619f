/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "EngineFixture.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace perpx;
using namespace perpx::engine;
using namespace perpx::test;

using namespace testing;

//-------------------------------------------------------------------------

struct MarginTest : EngineFixture
{
    void SetUp() override
    {
        EngineFixture::SetUp();
        engine->signals().marginModified.connect([this](const MarginModifiedEvent& event) {
            marginEvents.push_back(event);
        });
        engine->signals().positionModified.connect([this](const PositionModifiedEvent& event) {
            positionEvents.push_back(event);
        });
        engine->signals().fundingRecomputed.connect([this](const FundingRecomputedEvent&) {
            ++fundingEvents;
        });
    }

    std::vector<MarginModifiedEvent> marginEvents;
    std::vector<PositionModifiedEvent> positionEvents;
    int fundingEvents{};
};

//-------------------------------------------------------------------------

TEST_F(MarginTest, DepositCreatesPosition)
{
    fund("alice", DEC(1000));
    EXPECT_EQ(engine->transferMargin(kMarket, "alice", DEC(1000)), DEC(1000));

    const auto position = engine->position(kMarket, "alice");
    EXPECT_EQ(position.id, 1);
    EXPECT_EQ(position.margin, DEC(1000));
    EXPECT_FALSE(position.isOpen());
    EXPECT_EQ(treasury.balanceOf("alice"), decimal_t{});

    ASSERT_EQ(marginEvents.size(), 1);
    EXPECT_EQ(marginEvents[0].marginDelta, DEC(1000));
    EXPECT_EQ(marginEvents[0].transferAmount, DEC(1000));
    ASSERT_EQ(positionEvents.size(), 1);
    EXPECT_EQ(positionEvents[0].id, 1);
    EXPECT_EQ(positionEvents[0].margin, DEC(1000));
    EXPECT_EQ(positionEvents[0].tradeSize, decimal_t{});
}

TEST_F(MarginTest, WithdrawalIssuesToAccount)
{
    deposit("alice", DEC(1000));
    marginEvents.clear();

    EXPECT_EQ(engine->transferMargin(kMarket, "alice", DEC(-200)), DEC(-200));
    EXPECT_EQ(engine->position(kMarket, "alice").margin, DEC(800));
    EXPECT_EQ(treasury.balanceOf("alice"), DEC(200));

    ASSERT_EQ(marginEvents.size(), 1);
    EXPECT_EQ(marginEvents[0].marginDelta, DEC(-200));
    EXPECT_EQ(marginEvents[0].transferAmount, DEC(-200));
}

TEST_F(MarginTest, OverdrawThrows)
{
    deposit("alice", DEC(1000));
    EXPECT_THAT(
        [&] { static_cast<void>(engine->transferMargin(kMarket, "alice", DEC(-1000.01))); },
        ThrowsEngineError(ErrorCode::InsufficientMargin));
    EXPECT_THAT(
        [&] { static_cast<void>(engine->transferMargin(kMarket, "bob", DEC(-1))); },
        ThrowsEngineError(ErrorCode::InsufficientMargin));
    EXPECT_FALSE(market().hasPosition("bob"));
    EXPECT_EQ(engine->position(kMarket, "alice").margin, DEC(1000));
}

TEST_F(MarginTest, UnfundedDepositThrows)
{
    const auto fundingLength = market().fundingSequence().size();
    EXPECT_THAT(
        [&] { static_cast<void>(engine->transferMargin(kMarket, "alice", DEC(1))); },
        ThrowsEngineError(ErrorCode::InsufficientBalance));
    EXPECT_FALSE(market().hasPosition("alice"));
    EXPECT_EQ(market().scalars().lastPositionId, 0);
    EXPECT_EQ(market().fundingSequence().size(), fundingLength);
    EXPECT_EQ(fundingEvents, 0);
}

TEST_F(MarginTest, ZeroTransferOnlyRecomputesFunding)
{
    const auto fundingLength = market().fundingSequence().size();
    EXPECT_EQ(engine->transferMargin(kMarket, "alice", DEC(0)), decimal_t{});

    EXPECT_FALSE(market().hasPosition("alice"));
    EXPECT_EQ(market().scalars().lastPositionId, 0);
    EXPECT_EQ(market().fundingSequence().size(), fundingLength + 1);
    EXPECT_TRUE(marginEvents.empty());
    EXPECT_TRUE(positionEvents.empty());
    EXPECT_EQ(fundingEvents, 1);
}

TEST_F(MarginTest, ReclamationReducesCreditedMargin)
{
    fund("alice", DEC(1000));
    treasury.setReclamation("alice", DEC(10));

    EXPECT_EQ(engine->transferMargin(kMarket, "alice", DEC(1000)), DEC(990));
    EXPECT_EQ(engine->position(kMarket, "alice").margin, DEC(990));
    ASSERT_EQ(marginEvents.size(), 1);
    EXPECT_EQ(marginEvents[0].transferAmount, DEC(990));
    EXPECT_EQ(marginEvents[0].marginDelta, DEC(990));
}

TEST_F(MarginTest, DepositCannotLeaveNegativeMargin)
{
    deposit("alice", DEC(1000));
    static_cast<void>(engine->modifyPosition(kMarket, "alice", DEC(20)));
    setPrice(DEC(40));
    // 994 + 20 * (40 - 100)
    ASSERT_EQ(engine->positionSummary(kMarket, "alice").remainingMargin, DEC(-206));

    fund("alice", DEC(300));
    EXPECT_THAT(
        [&] { static_cast<void>(engine->transferMargin(kMarket, "alice", DEC(100))); },
        ThrowsEngineError(ErrorCode::InsufficientMargin));
    EXPECT_EQ(treasury.balanceOf("alice"), DEC(300));

    EXPECT_EQ(engine->transferMargin(kMarket, "alice", DEC(300)), DEC(300));
    const auto position = engine->position(kMarket, "alice");
    EXPECT_EQ(position.margin, DEC(94));
    EXPECT_EQ(position.lastPrice, DEC(40));
    EXPECT_EQ(position.size, DEC(20));
}

//-------------------------------------------------------------------------

TEST_F(MarginTest, AccessibleMarginReservesInitialMargin)
{
    deposit("alice", DEC(1000));
    EXPECT_EQ(engine->accessibleMargin(kMarket, "alice").value, DEC(1000));

    static_cast<void>(engine->modifyPosition(kMarket, "alice", DEC(1)));
    // max(100 / 9.999, 100) + 0.001
    EXPECT_EQ(engine->accessibleMargin(kMarket, "alice").value, DEC(899.699));
    EXPECT_EQ(engine->positionSummary(kMarket, "alice").accessibleMargin, DEC(899.699));
}

TEST_F(MarginTest, WithdrawUpToAccessibleMargin)
{
    deposit("alice", DEC(1000));
    static_cast<void>(engine->modifyPosition(kMarket, "alice", DEC(20)));
    const decimal_t accessible = engine->accessibleMargin(kMarket, "alice").value;
    ASSERT_GT(accessible, DEC(793));
    ASSERT_LT(accessible, DEC(794));

    EXPECT_THAT(
        [&] {
            static_cast<void>(engine->transferMargin(
                kMarket, "alice", -(accessible + DEC(0.000000000000000001))));
        },
        ThrowsEngineError(ErrorCode::InsufficientMargin));
    EXPECT_EQ(engine->transferMargin(kMarket, "alice", -accessible), -accessible);
    EXPECT_EQ(engine->position(kMarket, "alice").margin, DEC(994) - accessible);
    EXPECT_EQ(engine->accessibleMargin(kMarket, "alice").value, decimal_t{});
}

TEST_F(MarginTest, WithdrawAllMargin)
{
    deposit("alice", DEC(1000));
    static_cast<void>(engine->modifyPosition(kMarket, "alice", DEC(1)));

    EXPECT_EQ(engine->withdrawAllMargin(kMarket, "alice"), DEC(899.699));
    EXPECT_EQ(engine->position(kMarket, "alice").margin, DEC(100.001));
    EXPECT_EQ(treasury.balanceOf("alice"), DEC(899.699));

    marginEvents.clear();
    EXPECT_EQ(engine->withdrawAllMargin(kMarket, "alice"), decimal_t{});
    EXPECT_TRUE(marginEvents.empty());
}

TEST_F(MarginTest, WithdrawAllWithoutPosition)
{
    deposit("alice", DEC(1000));
    EXPECT_EQ(engine->withdrawAllMargin(kMarket, "alice"), DEC(1000));
    EXPECT_EQ(engine->position(kMarket, "alice").margin, decimal_t{});
    EXPECT_EQ(engine->position(kMarket, "alice").id, 1);
}

TEST_F(MarginTest, AccessibleMarginStaysAboveLiquidationMargin)
{
    auto params = engine->parameters().market(kMarket);
    params.maxLeverage = DEC(200);
    params.maxSingleSideValueUSD = DEC(1000000);
    engine->setMarketParameters(kMarket, params);

    deposit("alice", DEC(10000));
    static_cast<void>(engine->modifyPosition(kMarket, "alice", DEC(1000)));
    ASSERT_EQ(engine->position(kMarket, "alice").margin, DEC(9700));
    // max(100000 / 199.999, 100, max(20, 350) + 250) + 0.001
    EXPECT_EQ(engine->accessibleMargin(kMarket, "alice").value, DEC(9099.999));

    EXPECT_EQ(engine->withdrawAllMargin(kMarket, "alice"), DEC(9099.999));
    EXPECT_EQ(engine->position(kMarket, "alice").margin, DEC(600.001));
    EXPECT_FALSE(engine->canLiquidate(kMarket, "alice"));
    EXPECT_EQ(engine->liquidationMargin(kMarket, "alice").value, DEC(600));
}

//-------------------------------------------------------------------------

TEST_F(MarginTest, LockedMarginIsInaccessible)
{
    deposit("alice", DEC(1000));
    marginEvents.clear();

    engine->modifyLockedMargin(kMarket, "alice", DEC(300), DEC(0));
    EXPECT_EQ(engine->position(kMarket, "alice").lockedMargin, DEC(300));
    EXPECT_EQ(engine->accessibleMargin(kMarket, "alice").value, DEC(700));
    ASSERT_EQ(marginEvents.size(), 1);
    EXPECT_EQ(marginEvents[0].lockedMarginDelta, DEC(300));
    EXPECT_EQ(marginEvents[0].marginDelta, decimal_t{});
    EXPECT_EQ(positionEvents.size(), 1);

    engine->modifyLockedMargin(kMarket, "alice", DEC(-100), DEC(0));
    EXPECT_EQ(engine->position(kMarket, "alice").lockedMargin, DEC(200));
}

TEST_F(MarginTest, BurnGoesToFeePool)
{
    deposit("alice", DEC(1000));
    marginEvents.clear();

    engine->modifyLockedMargin(kMarket, "alice", DEC(0), DEC(50));
    EXPECT_EQ(engine->position(kMarket, "alice").margin, DEC(950));
    EXPECT_EQ(treasury.balanceOf(treasury.feePoolAccount()), DEC(50));
    ASSERT_EQ(marginEvents.size(), 1);
    EXPECT_EQ(marginEvents[0].burnAmount, DEC(50));
    EXPECT_EQ(marginEvents[0].marginDelta, DEC(-50));
    EXPECT_EQ(marginEvents[0].transferAmount, decimal_t{});
}

TEST_F(MarginTest, LockedMarginRejections)
{
    deposit("alice", DEC(1000));
    engine->modifyLockedMargin(kMarket, "alice", DEC(300), DEC(0));

    EXPECT_THAT(
        [&] { engine->modifyLockedMargin(kMarket, "alice", DEC(0), DEC(-1)); },
        ThrowsEngineError(ErrorCode::InvalidParameter));
    EXPECT_THAT(
        [&] { engine->modifyLockedMargin(kMarket, "alice", DEC(-301), DEC(0)); },
        ThrowsEngineError(ErrorCode::InsufficientMargin));
    EXPECT_THAT(
        [&] { engine->modifyLockedMargin(kMarket, "alice", DEC(701), DEC(0)); },
        ThrowsEngineError(ErrorCode::InsufficientMargin));
    EXPECT_THAT(
        [&] { engine->modifyLockedMargin(kMarket, "alice", DEC(0), DEC(701)); },
        ThrowsEngineError(ErrorCode::InsufficientMargin));

    const auto position = engine->position(kMarket, "alice");
    EXPECT_EQ(position.margin, DEC(1000));
    EXPECT_EQ(position.lockedMargin, DEC(300));
}

TEST_F(MarginTest, BurnCannotMakePositionLiquidatable)
{
    deposit("alice", DEC(1000));
    static_cast<void>(engine->modifyPosition(kMarket, "alice", DEC(20)));
    setPrice(DEC(60));
    // Remaining 194, liquidation margin max(20, 4.2) + 3.
    EXPECT_THAT(
        [&] { engine->modifyLockedMargin(kMarket, "alice", DEC(0), DEC(171)); },
        ThrowsEngineError(ErrorCode::CanLiquidate));

    engine->modifyLockedMargin(kMarket, "alice", DEC(0), DEC(170));
    EXPECT_EQ(engine->position(kMarket, "alice").margin, DEC(24));
    EXPECT_FALSE(engine->canLiquidate(kMarket, "alice"));
}

TEST_F(MarginTest, ZeroLockedMarginChangeIsNoOp)
{
    deposit("alice", DEC(1000));
    marginEvents.clear();
    positionEvents.clear();

    engine->modifyLockedMargin(kMarket, "alice", DEC(0), DEC(0));
    EXPECT_TRUE(marginEvents.empty());
    EXPECT_TRUE(positionEvents.empty());
}

//-------------------------------------------------------------------------
