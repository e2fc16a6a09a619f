/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "EngineFixture.hpp"
#include "perpx/engine/LiquidationEngine.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace perpx;
using namespace perpx::engine;
using namespace perpx::test;

using namespace testing;

//-------------------------------------------------------------------------

struct LiquidationTest : EngineFixture
{
    void disableBuffer()
    {
        engine->setGlobalParameters({
            .minKeeperFee = DEC(20),
            .minInitialMargin = DEC(100),
            .liquidationFeeRatio = DEC(0.0035),
            .liquidationBufferRatio = DEC(0)
        });
    }
};

//-------------------------------------------------------------------------

struct LiquidationPriceTestParams
{
    decimal_t size;
    decimal_t refPrice;
    decimal_t safePrice;
};

void PrintTo(const LiquidationPriceTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.size = {}, .refPrice = {}, .safePrice = {}}}",
        params.size,
        params.refPrice,
        params.safePrice);
}

struct LiquidationPriceTest
    : LiquidationTest, WithParamInterface<LiquidationPriceTestParams> {};

TEST_P(LiquidationPriceTest, LiquidatesExactlyAtEstimate)
{
    const auto [size, refPrice, safePrice] = GetParam();
    disableBuffer();
    deposit("alice", DEC(1000));
    static_cast<void>(engine->modifyPosition(kMarket, "alice", size));
    ASSERT_EQ(engine->position(kMarket, "alice").margin, DEC(994));

    const auto estimate = engine->approxLiquidationPriceAndFee(kMarket, "alice");
    EXPECT_FALSE(estimate.priceInvalid);
    EXPECT_EQ(estimate.value.price, refPrice);
    EXPECT_EQ(estimate.value.fee, DEC(20));

    setPrice(safePrice);
    EXPECT_FALSE(engine->canLiquidate(kMarket, "alice"));
    EXPECT_THAT(
        [&] { static_cast<void>(engine->liquidatePosition(kMarket, "alice", "keeper")); },
        ThrowsEngineError(ErrorCode::PositionNotLiquidatable));

    setPrice(refPrice);
    EXPECT_TRUE(engine->canLiquidate(kMarket, "alice"));
    const LiquidationResult result = engine->liquidatePosition(kMarket, "alice", "keeper");
    EXPECT_EQ(result.id, 1);
    EXPECT_EQ(result.size, size);
    EXPECT_EQ(result.liquidatorFee, DEC(20));
    EXPECT_EQ(result.poolFee, decimal_t{});

    const auto position = engine->position(kMarket, "alice");
    EXPECT_EQ(position.id, 1);
    EXPECT_EQ(position.margin, decimal_t{});
    EXPECT_EQ(position.size, decimal_t{});
    EXPECT_EQ(market().scalars().marketSkew, decimal_t{});
    EXPECT_EQ(market().scalars().marketSize, decimal_t{});
    EXPECT_EQ(treasury.balanceOf("keeper"), DEC(20));
}

INSTANTIATE_TEST_SUITE_P(
    LiquidationTests,
    LiquidationPriceTest,
    Values(
        LiquidationPriceTestParams{
            .size = DEC(20), .refPrice = DEC(51.3), .safePrice = DEC(51.31)
        },
        LiquidationPriceTestParams{
            .size = DEC(-20), .refPrice = DEC(148.7), .safePrice = DEC(148.69)
        }
    ));

//-------------------------------------------------------------------------

TEST_F(LiquidationTest, EstimateWithBufferAndMinimumMargin)
{
    setPrice(DEC(10));
    deposit("alice", DEC(100));
    static_cast<void>(engine->modifyPosition(kMarket, "alice", DEC(10)));
    ASSERT_EQ(engine->position(kMarket, "alice").margin, DEC(99.7));

    const auto estimate = engine->approxLiquidationPriceAndFee(kMarket, "alice").value;
    EXPECT_EQ(estimate.price, DEC(2.055));
    EXPECT_EQ(estimate.fee, DEC(20));
    EXPECT_EQ(engine->liquidationMargin(kMarket, "alice").value, DEC(20.25));
}

TEST_F(LiquidationTest, EstimateAccountsForFunding)
{
    disableBuffer();
    deposit("alice", DEC(1000));
    static_cast<void>(engine->modifyPosition(kMarket, "alice", DEC(20)));

    clock.advance(SECONDS_PER_DAY);
    // Rate -0.002 at skew 20, so -0.2 per unit accrued.
    const auto estimate = engine->approxLiquidationPriceAndFee(kMarket, "alice").value;
    EXPECT_EQ(estimate.price, DEC(51.5));
}

TEST_F(LiquidationTest, EmptyPositionEstimateIsZero)
{
    deposit("alice", DEC(1000));
    const auto estimate = engine->approxLiquidationPriceAndFee(kMarket, "alice").value;
    EXPECT_EQ(estimate.price, decimal_t{});
    EXPECT_EQ(estimate.fee, decimal_t{});

    EXPECT_FALSE(engine->canLiquidate(kMarket, "alice"));
    EXPECT_THAT(
        [&] { static_cast<void>(engine->liquidationMargin(kMarket, "alice")); },
        ThrowsEngineError(ErrorCode::ZeroSizePosition));
}

TEST_F(LiquidationTest, EstimateFloorsAtZero)
{
    deposit("alice", DEC(1000));
    static_cast<void>(engine->modifyPosition(kMarket, "alice", DEC(1)));
    EXPECT_EQ(engine->approxLiquidationPriceAndFee(kMarket, "alice").value.price, decimal_t{});
}

//-------------------------------------------------------------------------

TEST_F(LiquidationTest, SurplusGoesToFeePool)
{
    deposit("alice", DEC(2000));
    static_cast<void>(engine->modifyPosition(kMarket, "alice", DEC(100)));
    setPrice(DEC(80.7));
    // Remaining 40, liquidation margin 0.6 * 80.7.
    ASSERT_TRUE(engine->canLiquidate(kMarket, "alice"));

    const auto poolBefore = treasury.balanceOf(treasury.feePoolAccount());
    const auto result = engine->liquidatePosition(kMarket, "alice", "keeper");
    EXPECT_EQ(result.liquidatorFee, DEC(28.245));
    EXPECT_EQ(result.poolFee, DEC(11.755));
    EXPECT_EQ(treasury.balanceOf("keeper"), DEC(28.245));
    EXPECT_EQ(treasury.balanceOf(treasury.feePoolAccount()) - poolBefore, DEC(11.755));
}

TEST_F(LiquidationTest, UnderwaterPositionPaysNothing)
{
    deposit("alice", DEC(1000));
    static_cast<void>(engine->modifyPosition(kMarket, "alice", DEC(20)));
    setPrice(DEC(10));

    const auto result = engine->liquidatePosition(kMarket, "alice", "keeper");
    EXPECT_EQ(result.liquidatorFee, decimal_t{});
    EXPECT_EQ(result.poolFee, decimal_t{});
    EXPECT_EQ(treasury.balanceOf("keeper"), decimal_t{});
    EXPECT_EQ(engine->marketSummary(kMarket).marketDebt, decimal_t{});
}

TEST_F(LiquidationTest, LockedMarginIsCleared)
{
    deposit("alice", DEC(1000));
    engine->modifyLockedMargin(kMarket, "alice", DEC(100), DEC(0));
    static_cast<void>(engine->modifyPosition(kMarket, "alice", DEC(20)));
    setPrice(DEC(51));

    static_cast<void>(engine->liquidatePosition(kMarket, "alice", "keeper"));
    EXPECT_EQ(engine->position(kMarket, "alice").lockedMargin, decimal_t{});

    deposit("alice", DEC(500));
    EXPECT_EQ(engine->position(kMarket, "alice").id, 1);
    EXPECT_EQ(engine->position(kMarket, "alice").margin, DEC(500));
}

TEST_F(LiquidationTest, RejectionOrder)
{
    deposit("alice", DEC(1000));
    EXPECT_THAT(
        [&] { static_cast<void>(engine->liquidatePosition(kMarket, "alice", "keeper")); },
        ThrowsEngineError(ErrorCode::ZeroSizePosition));
    EXPECT_THAT(
        [&] { static_cast<void>(engine->liquidatePosition(kMarket, "nobody", "keeper")); },
        ThrowsEngineError(ErrorCode::ZeroSizePosition));

    static_cast<void>(engine->modifyPosition(kMarket, "alice", DEC(20)));
    EXPECT_THAT(
        [&] { static_cast<void>(engine->liquidatePosition(kMarket, "alice", "alice")); },
        ThrowsEngineError(ErrorCode::NotPermitted));
    EXPECT_THAT(
        [&] { static_cast<void>(engine->liquidatePosition(kMarket, "alice", "keeper")); },
        ThrowsEngineError(ErrorCode::PositionNotLiquidatable));
    EXPECT_FALSE(market().hasPosition("nobody"));
}

TEST_F(LiquidationTest, EventsInOrder)
{
    std::vector<std::string> emitted;
    engine->signals().positionModified.connect([&](const PositionModifiedEvent& event) {
        emitted.push_back(fmt::format("modified #{} size {}", event.id, event.size));
    });
    engine->signals().positionLiquidated.connect([&](const PositionLiquidatedEvent& event) {
        emitted.push_back(fmt::format(
            "liquidated #{} size {} by {}", event.id, event.size, event.liquidator));
    });

    deposit("alice", DEC(1000));
    static_cast<void>(engine->modifyPosition(kMarket, "alice", DEC(20)));
    setPrice(DEC(51));
    emitted.clear();

    static_cast<void>(engine->liquidatePosition(kMarket, "alice", "keeper"));
    EXPECT_THAT(
        emitted,
        ElementsAre("modified #1 size 0", "liquidated #1 size 20 by keeper"));
}

//-------------------------------------------------------------------------

TEST(LiquidationMarginTests, MonotonicInSize)
{
    market::ParameterStore params;
    params.addMarket("pBTC", {});
    funding::FundingEngine funding{&params};
    PositionValuation valuation{&funding};
    external::InMemoryTreasury treasury;
    LiquidationEngine liquidation{&params, &valuation, &treasury};

    const decimal_t price = DEC(100);
    decimal_t previous{};
    for (const auto& size : {DEC(0.1), DEC(1), DEC(10), DEC(57), DEC(58), DEC(1000)}) {
        const decimal_t liqMargin = liquidation.liquidationMargin(size, price);
        EXPECT_GE(liqMargin, previous) << "size " << size;
        EXPECT_EQ(liquidation.liquidationMargin(-size, price), liqMargin);
        previous = liqMargin;
    }
    EXPECT_EQ(liquidation.liquidationMargin(DEC(1), price), DEC(20.25));
    EXPECT_EQ(liquidation.liquidationMargin(DEC(100), price), DEC(60));
    EXPECT_THAT(
        [&] { static_cast<void>(liquidation.liquidationMargin(DEC(0), price)); },
        ThrowsEngineError(ErrorCode::ZeroSizePosition));
}

//-------------------------------------------------------------------------
