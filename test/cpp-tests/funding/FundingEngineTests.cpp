/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "perpx/funding/FundingEngine.hpp"
#include "formatting.hpp"

#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace perpx;
using namespace perpx::accounting;
using namespace perpx::funding;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

constexpr Timestamp kGenesis = 1000;

}  // namespace

//-------------------------------------------------------------------------

struct FundingEngineTest : Test
{
    void SetUp() override
    {
        params.addMarket("pBTC", {});
    }

    void setSkew(const decimal_t& skew)
    {
        ledger.scalars().marketSkew = skew;
        ledger.scalars().marketSize = util::abs(skew);
    }

    market::ParameterStore params;
    MarketLedger ledger{"pBTC", "BTC", kGenesis};
    FundingEngine funding{&params};
};

//-------------------------------------------------------------------------

TEST_F(FundingEngineTest, RateOpposesSkew)
{
    setSkew(DEC(24));
    EXPECT_EQ(funding.proportionalSkew(ledger, DEC(250)), DEC(0.06));
    EXPECT_EQ(funding.currentFundingRate(ledger, DEC(250)), DEC(-0.006));

    setSkew(DEC(-24));
    EXPECT_EQ(funding.currentFundingRate(ledger, DEC(250)), DEC(0.006));
}

TEST_F(FundingEngineTest, RateClampsAtMax)
{
    setSkew(DEC(5000));
    EXPECT_EQ(funding.proportionalSkew(ledger, DEC(100)), DEC(1));
    EXPECT_EQ(funding.currentFundingRate(ledger, DEC(100)), DEC(-0.1));

    setSkew(DEC(-5000));
    EXPECT_EQ(funding.currentFundingRate(ledger, DEC(100)), DEC(0.1));
}

//-------------------------------------------------------------------------

struct ZeroSkewTest : TestWithParam<decimal_t>
{
    market::ParameterStore params;
    MarketLedger ledger{"pBTC", "BTC", kGenesis};
    FundingEngine funding{&params};
};

TEST_P(ZeroSkewTest, RateIsZero)
{
    params.addMarket("pBTC", {});
    EXPECT_EQ(funding.currentFundingRate(ledger, GetParam()), decimal_t{});
    EXPECT_EQ(funding.unrecordedFunding(ledger, GetParam(), kGenesis + 86400), decimal_t{});
}

INSTANTIATE_TEST_SUITE_P(
    FundingEngineTests,
    ZeroSkewTest,
    Values(DEC(0.01), DEC(1), DEC(250), DEC(68392.581)));

//-------------------------------------------------------------------------

TEST_F(FundingEngineTest, UnrecordedFundingAccruesLinearly)
{
    setSkew(DEC(24));
    EXPECT_EQ(funding.unrecordedFunding(ledger, DEC(250), kGenesis), decimal_t{});
    EXPECT_EQ(funding.unrecordedFunding(ledger, DEC(250), kGenesis + 43200), DEC(-0.75));
    EXPECT_EQ(funding.unrecordedFunding(ledger, DEC(250), kGenesis + 86400), DEC(-1.5));
    // Clock behind the last recompute.
    EXPECT_EQ(funding.unrecordedFunding(ledger, DEC(250), kGenesis - 10), decimal_t{});
}

TEST_F(FundingEngineTest, RecomputeAppendsEntry)
{
    setSkew(DEC(24));
    const FundingRecord record = funding.recomputeFunding(ledger, DEC(250), kGenesis + 86400);

    EXPECT_EQ(record.index, 1);
    EXPECT_EQ(record.funding, DEC(-1.5));
    EXPECT_EQ(record.rate, DEC(-0.006));
    EXPECT_EQ(record.timestamp, kGenesis + 86400);
    EXPECT_EQ(ledger.latestFunding().funding, DEC(-1.5));
    EXPECT_EQ(ledger.scalars().fundingLastRecomputed, kGenesis + 86400);
    EXPECT_EQ(funding.unrecordedFunding(ledger, DEC(250), kGenesis + 86400), decimal_t{});
}

TEST_F(FundingEngineTest, RecomputeIsIdempotentAtSameTime)
{
    setSkew(DEC(24));
    const Position position{.lastFundingIndex = 0, .margin = DEC(982), .lastPrice = DEC(250), .size = DEC(24)};
    const Timestamp now = kGenesis + 86400;

    static_cast<void>(funding.recomputeFunding(ledger, DEC(250), now));
    const decimal_t accrued = funding.accruedFunding(ledger, position, DEC(250), now);
    static_cast<void>(funding.recomputeFunding(ledger, DEC(250), now));
    static_cast<void>(funding.recomputeFunding(ledger, DEC(300), now));

    EXPECT_EQ(accrued, DEC(-36));
    EXPECT_EQ(funding.accruedFunding(ledger, position, DEC(250), now), accrued);
    EXPECT_EQ(ledger.fundingSequence().size(), 4);
    EXPECT_EQ(ledger.latestFunding().funding, DEC(-1.5));
}

TEST_F(FundingEngineTest, AccruedFundingSignFollowsSide)
{
    setSkew(DEC(24));
    const Timestamp now = kGenesis + 86400;
    const Position longPosition{.lastPrice = DEC(250), .size = DEC(10)};
    const Position shortPosition{.lastPrice = DEC(250), .size = DEC(-10)};
    const Position closed{.margin = DEC(500)};

    EXPECT_EQ(funding.accruedFunding(ledger, longPosition, DEC(250), now), DEC(-15));
    EXPECT_EQ(funding.accruedFunding(ledger, shortPosition, DEC(250), now), DEC(15));
    EXPECT_EQ(funding.accruedFunding(ledger, closed, DEC(250), now), decimal_t{});
}

TEST_F(FundingEngineTest, NetFundingSinceIndex)
{
    setSkew(DEC(24));
    static_cast<void>(funding.recomputeFunding(ledger, DEC(250), kGenesis + 86400));
    EXPECT_EQ(funding.netFundingPerUnit(ledger, 1, DEC(250), kGenesis + 86400), decimal_t{});
    EXPECT_EQ(funding.netFundingPerUnit(ledger, 0, DEC(250), kGenesis + 86400), DEC(-1.5));
    EXPECT_EQ(funding.netFundingPerUnit(ledger, 1, DEC(250), kGenesis + 2 * 86400), DEC(-1.5));
}

//-------------------------------------------------------------------------
