/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <variant>

//-------------------------------------------------------------------------

namespace perpx::engine
{

//-------------------------------------------------------------------------

struct MarginModifiedEvent
{
    Timestamp timestamp;
    MarketKey marketKey;
    AccountId account;
    // Change of the stored margin, realized PnL and funding included.
    decimal_t marginDelta;
    // Signed amount moved through the treasury: burned in is positive, issued out negative.
    decimal_t transferAmount;
    decimal_t lockedMarginDelta;
    decimal_t burnAmount;
};

struct PositionModifiedEvent
{
    Timestamp timestamp;
    MarketKey marketKey;
    PositionId id;
    AccountId account;
    decimal_t margin;
    decimal_t size;
    decimal_t tradeSize;
    decimal_t price;
    decimal_t fee;
};

struct PositionLiquidatedEvent
{
    Timestamp timestamp;
    MarketKey marketKey;
    PositionId id;
    AccountId account;
    AccountId liquidator;
    decimal_t size;
    decimal_t price;
    decimal_t fee;
};

struct FundingRecomputedEvent
{
    Timestamp timestamp;
    MarketKey marketKey;
    decimal_t funding;
    decimal_t rate;
    FundingIndex index;
};

struct TrackingEvent
{
    Timestamp timestamp;
    std::string trackingCode;
    MarketKey marketKey;
    AccountId account;
    decimal_t sizeDelta;
    decimal_t fee;
};

using EngineEvent = std::variant<
    MarginModifiedEvent,
    PositionModifiedEvent,
    PositionLiquidatedEvent,
    FundingRecomputedEvent,
    TrackingEvent>;

// Collected during a market transaction, emitted after commit.
using EventBuffer = std::vector<EngineEvent>;

//-------------------------------------------------------------------------

struct EngineSignals
{
    SyncSignal<void(const MarginModifiedEvent&)> marginModified;
    SyncSignal<void(const PositionModifiedEvent&)> positionModified;
    SyncSignal<void(const PositionLiquidatedEvent&)> positionLiquidated;
    SyncSignal<void(const FundingRecomputedEvent&)> fundingRecomputed;
    SyncSignal<void(const TrackingEvent&)> tracking;

    void emit(const EngineEvent& event);
};

//-------------------------------------------------------------------------

}  // namespace perpx::engine

//-------------------------------------------------------------------------
