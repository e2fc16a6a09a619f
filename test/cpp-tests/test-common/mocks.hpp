/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "perpx/external/PriceOracle.hpp"
#include "perpx/external/SuspensionOracle.hpp"
#include "perpx/external/Treasury.hpp"

#include <gmock/gmock.h>

//-------------------------------------------------------------------------

namespace perpx::test
{

//-------------------------------------------------------------------------

class MockTreasury : public external::ITreasury
{
public:
    MOCK_METHOD(decimal_t, burn, (const AccountId&, const decimal_t&), (override));
    MOCK_METHOD(void, issue, (const AccountId&, const decimal_t&), (override));
    MOCK_METHOD(const AccountId&, feePoolAccount, (), (const, noexcept, override));
};

class MockPriceOracle : public external::IPriceOracle
{
public:
    MOCK_METHOD(external::PriceReading, currentPrice, (const AssetKey&), (const, override));
};

class MockSuspensionOracle : public external::ISuspensionOracle
{
public:
    MOCK_METHOD(bool, isSystemSuspended, (), (const, override));
    MOCK_METHOD(bool, isMarketSuspended, (const MarketKey&), (const, override));
};

//-------------------------------------------------------------------------

}  // namespace perpx::test

//-------------------------------------------------------------------------
