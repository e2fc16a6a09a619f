/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <cstdint>
#include <source_location>
#include <stdexcept>
#include <string_view>

//-------------------------------------------------------------------------

namespace perpx
{

//-------------------------------------------------------------------------

enum class ErrorCode : uint32_t
{
    InvalidPrice,
    MarketSuspended,
    SystemSuspended,
    InsufficientMargin,
    MaxLeverageExceeded,
    MaxMarketSizeExceeded,
    NilOrder,
    NoPositionOpen,
    PositionNotLiquidatable,
    ZeroSizePosition,
    InvalidParameter,
    MarginBelowKeeperFee,
    CanLiquidate,
    UnknownMarket,
    MarketExists,
    ReentrantCall,
    InsufficientBalance,
    NotPermitted
};

[[nodiscard]] std::string_view ErrorCode2StrView(ErrorCode ec) noexcept;

//-------------------------------------------------------------------------

class EngineError : public std::runtime_error
{
public:
    explicit EngineError(
        ErrorCode code,
        std::string_view detail = {},
        std::source_location sl = std::source_location::current());

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

private:
    ErrorCode m_code;
};

//-------------------------------------------------------------------------

}  // namespace perpx

//-------------------------------------------------------------------------
