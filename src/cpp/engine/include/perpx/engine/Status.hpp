/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "EngineError.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

namespace perpx::engine
{

//-------------------------------------------------------------------------

enum class Status : uint32_t
{
    Ok,
    InvalidPrice,
    CanLiquidate,
    CannotLiquidate,
    MaxMarketSizeExceeded,
    MaxLeverageExceeded,
    InsufficientMargin,
    NotPermitted,
    NilOrder,
    NoPositionOpen
};

[[nodiscard]] constexpr std::string_view Status2StrView(Status status) noexcept
{
    return magic_enum::enum_name(status);
}

/**
 * Error code a mutator throws for a failed projection. Status::Ok has none.
 */
[[nodiscard]] ErrorCode status2ErrorCode(Status status);

/**
 * Throws the EngineError matching a non-Ok status.
 */
void throwIfNotOk(
    Status status,
    std::string_view detail = {},
    std::source_location sl = std::source_location::current());

//-------------------------------------------------------------------------

}  // namespace perpx::engine

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<perpx::engine::Status>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(perpx::engine::Status status, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", perpx::engine::Status2StrView(status));
    }
};

//-------------------------------------------------------------------------
