/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "perpx/decimal/serialization/decimal.hpp"

#include <msgpack.hpp>

//-------------------------------------------------------------------------

namespace perpx::accounting
{

//-------------------------------------------------------------------------

struct Position
{
    PositionId id{};
    FundingIndex lastFundingIndex{};
    decimal_t margin{};
    decimal_t lockedMargin{};
    decimal_t lastPrice{};
    // Positive is long, negative is short, zero is closed.
    decimal_t size{};

    [[nodiscard]] bool isOpen() const noexcept { return !size.isZero(); }

    MSGPACK_DEFINE_MAP(id, lastFundingIndex, margin, lockedMargin, lastPrice, size);
};

//-------------------------------------------------------------------------

struct FundingEntry
{
    // Cumulative funding per unit of size since market genesis.
    decimal_t funding{};
    Timestamp timestamp{};

    MSGPACK_DEFINE_MAP(funding, timestamp);
};

//-------------------------------------------------------------------------

struct MarketScalars
{
    // Sum of |size|.
    decimal_t marketSize{};
    // Sum of signed size.
    decimal_t marketSkew{};
    // Sum over positions of margin - size * (lastPrice + funding[lastFundingIndex]).
    decimal_t entryDebtCorrection{};
    Timestamp fundingLastRecomputed{};
    PositionId lastPositionId{};

    [[nodiscard]] decimal_t longSize() const { return (marketSize + marketSkew) / decimal_t{2}; }
    [[nodiscard]] decimal_t shortSize() const { return (marketSize - marketSkew) / decimal_t{2}; }

    MSGPACK_DEFINE_MAP(
        marketSize, marketSkew, entryDebtCorrection, fundingLastRecomputed, lastPositionId);
};

//-------------------------------------------------------------------------

}  // namespace perpx::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<perpx::accounting::Position>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const perpx::accounting::Position& pos, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "#{} (size {} | margin {} | locked {} | lastPrice {} | fundingIdx {})",
            pos.id,
            pos.size,
            pos.margin,
            pos.lockedMargin,
            pos.lastPrice,
            pos.lastFundingIndex);
    }
};

//-------------------------------------------------------------------------
