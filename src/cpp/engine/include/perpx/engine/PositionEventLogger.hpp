/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "perpx/engine/EngineEvents.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

//-------------------------------------------------------------------------

namespace perpx::engine
{

//-------------------------------------------------------------------------

/**
 * Writes every engine event as a CSV row. Columns not meaningful for an
 * event are left empty. Margin events put the margin delta under `margin`
 * and the burn under `fee`; funding events put the entry index under `id`,
 * the cumulative funding under `price` and the daily rate under `fee`;
 * tracking events put the tracking code under `counterparty`.
 */
class PositionEventLogger
{
public:
    PositionEventLogger(const fs::path& filepath, EngineSignals& signals);

    [[nodiscard]] const fs::path& filepath() const noexcept { return m_filepath; }

    // MarginModified rows carry the margin change under margin and the burn
    // under fee. Tracking rows carry the tracking code under counterparty.
    static constexpr std::string_view s_header =
        "timestamp,event,market,id,account,margin,size,tradeSize,price,fee,funding,rate,counterparty";

private:
    void log(const MarginModifiedEvent& event);
    void log(const PositionModifiedEvent& event);
    void log(const PositionLiquidatedEvent& event);
    void log(const FundingRecomputedEvent& event);
    void log(const TrackingEvent& event);

    std::unique_ptr<spdlog::logger> m_logger;
    fs::path m_filepath;

    bs2::scoped_connection m_marginModifiedConn;
    bs2::scoped_connection m_positionModifiedConn;
    bs2::scoped_connection m_positionLiquidatedConn;
    bs2::scoped_connection m_fundingRecomputedConn;
    bs2::scoped_connection m_trackingConn;
};

//-------------------------------------------------------------------------

}  // namespace perpx::engine

//-------------------------------------------------------------------------
