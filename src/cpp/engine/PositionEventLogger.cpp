/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "perpx/engine/PositionEventLogger.hpp"

//-------------------------------------------------------------------------

namespace perpx::engine
{

//-------------------------------------------------------------------------

PositionEventLogger::PositionEventLogger(const fs::path& filepath, EngineSignals& signals)
    : m_filepath{filepath}
{
    m_logger = std::make_unique<spdlog::logger>(
        "PositionEventLogger",
        std::make_unique<spdlog::sinks::basic_file_sink_mt>(filepath.string(), true));
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");
    m_logger->trace(s_header);
    m_logger->flush();

    m_marginModifiedConn = signals.marginModified.connect(
        [this](const MarginModifiedEvent& event) { log(event); });
    m_positionModifiedConn = signals.positionModified.connect(
        [this](const PositionModifiedEvent& event) { log(event); });
    m_positionLiquidatedConn = signals.positionLiquidated.connect(
        [this](const PositionLiquidatedEvent& event) { log(event); });
    m_fundingRecomputedConn = signals.fundingRecomputed.connect(
        [this](const FundingRecomputedEvent& event) { log(event); });
    m_trackingConn = signals.tracking.connect(
        [this](const TrackingEvent& event) { log(event); });
}

//-------------------------------------------------------------------------

void PositionEventLogger::log(const MarginModifiedEvent& event)
{
    m_logger->trace(
        "{},MarginModified,{},,{},{},,,,{},,,",
        event.timestamp,
        event.marketKey,
        event.account,
        event.marginDelta,
        event.burnAmount);
    m_logger->flush();
}

//-------------------------------------------------------------------------

void PositionEventLogger::log(const PositionModifiedEvent& event)
{
    m_logger->trace(
        "{},PositionModified,{},{},{},{},{},{},{},{},,,",
        event.timestamp,
        event.marketKey,
        event.id,
        event.account,
        event.margin,
        event.size,
        event.tradeSize,
        event.price,
        event.fee);
    m_logger->flush();
}

//-------------------------------------------------------------------------

void PositionEventLogger::log(const PositionLiquidatedEvent& event)
{
    m_logger->trace(
        "{},PositionLiquidated,{},{},{},,{},,{},{},,,{}",
        event.timestamp,
        event.marketKey,
        event.id,
        event.account,
        event.size,
        event.price,
        event.fee,
        event.liquidator);
    m_logger->flush();
}

//-------------------------------------------------------------------------

void PositionEventLogger::log(const FundingRecomputedEvent& event)
{
    m_logger->trace(
        "{},FundingRecomputed,{},{},,,,,,,{},{},",
        event.timestamp,
        event.marketKey,
        event.index,
        event.funding,
        event.rate);
    m_logger->flush();
}

//-------------------------------------------------------------------------

void PositionEventLogger::log(const TrackingEvent& event)
{
    m_logger->trace(
        "{},Tracking,{},,{},,,{},,{},,,{}",
        event.timestamp,
        event.marketKey,
        event.account,
        event.sizeDelta,
        event.fee,
        event.trackingCode);
    m_logger->flush();
}

//-------------------------------------------------------------------------

}  // namespace perpx::engine

//-------------------------------------------------------------------------
