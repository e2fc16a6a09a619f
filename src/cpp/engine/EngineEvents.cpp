/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "perpx/engine/EngineEvents.hpp"

//-------------------------------------------------------------------------

namespace perpx::engine
{

//-------------------------------------------------------------------------

void EngineSignals::emit(const EngineEvent& event)
{
    std::visit(
        [this](auto&& ev) {
            using T = std::remove_cvref_t<decltype(ev)>;
            if constexpr (std::same_as<T, MarginModifiedEvent>) {
                marginModified(ev);
            } else if constexpr (std::same_as<T, PositionModifiedEvent>) {
                positionModified(ev);
            } else if constexpr (std::same_as<T, PositionLiquidatedEvent>) {
                positionLiquidated(ev);
            } else if constexpr (std::same_as<T, FundingRecomputedEvent>) {
                fundingRecomputed(ev);
            } else if constexpr (std::same_as<T, TrackingEvent>) {
                tracking(ev);
            } else {
                static_assert(!sizeof(T), "Non-exhaustive visitor");
            }
        },
        event);
}

//-------------------------------------------------------------------------

}  // namespace perpx::engine

//-------------------------------------------------------------------------
