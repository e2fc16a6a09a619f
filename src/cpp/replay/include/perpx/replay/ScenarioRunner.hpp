/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "perpx/engine/PerpsEngine.hpp"
#include "perpx/external/InMemoryPriceOracle.hpp"
#include "perpx/external/InMemoryTreasury.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace perpx::replay
{

//-------------------------------------------------------------------------

struct ScenarioRunnerDesc
{
    engine::PerpsEngine* engine;
    external::InMemoryPriceOracle* oracle;
    external::InMemoryTreasury* treasury;
    external::ManualClock* clock;
};

struct ScenarioStats
{
    uint32_t executed{};
    uint32_t failed{};
};

//-------------------------------------------------------------------------

/**
 * Replays the children of a <Scenario> element, one action each:
 *
 *   <Price asset= value= [invalid=]/>     <Advance seconds=/>
 *   <Deposit account= amount=/>           <Transfer market= account= delta=/>
 *   <Modify market= account= size= [feeRate=] [trackingCode=]/>
 *   <Close market= account=/>             <WithdrawAll market= account=/>
 *   <Liquidate market= account= liquidator=/>
 *   <Recompute market=/>
 *
 * A rejected or malformed action is logged and skipped. Fixed-point
 * overflow and division by zero propagate to the caller.
 */
class ScenarioRunner
{
public:
    explicit ScenarioRunner(const ScenarioRunnerDesc& desc) noexcept;

    ScenarioStats run(pugi::xml_node scenario);

    void runAction(pugi::xml_node action);

private:
    engine::PerpsEngine* m_engine;
    external::InMemoryPriceOracle* m_oracle;
    external::InMemoryTreasury* m_treasury;
    external::ManualClock* m_clock;
};

//-------------------------------------------------------------------------

}  // namespace perpx::replay

//-------------------------------------------------------------------------
