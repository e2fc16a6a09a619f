/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "perpx/replay/ScenarioRunner.hpp"

#include "EngineError.hpp"
#include "xml_util.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace perpx::replay
{

//-------------------------------------------------------------------------

using util::getAttr;
using util::getDecimalAttr;

//-------------------------------------------------------------------------

ScenarioRunner::ScenarioRunner(const ScenarioRunnerDesc& desc) noexcept
    : m_engine{desc.engine},
      m_oracle{desc.oracle},
      m_treasury{desc.treasury},
      m_clock{desc.clock}
{}

//-------------------------------------------------------------------------

ScenarioStats ScenarioRunner::run(pugi::xml_node scenario)
{
    ScenarioStats stats;
    for (pugi::xml_node action : scenario.children()) {
        if (action.type() != pugi::node_element) continue;
        try {
            runAction(action);
            ++stats.executed;
        }
        catch (const EngineError& exc) {
            ++stats.failed;
            spdlog::warn("t={} <{}> rejected: {}", m_clock->now(), action.name(), exc.what());
        }
        catch (const std::invalid_argument& exc) {
            ++stats.failed;
            spdlog::warn("t={} <{}> malformed: {}", m_clock->now(), action.name(), exc.what());
        }
    }
    return stats;
}

//-------------------------------------------------------------------------

void ScenarioRunner::runAction(pugi::xml_node action)
{
    const std::string_view name = action.name();

    if (name == "Price") {
        const AssetKey asset = getAttr(action, "asset").as_string();
        const RoundId roundId = m_oracle->setPrice(asset, getDecimalAttr(action, "value"));
        if (action.attribute("invalid").as_bool(false)) {
            m_oracle->setInvalid(asset, true);
        }
        spdlog::debug("{} priced at round {}", asset, roundId);
    }
    else if (name == "Advance") {
        m_clock->advance(getAttr(action, "seconds").as_ullong());
    }
    else if (name == "Deposit") {
        m_treasury->credit(getAttr(action, "account").as_string(), getDecimalAttr(action, "amount"));
    }
    else if (name == "Transfer") {
        m_engine->transferMargin(
            getAttr(action, "market").as_string(),
            getAttr(action, "account").as_string(),
            getDecimalAttr(action, "delta"));
    }
    else if (name == "Modify") {
        const MarketKey market = getAttr(action, "market").as_string();
        const AccountId account = getAttr(action, "account").as_string();
        const decimal_t size = getDecimalAttr(action, "size");
        const std::string_view trackingCode = action.attribute("trackingCode").as_string();
        const engine::TradeDetails details = action.attribute("feeRate")
            ? m_engine->modifyPosition(
                market, account, size, getDecimalAttr(action, "feeRate"), trackingCode)
            : m_engine->modifyPosition(market, account, size, trackingCode);
        spdlog::info(
            "t={} {} | {} size {} margin {} (fee {})",
            m_clock->now(), market, account, details.size, details.margin, details.fee);
    }
    else if (name == "Close") {
        m_engine->closePosition(
            getAttr(action, "market").as_string(), getAttr(action, "account").as_string());
    }
    else if (name == "WithdrawAll") {
        const decimal_t withdrawn = m_engine->withdrawAllMargin(
            getAttr(action, "market").as_string(), getAttr(action, "account").as_string());
        spdlog::info("t={} withdrew {}", m_clock->now(), withdrawn);
    }
    else if (name == "Liquidate") {
        const engine::LiquidationResult result = m_engine->liquidatePosition(
            getAttr(action, "market").as_string(),
            getAttr(action, "account").as_string(),
            getAttr(action, "liquidator").as_string());
        spdlog::info(
            "t={} liquidated #{} (size {}, keeper fee {}, pool fee {})",
            m_clock->now(), result.id, result.size, result.liquidatorFee, result.poolFee);
    }
    else if (name == "Recompute") {
        m_engine->recomputeFunding(getAttr(action, "market").as_string());
    }
    else {
        throw std::invalid_argument{fmt::format(
            "{}: Unknown scenario action <{}>",
            std::source_location::current().function_name(),
            name)};
    }
}

//-------------------------------------------------------------------------

}  // namespace perpx::replay

//-------------------------------------------------------------------------
