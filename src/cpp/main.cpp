/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "perpx/engine/PositionEventLogger.hpp"
#include "perpx/external/SuspensionRegistry.hpp"
#include "perpx/replay/ScenarioRunner.hpp"
#include "common.hpp"
#include "xml_util.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <fstream>

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    using namespace perpx;

    CLI::App app{"perpx scenario replay"};

    fs::path config;
    app.add_option("-c,--config-file", config, "Markets config file")
        ->required()
        ->check(CLI::ExistingFile);

    fs::path scenario;
    app.add_option("-s,--scenario-file", scenario, "Scenario to replay")
        ->required()
        ->check(CLI::ExistingFile);

    fs::path logDir{"logs"};
    app.add_option("-l,--log-dir", logDir, "Directory for the event log");

    fs::path snapshot;
    app.add_option("--snapshot", snapshot, "Write a msgpack ledger snapshot here when done");

    bool debug{};
    app.add_flag("--debug", debug, "Print engine diagnostics");

    CLI11_PARSE(app, argc, argv);

    spdlog::info("{}", app.get_description());
    if (debug) {
        spdlog::set_level(spdlog::level::debug);
    }

    const market::PerpsConfig perpsConfig = market::PerpsConfig::fromFile(config);
    spdlog::info("'{}' loaded: {} market(s)", config.string(), perpsConfig.markets.size());

    external::ManualClock clock;
    external::InMemoryPriceOracle oracle{{.clock = &clock}};
    external::InMemoryTreasury treasury;
    external::SuspensionRegistry suspension;

    engine::PerpsEngine perps{{
        .globals = perpsConfig.globals,
        .oracle = &oracle,
        .treasury = &treasury,
        .suspension = &suspension,
        .clock = &clock
    }};
    perps.setDebug(debug);

    fs::create_directories(logDir);
    engine::PositionEventLogger eventLogger{logDir / "events.csv", perps.signals()};

    for (const auto& marketConfig : perpsConfig.markets) {
        perps.addMarket(marketConfig);
    }

    const util::XmlFile scenarioFile = util::loadXML(scenario, "Scenario");
    replay::ScenarioRunner runner{{
        .engine = &perps,
        .oracle = &oracle,
        .treasury = &treasury,
        .clock = &clock
    }};
    const replay::ScenarioStats stats = runner.run(scenarioFile.root);
    spdlog::info(
        "Replayed '{}': {} action(s) executed, {} failed",
        scenario.string(), stats.executed, stats.failed);

    for (const auto& marketKey : perps.marketKeys()) {
        spdlog::info("{}", perps.marketSummary(marketKey));
    }

    if (!snapshot.empty()) {
        const msgpack::sbuffer buf = perps.ledger().snapshot();
        std::ofstream ofs{snapshot, std::ios::binary};
        ofs.write(buf.data(), static_cast<std::streamsize>(buf.size()));
        if (!ofs) {
            spdlog::error("Failed to write snapshot '{}'", snapshot.string());
            return 1;
        }
        spdlog::info("Snapshot written to '{}'", snapshot.string());
    }

    spdlog::info("Event log at '{}'", eventLogger.filepath().string());

    return 0;
}

//-------------------------------------------------------------------------
