/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <benchmark/benchmark.h>
#include <fmt/format.h>

#include "perpx/engine/PerpsEngine.hpp"
#include "perpx/external/InMemoryPriceOracle.hpp"
#include "perpx/external/InMemoryTreasury.hpp"
#include "perpx/external/SuspensionRegistry.hpp"
#include "perpx/market/MarketParameters.hpp"

//-------------------------------------------------------------------------

using namespace perpx;

static const fs::path kConfigPath{
    fs::path{__FILE__}.parent_path().parent_path() / "test" / "cpp-tests" / "data" / "perps.xml"};

static const MarketKey kMarket{"pBTC"};

//-------------------------------------------------------------------------

struct EngineFixture : benchmark::Fixture
{
    void SetUp(benchmark::State& state) override
    {
        const auto config = market::PerpsConfig::fromFile(kConfigPath);
        clock.set(1'700'000'000);
        engine = std::make_unique<engine::PerpsEngine>(engine::PerpsEngineDesc{
            .globals = config.globals,
            .oracle = &oracle,
            .treasury = &treasury,
            .suspension = &suspension,
            .clock = &clock
        });
        for (const auto& marketConfig : config.markets) {
            engine->addMarket(marketConfig);
        }
        static_cast<void>(oracle.setPrice("BTC", 100));
        static_cast<void>(oracle.setPrice("ETH", 250));

        const auto positionCount = state.range(0);
        for (int64_t i = 0; i < positionCount; ++i) {
            const AccountId account = fmt::format("trader{}", i);
            treasury.credit(account, 10'000);
            engine->transferMargin(kMarket, account, 1'000);
            engine->modifyPosition(kMarket, account, i % 2 == 0 ? 5 : -4);
        }
        treasury.credit("bench", 1'000'000);
        engine->transferMargin(kMarket, "bench", 100'000);
    }

    void TearDown(benchmark::State&) override { engine.reset(); }

    external::ManualClock clock;
    external::InMemoryPriceOracle oracle{{.clock = &clock}};
    external::InMemoryTreasury treasury;
    external::SuspensionRegistry suspension;
    std::unique_ptr<engine::PerpsEngine> engine;
};

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(EngineFixture, TradeRoundTrip)(benchmark::State& state)
{
    for (auto _ : state) {
        clock.advance(60);
        benchmark::DoNotOptimize(engine->modifyPosition(kMarket, "bench", 10));
        benchmark::DoNotOptimize(engine->closePosition(kMarket, "bench"));
    }
    state.SetItemsProcessed(state.iterations() * 2);
}
BENCHMARK_REGISTER_F(EngineFixture, TradeRoundTrip)->Arg(0)->Arg(1'000);

BENCHMARK_DEFINE_F(EngineFixture, MarketSummary)(benchmark::State& state)
{
    for (auto _ : state) {
        benchmark::DoNotOptimize(engine->marketSummary(kMarket));
    }
}
BENCHMARK_REGISTER_F(EngineFixture, MarketSummary)->Range(8, 8 << 10);

BENCHMARK_DEFINE_F(EngineFixture, PositionSummary)(benchmark::State& state)
{
    clock.advance(3'600);
    for (auto _ : state) {
        benchmark::DoNotOptimize(engine->positionSummary(kMarket, "trader0"));
    }
}
BENCHMARK_REGISTER_F(EngineFixture, PositionSummary)->Arg(1);

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();
}

//-------------------------------------------------------------------------
