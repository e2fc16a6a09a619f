/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "perpx/market/MarketParameters.hpp"

#include <shared_mutex>

//-------------------------------------------------------------------------

namespace perpx::market
{

//-------------------------------------------------------------------------

/**
 * Per-market and global engine parameters. Every write is validated before
 * it is stored. The store never triggers funding recomputation itself; the
 * engine recomputes before calling setMarket() with new funding parameters.
 */
class ParameterStore
{
public:
    explicit ParameterStore(const GlobalParameters& globals = {});

    [[nodiscard]] bool contains(const MarketKey& marketKey) const;
    [[nodiscard]] MarketParameters market(const MarketKey& marketKey) const;
    [[nodiscard]] GlobalParameters globals() const;

    void addMarket(const MarketKey& marketKey, const MarketParameters& params);
    void setMarket(const MarketKey& marketKey, const MarketParameters& params);
    void setGlobals(const GlobalParameters& globals);

private:
    GlobalParameters m_globals;
    std::map<MarketKey, MarketParameters> m_markets;
    mutable std::shared_mutex m_mtx;
};

//-------------------------------------------------------------------------

}  // namespace perpx::market

//-------------------------------------------------------------------------
