/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "perpx/market/ParameterStore.hpp"

#include "EngineError.hpp"

#include <mutex>

//-------------------------------------------------------------------------

namespace perpx::market
{

//-------------------------------------------------------------------------

ParameterStore::ParameterStore(const GlobalParameters& globals)
    : m_globals{globals}
{
    validateGlobalParameters(m_globals);
}

//-------------------------------------------------------------------------

bool ParameterStore::contains(const MarketKey& marketKey) const
{
    std::shared_lock lock{m_mtx};
    return m_markets.contains(marketKey);
}

//-------------------------------------------------------------------------

MarketParameters ParameterStore::market(const MarketKey& marketKey) const
{
    std::shared_lock lock{m_mtx};
    auto it = m_markets.find(marketKey);
    if (it == m_markets.end()) {
        throw EngineError{ErrorCode::UnknownMarket, marketKey};
    }
    return it->second;
}

//-------------------------------------------------------------------------

GlobalParameters ParameterStore::globals() const
{
    std::shared_lock lock{m_mtx};
    return m_globals;
}

//-------------------------------------------------------------------------

void ParameterStore::addMarket(const MarketKey& marketKey, const MarketParameters& params)
{
    validateMarketParameters(params);
    std::unique_lock lock{m_mtx};
    if (m_markets.contains(marketKey)) {
        throw EngineError{ErrorCode::MarketExists, marketKey};
    }
    m_markets.emplace(marketKey, params);
}

//-------------------------------------------------------------------------

void ParameterStore::setMarket(const MarketKey& marketKey, const MarketParameters& params)
{
    validateMarketParameters(params);
    std::unique_lock lock{m_mtx};
    auto it = m_markets.find(marketKey);
    if (it == m_markets.end()) {
        throw EngineError{ErrorCode::UnknownMarket, marketKey};
    }
    it->second = params;
}

//-------------------------------------------------------------------------

void ParameterStore::setGlobals(const GlobalParameters& globals)
{
    validateGlobalParameters(globals);
    std::unique_lock lock{m_mtx};
    m_globals = globals;
}

//-------------------------------------------------------------------------

}  // namespace perpx::market

//-------------------------------------------------------------------------
