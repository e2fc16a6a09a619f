/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "perpx/external/SuspensionRegistry.hpp"

#include <mutex>

//-------------------------------------------------------------------------

namespace perpx::external
{

//-------------------------------------------------------------------------

bool SuspensionRegistry::isSystemSuspended() const
{
    std::shared_lock lock{m_mtx};
    return m_systemSuspended;
}

//-------------------------------------------------------------------------

bool SuspensionRegistry::isMarketSuspended(const MarketKey& marketKey) const
{
    std::shared_lock lock{m_mtx};
    return m_suspendedMarkets.contains(marketKey);
}

//-------------------------------------------------------------------------

void SuspensionRegistry::suspendSystem()
{
    std::unique_lock lock{m_mtx};
    m_systemSuspended = true;
}

//-------------------------------------------------------------------------

void SuspensionRegistry::resumeSystem()
{
    std::unique_lock lock{m_mtx};
    m_systemSuspended = false;
}

//-------------------------------------------------------------------------

void SuspensionRegistry::suspendMarket(const MarketKey& marketKey)
{
    std::unique_lock lock{m_mtx};
    m_suspendedMarkets.insert(marketKey);
}

//-------------------------------------------------------------------------

void SuspensionRegistry::resumeMarket(const MarketKey& marketKey)
{
    std::unique_lock lock{m_mtx};
    m_suspendedMarkets.erase(marketKey);
}

//-------------------------------------------------------------------------

}  // namespace perpx::external

//-------------------------------------------------------------------------
