/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "perpx/external/SuspensionOracle.hpp"

#include <set>
#include <shared_mutex>

//-------------------------------------------------------------------------

namespace perpx::external
{

//-------------------------------------------------------------------------

class SuspensionRegistry : public ISuspensionOracle
{
public:
    [[nodiscard]] bool isSystemSuspended() const override;
    [[nodiscard]] bool isMarketSuspended(const MarketKey& marketKey) const override;

    void suspendSystem();
    void resumeSystem();
    void suspendMarket(const MarketKey& marketKey);
    void resumeMarket(const MarketKey& marketKey);

private:
    bool m_systemSuspended{};
    std::set<MarketKey> m_suspendedMarkets;
    mutable std::shared_mutex m_mtx;
};

//-------------------------------------------------------------------------

}  // namespace perpx::external

//-------------------------------------------------------------------------
