/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "perpx/accounting/MarketLedger.hpp"

#include <shared_mutex>

//-------------------------------------------------------------------------

namespace perpx::accounting
{

//-------------------------------------------------------------------------

class PositionLedger
{
public:
    MarketLedger& addMarket(const MarketKey& key, const AssetKey& baseAsset, Timestamp createdAt);

    [[nodiscard]] bool contains(const MarketKey& key) const;
    [[nodiscard]] MarketLedger& market(const MarketKey& key);
    [[nodiscard]] const MarketLedger& market(const MarketKey& key) const;
    [[nodiscard]] std::vector<MarketKey> marketKeys() const;

    [[nodiscard]] msgpack::sbuffer snapshot() const;

    [[nodiscard]] static std::unique_ptr<PositionLedger> fromSnapshot(std::string_view bytes);

private:
    std::map<MarketKey, std::unique_ptr<MarketLedger>> m_markets;
    mutable std::shared_mutex m_mtx;
};

//-------------------------------------------------------------------------

}  // namespace perpx::accounting

//-------------------------------------------------------------------------
