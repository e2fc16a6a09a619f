/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "perpx/external/Clock.hpp"
#include "perpx/external/PriceOracle.hpp"

#include <shared_mutex>

//-------------------------------------------------------------------------

namespace perpx::external
{

//-------------------------------------------------------------------------

struct InMemoryPriceOracleDesc
{
    const IClock* clock = nullptr;
    std::optional<Timestamp> staleAfter = {};
};

//-------------------------------------------------------------------------

class InMemoryPriceOracle : public IPriceOracle
{
public:
    explicit InMemoryPriceOracle(const InMemoryPriceOracleDesc& desc = {});

    [[nodiscard]] PriceReading currentPrice(const AssetKey& asset) const override;

    RoundId setPrice(const AssetKey& asset, const decimal_t& price);
    void setInvalid(const AssetKey& asset, bool invalid);

private:
    struct Entry
    {
        decimal_t price;
        bool flaggedInvalid;
        RoundId roundId;
        Timestamp updatedAt;
    };

    const IClock* m_clock;
    std::optional<Timestamp> m_staleAfter;
    std::map<AssetKey, Entry> m_entries;
    mutable std::shared_mutex m_mtx;
};

//-------------------------------------------------------------------------

}  // namespace perpx::external

//-------------------------------------------------------------------------
