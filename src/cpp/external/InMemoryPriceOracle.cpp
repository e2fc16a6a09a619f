/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "perpx/external/InMemoryPriceOracle.hpp"

#include <mutex>

//-------------------------------------------------------------------------

namespace perpx::external
{

//-------------------------------------------------------------------------

InMemoryPriceOracle::InMemoryPriceOracle(const InMemoryPriceOracleDesc& desc)
    : m_clock{desc.clock}, m_staleAfter{desc.staleAfter}
{
    if (m_staleAfter.has_value() && m_clock == nullptr) {
        throw std::invalid_argument{fmt::format(
            "{}: a clock is required to track staleness",
            std::source_location::current().function_name())};
    }
}

//-------------------------------------------------------------------------

PriceReading InMemoryPriceOracle::currentPrice(const AssetKey& asset) const
{
    std::shared_lock lock{m_mtx};
    auto it = m_entries.find(asset);
    if (it == m_entries.end()) {
        return {.price = {}, .invalid = true, .roundId = 0};
    }
    const auto& entry = it->second;
    const bool stale = m_staleAfter.has_value()
        && m_clock->now() > entry.updatedAt + m_staleAfter.value();
    return {
        .price = entry.price,
        .invalid = entry.flaggedInvalid || stale || entry.price.signum() <= 0,
        .roundId = entry.roundId
    };
}

//-------------------------------------------------------------------------

RoundId InMemoryPriceOracle::setPrice(const AssetKey& asset, const decimal_t& price)
{
    std::unique_lock lock{m_mtx};
    auto& entry = m_entries[asset];
    entry.price = price;
    entry.flaggedInvalid = false;
    entry.updatedAt = m_clock != nullptr ? m_clock->now() : Timestamp{};
    return ++entry.roundId;
}

//-------------------------------------------------------------------------

void InMemoryPriceOracle::setInvalid(const AssetKey& asset, bool invalid)
{
    std::unique_lock lock{m_mtx};
    m_entries[asset].flaggedInvalid = invalid;
}

//-------------------------------------------------------------------------

}  // namespace perpx::external

//-------------------------------------------------------------------------
