/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "perpx/accounting/PositionLedger.hpp"

#include "EngineError.hpp"
#include "perpx/serialization/msgpack_util.hpp"

#include <mutex>

//-------------------------------------------------------------------------

namespace perpx::accounting
{

//-------------------------------------------------------------------------

MarketLedger& PositionLedger::addMarket(
    const MarketKey& key, const AssetKey& baseAsset, Timestamp createdAt)
{
    std::unique_lock lock{m_mtx};
    if (m_markets.contains(key)) {
        throw EngineError{ErrorCode::MarketExists, key};
    }
    auto [it, _] = m_markets.emplace(key, std::make_unique<MarketLedger>(key, baseAsset, createdAt));
    return *it->second;
}

//-------------------------------------------------------------------------

bool PositionLedger::contains(const MarketKey& key) const
{
    std::shared_lock lock{m_mtx};
    return m_markets.contains(key);
}

//-------------------------------------------------------------------------

MarketLedger& PositionLedger::market(const MarketKey& key)
{
    std::shared_lock lock{m_mtx};
    auto it = m_markets.find(key);
    if (it == m_markets.end()) {
        throw EngineError{ErrorCode::UnknownMarket, key};
    }
    return *it->second;
}

//-------------------------------------------------------------------------

const MarketLedger& PositionLedger::market(const MarketKey& key) const
{
    std::shared_lock lock{m_mtx};
    auto it = m_markets.find(key);
    if (it == m_markets.end()) {
        throw EngineError{ErrorCode::UnknownMarket, key};
    }
    return *it->second;
}

//-------------------------------------------------------------------------

std::vector<MarketKey> PositionLedger::marketKeys() const
{
    std::shared_lock lock{m_mtx};
    return m_markets | views::keys | ranges::to<std::vector>();
}

//-------------------------------------------------------------------------

msgpack::sbuffer PositionLedger::snapshot() const
{
    using namespace std::string_literals;

    std::shared_lock lock{m_mtx};
    msgpack::sbuffer buf;
    msgpack::packer<msgpack::sbuffer> o{buf};
    o.pack_map(1);
    o.pack("markets"s);
    o.pack_array(m_markets.size());
    for (const auto& [key, market] : m_markets) {
        market->pack(o);
    }
    return buf;
}

//-------------------------------------------------------------------------

std::unique_ptr<PositionLedger> PositionLedger::fromSnapshot(std::string_view bytes)
{
    using serialization::MsgPackError;

    msgpack::object_handle oh = msgpack::unpack(bytes.data(), bytes.size());
    const msgpack::object& markets = serialization::msgpackAt(oh.get(), "markets");
    if (markets.type != msgpack::type::ARRAY) {
        throw MsgPackError{"'markets' must be an array"};
    }

    auto ledger = std::make_unique<PositionLedger>();
    for (const auto& marketObj : std::span{markets.via.array.ptr, markets.via.array.size}) {
        auto market = MarketLedger::fromMsgPack(marketObj);
        const MarketKey key = market->key();
        if (!ledger->m_markets.emplace(key, std::move(market)).second) {
            throw MsgPackError{fmt::format("duplicate market '{}'", key)};
        }
    }
    return ledger;
}

//-------------------------------------------------------------------------

}  // namespace perpx::accounting

//-------------------------------------------------------------------------
