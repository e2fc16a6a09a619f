/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "perpx/accounting/Position.hpp"

//-------------------------------------------------------------------------

namespace perpx::accounting
{

//-------------------------------------------------------------------------

/**
 * Storage for a single market: scalars, the append-only funding sequence, and
 * an arena of position records keyed by account. Records are never removed;
 * ids are assigned on first store and indexed densely back to accounts.
 *
 * Mutations made between beginTransaction() and commit() are journaled and
 * undone by rollback().
 */
class MarketLedger
{
public:
    MarketLedger(MarketKey key, AssetKey baseAsset, Timestamp createdAt);

    [[nodiscard]] const MarketKey& key() const noexcept { return m_key; }
    [[nodiscard]] const AssetKey& baseAsset() const noexcept { return m_baseAsset; }

    [[nodiscard]] const MarketScalars& scalars() const noexcept { return m_scalars; }
    [[nodiscard]] MarketScalars& scalars() noexcept { return m_scalars; }

    [[nodiscard]] std::span<const FundingEntry> fundingSequence() const noexcept
    {
        return m_fundingSequence;
    }
    [[nodiscard]] FundingIndex latestFundingIndex() const noexcept
    {
        return m_fundingSequence.size() - 1;
    }
    [[nodiscard]] const FundingEntry& latestFunding() const noexcept
    {
        return m_fundingSequence.back();
    }
    [[nodiscard]] const decimal_t& fundingAt(FundingIndex idx) const;

    FundingIndex appendFunding(const FundingEntry& entry);

    [[nodiscard]] Position position(const AccountId& account) const;
    [[nodiscard]] bool hasPosition(const AccountId& account) const noexcept;
    [[nodiscard]] const std::map<AccountId, Position>& positions() const noexcept
    {
        return m_positions;
    }
    [[nodiscard]] std::optional<AccountId> accountOf(PositionId id) const;

    const Position& storePosition(const AccountId& account, Position position);

    void beginTransaction();
    void commit() noexcept;
    void rollback() noexcept;
    [[nodiscard]] bool inTransaction() const noexcept { return m_journal.has_value(); }

    template<typename Packer>
    void pack(Packer& o) const;

    [[nodiscard]] static std::unique_ptr<MarketLedger> fromMsgPack(const msgpack::object& o);

private:
    struct Journal
    {
        MarketScalars scalars;
        size_t fundingLength;
        size_t idIndexLength;
        std::map<AccountId, std::optional<Position>> touched;
    };

    MarketKey m_key;
    AssetKey m_baseAsset;
    MarketScalars m_scalars;
    std::vector<FundingEntry> m_fundingSequence;
    std::map<AccountId, Position> m_positions;
    // Position id - 1 -> account.
    std::vector<AccountId> m_idIndex;
    std::optional<Journal> m_journal;
};

//-------------------------------------------------------------------------

template<typename Packer>
void MarketLedger::pack(Packer& o) const
{
    using namespace std::string_literals;

    o.pack_map(5);

    o.pack("key"s);
    o.pack(m_key);

    o.pack("baseAsset"s);
    o.pack(m_baseAsset);

    o.pack("scalars"s);
    o.pack(m_scalars);

    o.pack("fundingSequence"s);
    o.pack(m_fundingSequence);

    o.pack("positions"s);
    o.pack(m_positions);
}

//-------------------------------------------------------------------------

/**
 * Journals a market for the lifetime of the object. Unless commit() is
 * called, everything stored in the market since construction is undone.
 */
class MarketTransaction
{
public:
    explicit MarketTransaction(MarketLedger& ledger);
    ~MarketTransaction() noexcept;

    MarketTransaction(const MarketTransaction&) = delete;
    MarketTransaction& operator=(const MarketTransaction&) = delete;

    void commit() noexcept;

private:
    MarketLedger* m_ledger;
    bool m_committed{};
};

//-------------------------------------------------------------------------

}  // namespace perpx::accounting

//-------------------------------------------------------------------------
