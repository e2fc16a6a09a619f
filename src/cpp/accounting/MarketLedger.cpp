/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "perpx/accounting/MarketLedger.hpp"

#include "EngineError.hpp"
#include "perpx/serialization/msgpack_util.hpp"

//-------------------------------------------------------------------------

namespace perpx::accounting
{

//-------------------------------------------------------------------------

MarketLedger::MarketLedger(MarketKey key, AssetKey baseAsset, Timestamp createdAt)
    : m_key{std::move(key)}, m_baseAsset{std::move(baseAsset)}
{
    m_scalars.fundingLastRecomputed = createdAt;
    m_fundingSequence.push_back({.funding = {}, .timestamp = createdAt});
}

//-------------------------------------------------------------------------

const decimal_t& MarketLedger::fundingAt(FundingIndex idx) const
{
    if (idx >= m_fundingSequence.size()) {
        throw std::out_of_range{fmt::format(
            "{}: funding index {} out of range for market '{}' ({} entries)",
            std::source_location::current().function_name(),
            idx,
            m_key,
            m_fundingSequence.size())};
    }
    return m_fundingSequence[idx].funding;
}

//-------------------------------------------------------------------------

FundingIndex MarketLedger::appendFunding(const FundingEntry& entry)
{
    if (entry.timestamp < m_fundingSequence.back().timestamp) {
        throw std::invalid_argument{fmt::format(
            "{}: funding timestamp {} precedes latest entry at {}",
            std::source_location::current().function_name(),
            entry.timestamp,
            m_fundingSequence.back().timestamp)};
    }
    m_fundingSequence.push_back(entry);
    return latestFundingIndex();
}

//-------------------------------------------------------------------------

Position MarketLedger::position(const AccountId& account) const
{
    auto it = m_positions.find(account);
    return it != m_positions.end() ? it->second : Position{};
}

//-------------------------------------------------------------------------

bool MarketLedger::hasPosition(const AccountId& account) const noexcept
{
    return m_positions.contains(account);
}

//-------------------------------------------------------------------------

std::optional<AccountId> MarketLedger::accountOf(PositionId id) const
{
    if (id == 0 || id > m_idIndex.size()) return std::nullopt;
    return m_idIndex[id - 1];
}

//-------------------------------------------------------------------------

const Position& MarketLedger::storePosition(const AccountId& account, Position position)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (position.margin.signum() < 0 || position.lockedMargin.signum() < 0) {
        throw std::invalid_argument{fmt::format(
            "{}: negative margin for '{}' in market '{}': {}", ctx, account, m_key, position)};
    }

    auto it = m_positions.find(account);
    if (m_journal.has_value() && !m_journal->touched.contains(account)) {
        m_journal->touched.emplace(
            account, it != m_positions.end() ? std::make_optional(it->second) : std::nullopt);
    }

    if (it != m_positions.end()) {
        position.id = it->second.id;
    } else {
        m_idIndex.push_back(account);
        position.id = ++m_scalars.lastPositionId;
    }

    if (it == m_positions.end()) {
        return m_positions.emplace(account, std::move(position)).first->second;
    }
    it->second = std::move(position);
    return it->second;
}

//-------------------------------------------------------------------------

void MarketLedger::beginTransaction()
{
    if (m_journal.has_value()) {
        throw EngineError{ErrorCode::ReentrantCall, fmt::format("market '{}'", m_key)};
    }
    m_journal = Journal{
        .scalars = m_scalars,
        .fundingLength = m_fundingSequence.size(),
        .idIndexLength = m_idIndex.size(),
        .touched = {}
    };
}

//-------------------------------------------------------------------------

void MarketLedger::commit() noexcept
{
    m_journal.reset();
}

//-------------------------------------------------------------------------

void MarketLedger::rollback() noexcept
{
    if (!m_journal.has_value()) return;

    auto& journal = m_journal.value();
    m_scalars = journal.scalars;
    m_fundingSequence.resize(journal.fundingLength);
    m_idIndex.resize(journal.idIndexLength);
    for (auto& [account, prior] : journal.touched) {
        if (prior.has_value()) {
            m_positions.find(account)->second = std::move(prior).value();
        } else {
            m_positions.erase(account);
        }
    }
    m_journal.reset();
}

//-------------------------------------------------------------------------

std::unique_ptr<MarketLedger> MarketLedger::fromMsgPack(const msgpack::object& o)
{
    using serialization::msgpackAt;
    using serialization::MsgPackError;

    auto ledger = std::make_unique<MarketLedger>(
        msgpackAt(o, "key").as<MarketKey>(),
        msgpackAt(o, "baseAsset").as<AssetKey>(),
        Timestamp{});
    ledger->m_scalars = msgpackAt(o, "scalars").as<MarketScalars>();
    ledger->m_fundingSequence = msgpackAt(o, "fundingSequence").as<std::vector<FundingEntry>>();
    ledger->m_positions = msgpackAt(o, "positions").as<std::map<AccountId, Position>>();

    if (ledger->m_fundingSequence.empty()) {
        throw MsgPackError{fmt::format("market '{}' has no funding entries", ledger->m_key)};
    }

    ledger->m_idIndex.resize(ledger->m_scalars.lastPositionId);
    for (const auto& [account, position] : ledger->m_positions) {
        if (position.id == 0
            || position.id > ledger->m_scalars.lastPositionId
            || !ledger->m_idIndex[position.id - 1].empty()
            || position.lastFundingIndex > ledger->latestFundingIndex()) {
            throw MsgPackError{fmt::format(
                "inconsistent position '{}' in market '{}': {}", account, ledger->m_key, position)};
        }
        ledger->m_idIndex[position.id - 1] = account;
    }
    return ledger;
}

//-------------------------------------------------------------------------

MarketTransaction::MarketTransaction(MarketLedger& ledger)
    : m_ledger{&ledger}
{
    m_ledger->beginTransaction();
}

//-------------------------------------------------------------------------

MarketTransaction::~MarketTransaction() noexcept
{
    if (!m_committed) {
        m_ledger->rollback();
    }
}

//-------------------------------------------------------------------------

void MarketTransaction::commit() noexcept
{
    m_ledger->commit();
    m_committed = true;
}

//-------------------------------------------------------------------------

}  // namespace perpx::accounting

//-------------------------------------------------------------------------
