/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "perpx/accounting/PositionLedger.hpp"
#include "perpx/engine/MarginAccountant.hpp"
#include "perpx/engine/TradeEngine.hpp"
#include "perpx/exchange/FeePolicy.hpp"
#include "perpx/external/Clock.hpp"
#include "perpx/external/PriceOracle.hpp"
#include "perpx/external/SuspensionOracle.hpp"

#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <thread>

//-------------------------------------------------------------------------

namespace perpx::engine
{

//-------------------------------------------------------------------------

struct PerpsEngineDesc
{
    market::GlobalParameters globals;
    const external::IPriceOracle* oracle;
    external::ITreasury* treasury;
    const external::ISuspensionOracle* suspension;
    const external::IClock* clock;
};

//-------------------------------------------------------------------------

/**
 * Entry point for every market operation.
 *
 * A mutating call checks suspension (system, then market), reads the oracle
 * price, takes the market's lock, recomputes funding and runs inside a
 * MarketTransaction; any exception leaves the market untouched. Events are
 * buffered and emitted once the lock is released. A thread calling back into
 * a market it is already mutating fails with ErrorCode::ReentrantCall.
 *
 * Reads made from within a mutation on the same thread see its uncommitted
 * state.
 */
class PerpsEngine
{
public:
    explicit PerpsEngine(const PerpsEngineDesc& desc);

    PerpsEngine(
        const PerpsEngineDesc& desc,
        std::unique_ptr<accounting::PositionLedger> ledger,
        std::span<const market::MarketConfig> configs);

    [[nodiscard]] EngineSignals& signals() noexcept { return m_signals; }
    [[nodiscard]] const accounting::PositionLedger& ledger() const noexcept { return *m_ledger; }
    [[nodiscard]] const market::ParameterStore& parameters() const noexcept { return m_params; }
    [[nodiscard]] std::vector<MarketKey> marketKeys() const;

    // Reads.
    [[nodiscard]] external::PriceReading assetPrice(const MarketKey& marketKey) const;
    [[nodiscard]] MarketSizes marketSizes(const MarketKey& marketKey) const;
    [[nodiscard]] MarketSummary marketSummary(const MarketKey& marketKey) const;
    [[nodiscard]] PositionSummary positionSummary(
        const MarketKey& marketKey, const AccountId& account) const;
    [[nodiscard]] accounting::Position position(
        const MarketKey& marketKey, const AccountId& account) const;
    [[nodiscard]] TradeDetails postTradeDetails(
        const MarketKey& marketKey,
        const AccountId& account,
        const decimal_t& sizeDelta,
        std::optional<decimal_t> feeRate = {}) const;
    [[nodiscard]] Priced<decimal_t> accessibleMargin(
        const MarketKey& marketKey, const AccountId& account) const;
    [[nodiscard]] Priced<decimal_t> liquidationMargin(
        const MarketKey& marketKey, const AccountId& account) const;
    [[nodiscard]] bool canLiquidate(const MarketKey& marketKey, const AccountId& account) const;
    [[nodiscard]] Priced<LiquidationEstimate> approxLiquidationPriceAndFee(
        const MarketKey& marketKey, const AccountId& account) const;
    [[nodiscard]] Priced<decimal_t> currentFundingRate(const MarketKey& marketKey) const;
    [[nodiscard]] Priced<decimal_t> unrecordedFunding(const MarketKey& marketKey) const;
    [[nodiscard]] Priced<decimal_t> orderFee(
        const MarketKey& marketKey,
        const decimal_t& sizeDelta,
        std::optional<decimal_t> feeRate = {}) const;
    [[nodiscard]] Priced<MarketSizes> maxOrderSizes(const MarketKey& marketKey) const;
    [[nodiscard]] std::optional<AccountId> positionIdOwner(
        const MarketKey& marketKey, PositionId id) const;

    // Writes.
    void addMarket(const market::MarketConfig& config);
    decimal_t transferMargin(
        const MarketKey& marketKey, const AccountId& account, const decimal_t& delta);
    decimal_t withdrawAllMargin(const MarketKey& marketKey, const AccountId& account);
    void modifyLockedMargin(
        const MarketKey& marketKey,
        const AccountId& account,
        const decimal_t& lockDelta,
        const decimal_t& burnAmount);
    TradeDetails modifyPosition(
        const MarketKey& marketKey,
        const AccountId& account,
        const decimal_t& sizeDelta,
        std::string_view trackingCode = {});
    TradeDetails modifyPosition(
        const MarketKey& marketKey,
        const AccountId& account,
        const decimal_t& sizeDelta,
        const decimal_t& feeRate,
        std::string_view trackingCode = {});
    TradeDetails closePosition(
        const MarketKey& marketKey,
        const AccountId& account,
        std::string_view trackingCode = {});
    LiquidationResult liquidatePosition(
        const MarketKey& marketKey, const AccountId& account, const AccountId& liquidator);
    funding::FundingRecord recomputeFunding(const MarketKey& marketKey);
    void setMarketParameters(const MarketKey& marketKey, const market::MarketParameters& params);
    void setGlobalParameters(const market::GlobalParameters& globals);

    template<typename... Args>
    void logDebug(fmt::format_string<Args...> fmt, Args&&... args) const
    {
        if (m_debug) {
            fmt::print(fmt, std::forward<Args>(args)...);
            fmt::print("\n");
        }
    }

    void setDebug(bool flag) noexcept { m_debug = flag; }
    [[nodiscard]] bool debug() const noexcept { return m_debug; }

private:
    struct MarketEntry
    {
        std::unique_ptr<exchange::FeePolicy> feePolicy;
        std::mutex mtx;
        std::atomic<std::thread::id> owner{};
    };

    class MarketLock
    {
    public:
        MarketLock(MarketEntry& entry, const MarketKey& marketKey);
        ~MarketLock() noexcept;

        MarketLock(const MarketLock&) = delete;
        MarketLock& operator=(const MarketLock&) = delete;

    private:
        MarketEntry* m_entry;
        std::unique_lock<std::mutex> m_lock;
    };

    enum class Gate : uint32_t
    {
        TRADER,
        SYSTEM
    };

    template<typename Fn>
    auto mutate(const MarketKey& marketKey, Gate gate, Fn&& fn);

    template<typename Fn>
    auto read(const MarketKey& marketKey, Fn&& fn) const;

    void registerMarket(const market::MarketConfig& config);
    [[nodiscard]] MarketEntry& entry(const MarketKey& marketKey) const;
    void checkSuspension(const MarketKey& marketKey) const;
    [[nodiscard]] Mark validMark(const MarketKey& marketKey) const;
    [[nodiscard]] Priced<Mark> currentMark(const MarketKey& marketKey) const;
    [[nodiscard]] decimal_t policyFeeRate(
        const accounting::MarketLedger& market, const decimal_t& sizeDelta) const;
    TradeDetails trade(const MarketKey& marketKey, TradeParams params, bool usePolicyRate);
    void emit(const EventBuffer& events);

    const external::IPriceOracle* m_oracle;
    external::ITreasury* m_treasury;
    const external::ISuspensionOracle* m_suspension;
    const external::IClock* m_clock;

    market::ParameterStore m_params;
    std::unique_ptr<accounting::PositionLedger> m_ledger;
    funding::FundingEngine m_funding;
    PositionValuation m_valuation;
    LiquidationEngine m_liquidation;
    MarginAccountant m_margin;
    TradeEngine m_trade;

    std::map<MarketKey, std::unique_ptr<MarketEntry>> m_markets;
    mutable std::shared_mutex m_marketsMtx;

    EngineSignals m_signals;
    bool m_debug{};
};

//-------------------------------------------------------------------------

}  // namespace perpx::engine

//-------------------------------------------------------------------------
