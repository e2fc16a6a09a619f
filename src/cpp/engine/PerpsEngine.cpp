/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "perpx/engine/PerpsEngine.hpp"

#include <type_traits>

//-------------------------------------------------------------------------

namespace perpx::engine
{

//-------------------------------------------------------------------------

namespace
{

const decimal_t& checkedFeeRate(const decimal_t& feeRate)
{
    if (feeRate.signum() < 0) {
        throw EngineError{
            ErrorCode::InvalidParameter, fmt::format("fee rate cannot be negative, got {}", feeRate)};
    }
    return feeRate;
}

}  // namespace

//-------------------------------------------------------------------------

PerpsEngine::PerpsEngine(const PerpsEngineDesc& desc)
    : PerpsEngine{
        desc,
        std::make_unique<accounting::PositionLedger>(),
        std::span<const market::MarketConfig>{}}
{}

//-------------------------------------------------------------------------

PerpsEngine::PerpsEngine(
    const PerpsEngineDesc& desc,
    std::unique_ptr<accounting::PositionLedger> ledger,
    std::span<const market::MarketConfig> configs)
    : m_oracle{desc.oracle},
      m_treasury{desc.treasury},
      m_suspension{desc.suspension},
      m_clock{desc.clock},
      m_params{desc.globals},
      m_ledger{std::move(ledger)},
      m_funding{&m_params},
      m_valuation{&m_funding},
      m_liquidation{&m_params, &m_valuation, m_treasury},
      m_margin{&m_params, &m_valuation, &m_liquidation, m_treasury},
      m_trade{&m_params, &m_valuation, &m_liquidation, m_treasury}
{
    if (m_oracle == nullptr
        || m_treasury == nullptr
        || m_suspension == nullptr
        || m_clock == nullptr
        || m_ledger == nullptr) {
        throw std::invalid_argument{fmt::format(
            "{}: missing collaborator", std::source_location::current().function_name())};
    }

    for (const auto& config : configs) {
        if (!m_ledger->contains(config.key)) {
            throw EngineError{
                ErrorCode::UnknownMarket,
                fmt::format("configured market '{}' is not in the ledger", config.key)};
        }
        if (m_markets.contains(config.key)) {
            throw EngineError{ErrorCode::MarketExists, config.key};
        }
        registerMarket(config);
    }
    for (const auto& marketKey : m_ledger->marketKeys()) {
        if (!m_markets.contains(marketKey)) {
            throw EngineError{
                ErrorCode::UnknownMarket,
                fmt::format("ledger market '{}' has no configuration", marketKey)};
        }
    }
}

//-------------------------------------------------------------------------

std::vector<MarketKey> PerpsEngine::marketKeys() const
{
    return m_ledger->marketKeys();
}

//-------------------------------------------------------------------------

PerpsEngine::MarketLock::MarketLock(MarketEntry& entry, const MarketKey& marketKey)
    : m_entry{&entry}
{
    if (entry.owner.load() == std::this_thread::get_id()) {
        throw EngineError{ErrorCode::ReentrantCall, fmt::format("market '{}'", marketKey)};
    }
    m_lock = std::unique_lock{entry.mtx};
    entry.owner.store(std::this_thread::get_id());
}

//-------------------------------------------------------------------------

PerpsEngine::MarketLock::~MarketLock() noexcept
{
    m_entry->owner.store(std::thread::id{});
}

//-------------------------------------------------------------------------

template<typename Fn>
auto PerpsEngine::mutate(const MarketKey& marketKey, Gate gate, Fn&& fn)
{
    using Result = std::invoke_result_t<Fn, accounting::MarketLedger&, const Mark&, EventBuffer&>;

    MarketEntry& marketEntry = entry(marketKey);
    if (gate == Gate::TRADER) {
        checkSuspension(marketKey);
    }
    const Mark mark = validMark(marketKey);

    EventBuffer events;
    auto run = [&]() -> Result {
        MarketLock lock{marketEntry, marketKey};
        auto& market = m_ledger->market(marketKey);
        accounting::MarketTransaction transaction{market};

        const auto record = m_funding.recomputeFunding(market, mark.price, mark.now);
        events.push_back(FundingRecomputedEvent{
            .timestamp = record.timestamp,
            .marketKey = marketKey,
            .funding = record.funding,
            .rate = record.rate,
            .index = record.index
        });

        if constexpr (std::is_void_v<Result>) {
            fn(market, mark, events);
            transaction.commit();
        } else {
            Result result = fn(market, mark, events);
            transaction.commit();
            return result;
        }
    };

    if constexpr (std::is_void_v<Result>) {
        run();
        emit(events);
    } else {
        Result result = run();
        emit(events);
        return result;
    }
}

//-------------------------------------------------------------------------

template<typename Fn>
auto PerpsEngine::read(const MarketKey& marketKey, Fn&& fn) const
{
    MarketEntry& marketEntry = entry(marketKey);
    std::unique_lock<std::mutex> lock;
    if (marketEntry.owner.load() != std::this_thread::get_id()) {
        lock = std::unique_lock{marketEntry.mtx};
    }
    return fn(std::as_const(*m_ledger).market(marketKey));
}

//-------------------------------------------------------------------------

external::PriceReading PerpsEngine::assetPrice(const MarketKey& marketKey) const
{
    const auto& market = std::as_const(*m_ledger).market(marketKey);
    external::PriceReading reading = m_oracle->currentPrice(market.baseAsset());
    reading.invalid = reading.invalid || reading.price.signum() <= 0;
    return reading;
}

//-------------------------------------------------------------------------

MarketSizes PerpsEngine::marketSizes(const MarketKey& marketKey) const
{
    return read(marketKey, [&](const accounting::MarketLedger& market) {
        return m_trade.marketSizes(market);
    });
}

//-------------------------------------------------------------------------

MarketSummary PerpsEngine::marketSummary(const MarketKey& marketKey) const
{
    const auto [mark, priceInvalid] = currentMark(marketKey);
    return read(marketKey, [&](const accounting::MarketLedger& market) {
        const auto& scalars = market.scalars();
        MarketSummary summary{
            .marketKey = market.key(),
            .baseAsset = market.baseAsset(),
            .price = mark.price,
            .marketSize = scalars.marketSize,
            .marketSkew = scalars.marketSkew,
            .fundingSequenceLength = market.fundingSequence().size(),
            .priceInvalid = priceInvalid
        };
        if (priceInvalid) return summary;
        summary.marketDebt = m_valuation.marketDebt(market, mark);
        summary.proportionalSkew = m_funding.proportionalSkew(market, mark.price);
        summary.currentFundingRate = m_funding.currentFundingRate(market, mark.price);
        summary.unrecordedFunding = m_funding.unrecordedFunding(market, mark.price, mark.now);
        return summary;
    });
}

//-------------------------------------------------------------------------

PositionSummary PerpsEngine::positionSummary(
    const MarketKey& marketKey, const AccountId& account) const
{
    const auto [mark, priceInvalid] = currentMark(marketKey);
    return read(marketKey, [&](const accounting::MarketLedger& market) {
        const accounting::Position position = market.position(account);
        PositionSummary summary{.position = position, .priceInvalid = priceInvalid};
        if (priceInvalid) return summary;

        const auto [liqPrice, liqFee] =
            m_liquidation.approxLiquidationPriceAndFee(market, position, mark);
        summary.profitLoss = m_valuation.profitLoss(position, mark.price);
        summary.accruedFunding = m_valuation.accruedFunding(market, position, mark);
        summary.remainingMargin = m_valuation.remainingMargin(market, position, mark);
        summary.accessibleMargin = m_margin.accessibleMargin(market, position, mark);
        summary.currentLeverage = m_valuation.currentLeverage(market, position, mark);
        summary.canLiquidate = m_liquidation.canLiquidate(market, position, mark);
        summary.approxLiquidationPrice = liqPrice;
        summary.approxLiquidationFee = liqFee;
        return summary;
    });
}

//-------------------------------------------------------------------------

accounting::Position PerpsEngine::position(
    const MarketKey& marketKey, const AccountId& account) const
{
    return read(marketKey, [&](const accounting::MarketLedger& market) {
        return market.position(account);
    });
}

//-------------------------------------------------------------------------

TradeDetails PerpsEngine::postTradeDetails(
    const MarketKey& marketKey,
    const AccountId& account,
    const decimal_t& sizeDelta,
    std::optional<decimal_t> feeRate) const
{
    const auto [mark, priceInvalid] = currentMark(marketKey);
    return read(marketKey, [&](const accounting::MarketLedger& market) -> TradeDetails {
        const accounting::Position position = market.position(account);
        if (priceInvalid) {
            return {
                .margin = position.margin,
                .size = position.size,
                .status = Status::InvalidPrice
            };
        }
        const decimal_t rate = feeRate.has_value()
            ? checkedFeeRate(feeRate.value())
            : policyFeeRate(market, sizeDelta);
        return m_trade.postTradeDetails(market, position, sizeDelta, rate, mark);
    });
}

//-------------------------------------------------------------------------

Priced<decimal_t> PerpsEngine::accessibleMargin(
    const MarketKey& marketKey, const AccountId& account) const
{
    const auto [mark, priceInvalid] = currentMark(marketKey);
    if (priceInvalid) return {.priceInvalid = true};
    return read(marketKey, [&](const accounting::MarketLedger& market) -> Priced<decimal_t> {
        return {.value = m_margin.accessibleMargin(market, market.position(account), mark)};
    });
}

//-------------------------------------------------------------------------

Priced<decimal_t> PerpsEngine::liquidationMargin(
    const MarketKey& marketKey, const AccountId& account) const
{
    const auto [mark, priceInvalid] = currentMark(marketKey);
    return read(marketKey, [&](const accounting::MarketLedger& market) -> Priced<decimal_t> {
        const accounting::Position position = market.position(account);
        if (!position.isOpen()) {
            throw EngineError{ErrorCode::ZeroSizePosition, account};
        }
        if (priceInvalid) return {.priceInvalid = true};
        return {.value = m_liquidation.liquidationMargin(position.size, mark.price)};
    });
}

//-------------------------------------------------------------------------

bool PerpsEngine::canLiquidate(const MarketKey& marketKey, const AccountId& account) const
{
    const auto [mark, priceInvalid] = currentMark(marketKey);
    if (priceInvalid) return false;
    return read(marketKey, [&](const accounting::MarketLedger& market) {
        return m_liquidation.canLiquidate(market, market.position(account), mark);
    });
}

//-------------------------------------------------------------------------

Priced<LiquidationEstimate> PerpsEngine::approxLiquidationPriceAndFee(
    const MarketKey& marketKey, const AccountId& account) const
{
    const auto [mark, priceInvalid] = currentMark(marketKey);
    if (priceInvalid) return {.priceInvalid = true};
    return read(marketKey, [&](const accounting::MarketLedger& market) -> Priced<LiquidationEstimate> {
        return {.value = m_liquidation.approxLiquidationPriceAndFee(
            market, market.position(account), mark)};
    });
}

//-------------------------------------------------------------------------

Priced<decimal_t> PerpsEngine::currentFundingRate(const MarketKey& marketKey) const
{
    const auto [mark, priceInvalid] = currentMark(marketKey);
    if (priceInvalid) return {.priceInvalid = true};
    return read(marketKey, [&](const accounting::MarketLedger& market) -> Priced<decimal_t> {
        return {.value = m_funding.currentFundingRate(market, mark.price)};
    });
}

//-------------------------------------------------------------------------

Priced<decimal_t> PerpsEngine::unrecordedFunding(const MarketKey& marketKey) const
{
    const auto [mark, priceInvalid] = currentMark(marketKey);
    if (priceInvalid) return {.priceInvalid = true};
    return read(marketKey, [&](const accounting::MarketLedger& market) -> Priced<decimal_t> {
        return {.value = m_funding.unrecordedFunding(market, mark.price, mark.now)};
    });
}

//-------------------------------------------------------------------------

Priced<decimal_t> PerpsEngine::orderFee(
    const MarketKey& marketKey,
    const decimal_t& sizeDelta,
    std::optional<decimal_t> feeRate) const
{
    const auto [mark, priceInvalid] = currentMark(marketKey);
    if (priceInvalid) return {.priceInvalid = true};
    return read(marketKey, [&](const accounting::MarketLedger& market) -> Priced<decimal_t> {
        const decimal_t rate = feeRate.has_value()
            ? checkedFeeRate(feeRate.value())
            : policyFeeRate(market, sizeDelta);
        return {.value = m_trade.orderFee(sizeDelta, mark.price, rate)};
    });
}

//-------------------------------------------------------------------------

Priced<MarketSizes> PerpsEngine::maxOrderSizes(const MarketKey& marketKey) const
{
    const auto [mark, priceInvalid] = currentMark(marketKey);
    if (priceInvalid) return {.priceInvalid = true};
    return read(marketKey, [&](const accounting::MarketLedger& market) -> Priced<MarketSizes> {
        return {.value = m_trade.maxOrderSizes(market, mark.price)};
    });
}

//-------------------------------------------------------------------------

std::optional<AccountId> PerpsEngine::positionIdOwner(
    const MarketKey& marketKey, PositionId id) const
{
    return read(marketKey, [&](const accounting::MarketLedger& market) {
        return market.accountOf(id);
    });
}

//-------------------------------------------------------------------------

void PerpsEngine::addMarket(const market::MarketConfig& config)
{
    {
        std::unique_lock lock{m_marketsMtx};
        if (m_markets.contains(config.key) || m_ledger->contains(config.key)) {
            throw EngineError{ErrorCode::MarketExists, config.key};
        }
        market::validateMarketParameters(config.parameters);
        m_ledger->addMarket(config.key, config.baseAsset, m_clock->now());
        registerMarket(config);
    }
    logDebug(
        "Added market {} on {} ({} fees)",
        config.key,
        config.baseAsset,
        magic_enum::enum_name(config.feePolicy));
}

//-------------------------------------------------------------------------

decimal_t PerpsEngine::transferMargin(
    const MarketKey& marketKey, const AccountId& account, const decimal_t& delta)
{
    const decimal_t transferred = mutate(
        marketKey,
        Gate::TRADER,
        [&](accounting::MarketLedger& market, const Mark& mark, EventBuffer& events) {
            return m_margin.transferMargin(
                market, {.account = account, .delta = delta}, mark, events);
        });
    logDebug("{} | {} transferred {} (requested {})", marketKey, account, transferred, delta);
    return transferred;
}

//-------------------------------------------------------------------------

decimal_t PerpsEngine::withdrawAllMargin(const MarketKey& marketKey, const AccountId& account)
{
    return mutate(
        marketKey,
        Gate::TRADER,
        [&](accounting::MarketLedger& market, const Mark& mark, EventBuffer& events) {
            const decimal_t accessible =
                m_margin.accessibleMargin(market, market.position(account), mark);
            if (accessible.isZero()) return decimal_t{};
            return -m_margin.transferMargin(
                market, {.account = account, .delta = -accessible}, mark, events);
        });
}

//-------------------------------------------------------------------------

void PerpsEngine::modifyLockedMargin(
    const MarketKey& marketKey,
    const AccountId& account,
    const decimal_t& lockDelta,
    const decimal_t& burnAmount)
{
    mutate(
        marketKey,
        Gate::TRADER,
        [&](accounting::MarketLedger& market, const Mark& mark, EventBuffer& events) {
            m_margin.modifyLockedMargin(
                market,
                {.account = account, .lockDelta = lockDelta, .burnAmount = burnAmount},
                mark,
                events);
        });
}

//-------------------------------------------------------------------------

TradeDetails PerpsEngine::modifyPosition(
    const MarketKey& marketKey,
    const AccountId& account,
    const decimal_t& sizeDelta,
    std::string_view trackingCode)
{
    return trade(
        marketKey,
        {
            .account = account,
            .sizeDelta = sizeDelta,
            .feeRate = {},
            .trackingCode = std::string{trackingCode}
        },
        true);
}

//-------------------------------------------------------------------------

TradeDetails PerpsEngine::modifyPosition(
    const MarketKey& marketKey,
    const AccountId& account,
    const decimal_t& sizeDelta,
    const decimal_t& feeRate,
    std::string_view trackingCode)
{
    return trade(
        marketKey,
        {
            .account = account,
            .sizeDelta = sizeDelta,
            .feeRate = feeRate,
            .trackingCode = std::string{trackingCode}
        },
        false);
}

//-------------------------------------------------------------------------

TradeDetails PerpsEngine::closePosition(
    const MarketKey& marketKey, const AccountId& account, std::string_view trackingCode)
{
    return mutate(
        marketKey,
        Gate::TRADER,
        [&](accounting::MarketLedger& market, const Mark& mark, EventBuffer& events) {
            const decimal_t size = market.position(account).size;
            if (size.isZero()) {
                throw EngineError{ErrorCode::NoPositionOpen, account};
            }
            return m_trade.trade(
                market,
                {
                    .account = account,
                    .sizeDelta = -size,
                    .feeRate = policyFeeRate(market, -size),
                    .trackingCode = std::string{trackingCode}
                },
                mark,
                events);
        });
}

//-------------------------------------------------------------------------

LiquidationResult PerpsEngine::liquidatePosition(
    const MarketKey& marketKey, const AccountId& account, const AccountId& liquidator)
{
    const auto result = mutate(
        marketKey,
        Gate::TRADER,
        [&](accounting::MarketLedger& market, const Mark& mark, EventBuffer& events) {
            return m_liquidation.liquidate(
                market, {.account = account, .liquidator = liquidator}, mark, events);
        });
    logDebug(
        "{} | {} liquidated #{} of {} (size {}, fee {})",
        marketKey, liquidator, result.id, account, result.size, result.liquidatorFee);
    return result;
}

//-------------------------------------------------------------------------

funding::FundingRecord PerpsEngine::recomputeFunding(const MarketKey& marketKey)
{
    return mutate(
        marketKey,
        Gate::SYSTEM,
        [&](accounting::MarketLedger& market, const Mark& mark, EventBuffer&) {
            return funding::FundingRecord{
                .index = market.latestFundingIndex(),
                .funding = market.latestFunding().funding,
                .rate = m_funding.currentFundingRate(market, mark.price),
                .timestamp = market.latestFunding().timestamp
            };
        });
}

//-------------------------------------------------------------------------

void PerpsEngine::setMarketParameters(
    const MarketKey& marketKey, const market::MarketParameters& params)
{
    market::validateMarketParameters(params);
    mutate(
        marketKey,
        Gate::SYSTEM,
        [&](accounting::MarketLedger& market, const Mark&, EventBuffer&) {
            m_params.setMarket(market.key(), params);
        });
    logDebug("{} | parameters updated", marketKey);
}

//-------------------------------------------------------------------------

void PerpsEngine::setGlobalParameters(const market::GlobalParameters& globals)
{
    m_params.setGlobals(globals);
    logDebug("Global parameters updated");
}

//-------------------------------------------------------------------------

void PerpsEngine::registerMarket(const market::MarketConfig& config)
{
    m_params.addMarket(config.key, config.parameters);
    auto entry = std::make_unique<MarketEntry>();
    entry->feePolicy = exchange::FeePolicy::create(config.feePolicy, &m_params);
    m_markets.emplace(config.key, std::move(entry));
}

//-------------------------------------------------------------------------

PerpsEngine::MarketEntry& PerpsEngine::entry(const MarketKey& marketKey) const
{
    std::shared_lock lock{m_marketsMtx};
    auto it = m_markets.find(marketKey);
    if (it == m_markets.end()) {
        throw EngineError{ErrorCode::UnknownMarket, marketKey};
    }
    return *it->second;
}

//-------------------------------------------------------------------------

void PerpsEngine::checkSuspension(const MarketKey& marketKey) const
{
    if (m_suspension->isSystemSuspended()) {
        throw EngineError{ErrorCode::SystemSuspended};
    }
    if (m_suspension->isMarketSuspended(marketKey)) {
        throw EngineError{ErrorCode::MarketSuspended, marketKey};
    }
}

//-------------------------------------------------------------------------

Mark PerpsEngine::validMark(const MarketKey& marketKey) const
{
    const auto [mark, priceInvalid] = currentMark(marketKey);
    if (priceInvalid) {
        throw EngineError{
            ErrorCode::InvalidPrice, fmt::format("{} reads {}", marketKey, mark.price)};
    }
    return mark;
}

//-------------------------------------------------------------------------

Priced<Mark> PerpsEngine::currentMark(const MarketKey& marketKey) const
{
    const external::PriceReading reading = assetPrice(marketKey);
    return {
        .value = {.price = reading.price, .now = m_clock->now()},
        .priceInvalid = reading.invalid
    };
}

//-------------------------------------------------------------------------

decimal_t PerpsEngine::policyFeeRate(
    const accounting::MarketLedger& market, const decimal_t& sizeDelta) const
{
    return entry(market.key()).feePolicy->feeRate({
        .marketKey = market.key(),
        .marketSkew = market.scalars().marketSkew,
        .sizeDelta = sizeDelta
    });
}

//-------------------------------------------------------------------------

TradeDetails PerpsEngine::trade(const MarketKey& marketKey, TradeParams params, bool usePolicyRate)
{
    const TradeDetails details = mutate(
        marketKey,
        Gate::TRADER,
        [&](accounting::MarketLedger& market, const Mark& mark, EventBuffer& events) {
            params.feeRate = usePolicyRate
                ? policyFeeRate(market, params.sizeDelta)
                : checkedFeeRate(params.feeRate);
            return m_trade.trade(market, params, mark, events);
        });
    logDebug(
        "{} | {} traded {} (fee {}): size {}, margin {}",
        marketKey, params.account, params.sizeDelta, details.fee, details.size, details.margin);
    return details;
}

//-------------------------------------------------------------------------

void PerpsEngine::emit(const EventBuffer& events)
{
    for (const auto& event : events) {
        m_signals.emit(event);
    }
}

//-------------------------------------------------------------------------

}  // namespace perpx::engine

//-------------------------------------------------------------------------
