/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "perpx/engine/MarginAccountant.hpp"

//-------------------------------------------------------------------------

namespace perpx::engine
{

//-------------------------------------------------------------------------

MarginAccountant::MarginAccountant(
    const market::ParameterStore* params,
    const PositionValuation* valuation,
    const LiquidationEngine* liquidation,
    external::ITreasury* treasury) noexcept
    : m_params{params},
      m_valuation{valuation},
      m_liquidation{liquidation},
      m_treasury{treasury}
{}

//-------------------------------------------------------------------------

decimal_t MarginAccountant::accessibleMargin(
    const accounting::MarketLedger& market,
    const accounting::Position& position,
    const Mark& mark) const
{
    const auto params = m_params->market(market.key());
    const auto globals = m_params->globals();

    const decimal_t remaining = m_valuation->flooredRemainingMargin(market, position, mark);
    const decimal_t notional = util::abs(position.size) * mark.price;

    decimal_t inaccessible{};
    if (!notional.isZero()) {
        const decimal_t effectiveLeverage = params.maxLeverage - leverageEpsilon();
        inaccessible = effectiveLeverage.signum() > 0 ? notional / effectiveLeverage : remaining;
        // Never below the liquidation margin.
        inaccessible = util::max(
            util::max(inaccessible, globals.minInitialMargin),
            m_liquidation->liquidationMargin(position.size, mark.price));
        inaccessible += leverageEpsilon();
    }

    return util::max(remaining - inaccessible - position.lockedMargin, {});
}

//-------------------------------------------------------------------------

MarginAccountant::ExpectedMargin MarginAccountant::validateWithdrawal(
    const accounting::MarketLedger& market,
    const accounting::Position& position,
    const decimal_t& amount,
    const Mark& mark) const
{
    const decimal_t newMargin = m_valuation->remainingMargin(market, position, mark) - amount;
    if (newMargin.signum() < 0 || amount > accessibleMargin(market, position, mark)) {
        return std::unexpected{Status::InsufficientMargin};
    }
    if (!position.isOpen()) {
        return newMargin;
    }

    const auto params = m_params->market(market.key());
    if (newMargin < m_params->globals().minInitialMargin) {
        return std::unexpected{Status::InsufficientMargin};
    }
    if (newMargin.isZero()
        || util::abs(position.size) * mark.price / newMargin > params.maxLeverage) {
        return std::unexpected{Status::MaxLeverageExceeded};
    }
    const accounting::Position candidate =
        m_valuation->markedPosition(market, position, newMargin, position.size, mark);
    if (m_liquidation->canLiquidate(market, candidate, mark)) {
        return std::unexpected{Status::CanLiquidate};
    }
    return newMargin;
}

//-------------------------------------------------------------------------

decimal_t MarginAccountant::transferMargin(
    accounting::MarketLedger& market,
    const MarginTransferDesc& desc,
    const Mark& mark,
    EventBuffer& events) const
{
    const auto& [account, delta] = desc;
    if (delta.isZero()) return {};

    const accounting::Position position = market.position(account);

    decimal_t newMargin, transferred;
    if (delta.signum() > 0) {
        transferred = deposit(market, position, desc, mark);
        newMargin = m_valuation->remainingMargin(market, position, mark) + transferred;
    } else {
        const auto withdrawal = validateWithdrawal(market, position, -delta, mark);
        if (!withdrawal.has_value()) {
            throwIfNotOk(withdrawal.error(), fmt::format("'{}' withdrawing {}", account, -delta));
        }
        newMargin = withdrawal.value();
        transferred = delta;
    }

    const auto& stored = m_valuation->storePosition(
        market,
        account,
        m_valuation->markedPosition(market, position, newMargin, position.size, mark));

    if (delta.signum() < 0) {
        m_treasury->issue(account, -delta);
    }

    events.push_back(MarginModifiedEvent{
        .timestamp = mark.now,
        .marketKey = market.key(),
        .account = account,
        .marginDelta = newMargin - position.margin,
        .transferAmount = transferred,
        .lockedMarginDelta = {},
        .burnAmount = {}
    });
    events.push_back(PositionModifiedEvent{
        .timestamp = mark.now,
        .marketKey = market.key(),
        .id = stored.id,
        .account = account,
        .margin = stored.margin,
        .size = stored.size,
        .tradeSize = {},
        .price = mark.price,
        .fee = {}
    });

    return transferred;
}

//-------------------------------------------------------------------------

void MarginAccountant::modifyLockedMargin(
    accounting::MarketLedger& market,
    const LockedMarginDesc& desc,
    const Mark& mark,
    EventBuffer& events) const
{
    const auto& [account, lockDelta, burnAmount] = desc;
    if (lockDelta.isZero() && burnAmount.isZero()) return;

    if (burnAmount.signum() < 0) {
        throw EngineError{
            ErrorCode::InvalidParameter, fmt::format("negative burn amount {}", burnAmount)};
    }

    const accounting::Position position = market.position(account);
    const decimal_t newMargin =
        m_valuation->remainingMargin(market, position, mark) - burnAmount;
    const decimal_t newLocked = position.lockedMargin + lockDelta;
    if (newMargin.signum() < 0 || newLocked.signum() < 0 || newLocked > newMargin) {
        throw EngineError{
            ErrorCode::InsufficientMargin,
            fmt::format(
                "'{}' locking {} and burning {} against margin {}",
                account, newLocked, burnAmount, newMargin)};
    }

    accounting::Position candidate =
        m_valuation->markedPosition(market, position, newMargin, position.size, mark);
    candidate.lockedMargin = newLocked;
    if (burnAmount.signum() > 0 && m_liquidation->canLiquidate(market, candidate, mark)) {
        throw EngineError{ErrorCode::CanLiquidate, account};
    }

    m_valuation->storePosition(market, account, candidate);

    if (burnAmount.signum() > 0) {
        m_treasury->issue(m_treasury->feePoolAccount(), burnAmount);
    }

    events.push_back(MarginModifiedEvent{
        .timestamp = mark.now,
        .marketKey = market.key(),
        .account = account,
        .marginDelta = newMargin - position.margin,
        .transferAmount = {},
        .lockedMarginDelta = lockDelta,
        .burnAmount = burnAmount
    });
}

//-------------------------------------------------------------------------

const decimal_t& MarginAccountant::leverageEpsilon()
{
    static const decimal_t s_epsilon = DEC(0.001);
    return s_epsilon;
}

//-------------------------------------------------------------------------

decimal_t MarginAccountant::deposit(
    const accounting::MarketLedger& market,
    const accounting::Position& position,
    const MarginTransferDesc& desc,
    const Mark& mark) const
{
    const auto& [account, delta] = desc;
    const decimal_t remaining = m_valuation->remainingMargin(market, position, mark);
    if ((remaining + delta).signum() < 0) {
        throw EngineError{
            ErrorCode::InsufficientMargin,
            fmt::format("'{}' depositing {} against remaining margin {}", account, delta, remaining)};
    }

    const decimal_t realized = util::max(m_treasury->burn(account, delta), {});
    if ((remaining + realized).signum() < 0) {
        throw EngineError{
            ErrorCode::InsufficientMargin,
            fmt::format("'{}' realized {} of {} deposited", account, realized, delta)};
    }
    return realized;
}

//-------------------------------------------------------------------------

}  // namespace perpx::engine

//-------------------------------------------------------------------------
