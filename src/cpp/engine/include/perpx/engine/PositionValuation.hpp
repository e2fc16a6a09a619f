/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "perpx/funding/FundingEngine.hpp"

//-------------------------------------------------------------------------

namespace perpx::engine
{

//-------------------------------------------------------------------------

// Oracle price and clock reading a computation is evaluated at.
struct Mark
{
    decimal_t price;
    Timestamp now;
};

//-------------------------------------------------------------------------

/**
 * Mark-to-market of positions and the market debt bookkeeping shared by the
 * margin, trade and liquidation engines.
 *
 * Each position contributes margin - size * (lastPrice + funding[lastFundingIndex])
 * to the market's entryDebtCorrection. Positions must be written through
 * storePosition() so the correction follows every change.
 */
class PositionValuation
{
public:
    explicit PositionValuation(const funding::FundingEngine* funding) noexcept;

    [[nodiscard]] const funding::FundingEngine& funding() const noexcept { return *m_funding; }

    [[nodiscard]] decimal_t profitLoss(
        const accounting::Position& position, const decimal_t& price) const;

    [[nodiscard]] decimal_t accruedFunding(
        const accounting::MarketLedger& market,
        const accounting::Position& position,
        const Mark& mark) const;

    [[nodiscard]] decimal_t remainingMargin(
        const accounting::MarketLedger& market,
        const accounting::Position& position,
        const Mark& mark) const;

    [[nodiscard]] decimal_t flooredRemainingMargin(
        const accounting::MarketLedger& market,
        const accounting::Position& position,
        const Mark& mark) const;

    [[nodiscard]] decimal_t currentLeverage(
        const accounting::MarketLedger& market,
        const accounting::Position& position,
        const Mark& mark) const;

    [[nodiscard]] decimal_t debtContribution(
        const accounting::MarketLedger& market, const accounting::Position& position) const;

    [[nodiscard]] decimal_t marketDebt(
        const accounting::MarketLedger& market, const Mark& mark) const;

    /**
     * Position as it stands after realizing PnL and funding at the mark:
     * the given margin, lastPrice at the mark and funding at the latest index.
     */
    [[nodiscard]] accounting::Position markedPosition(
        const accounting::MarketLedger& market,
        const accounting::Position& position,
        const decimal_t& margin,
        const decimal_t& size,
        const Mark& mark) const;

    const accounting::Position& storePosition(
        accounting::MarketLedger& market,
        const AccountId& account,
        const accounting::Position& position) const;

private:
    const funding::FundingEngine* m_funding;
};

//-------------------------------------------------------------------------

}  // namespace perpx::engine

//-------------------------------------------------------------------------
