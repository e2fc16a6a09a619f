/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "perpx/engine/LiquidationEngine.hpp"

#include <expected>

//-------------------------------------------------------------------------

namespace perpx::engine
{

//-------------------------------------------------------------------------

struct MarginTransferDesc
{
    AccountId account;
    // Positive deposits, negative withdraws.
    decimal_t delta;
};

struct LockedMarginDesc
{
    AccountId account;
    decimal_t lockDelta;
    // Taken out of margin and paid to the fee pool.
    decimal_t burnAmount;
};

//-------------------------------------------------------------------------

class MarginAccountant
{
public:
    using ExpectedMargin = std::expected<decimal_t, Status>;

    MarginAccountant(
        const market::ParameterStore* params,
        const PositionValuation* valuation,
        const LiquidationEngine* liquidation,
        external::ITreasury* treasury) noexcept;

    /**
     * Margin withdrawable without falling under minInitialMargin or above
     * maxLeverage. Locked margin is never accessible.
     */
    [[nodiscard]] decimal_t accessibleMargin(
        const accounting::MarketLedger& market,
        const accounting::Position& position,
        const Mark& mark) const;

    /**
     * Margin left after withdrawing amount, or the status blocking it.
     */
    [[nodiscard]] ExpectedMargin validateWithdrawal(
        const accounting::MarketLedger& market,
        const accounting::Position& position,
        const decimal_t& amount,
        const Mark& mark) const;

    /**
     * Realizes PnL and funding into margin and moves delta through the
     * treasury. A zero delta changes nothing. Returns the realized transfer.
     */
    decimal_t transferMargin(
        accounting::MarketLedger& market,
        const MarginTransferDesc& desc,
        const Mark& mark,
        EventBuffer& events) const;

    void modifyLockedMargin(
        accounting::MarketLedger& market,
        const LockedMarginDesc& desc,
        const Mark& mark,
        EventBuffer& events) const;

    // Subtracted from maxLeverage when sizing the inaccessible margin.
    [[nodiscard]] static const decimal_t& leverageEpsilon();

private:
    [[nodiscard]] decimal_t deposit(
        const accounting::MarketLedger& market,
        const accounting::Position& position,
        const MarginTransferDesc& desc,
        const Mark& mark) const;

    const market::ParameterStore* m_params;
    const PositionValuation* m_valuation;
    const LiquidationEngine* m_liquidation;
    external::ITreasury* m_treasury;
};

//-------------------------------------------------------------------------

}  // namespace perpx::engine

//-------------------------------------------------------------------------
