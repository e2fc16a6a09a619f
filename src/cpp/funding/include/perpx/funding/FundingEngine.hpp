/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "perpx/accounting/MarketLedger.hpp"
#include "perpx/market/ParameterStore.hpp"

//-------------------------------------------------------------------------

namespace perpx::funding
{

//-------------------------------------------------------------------------

struct FundingRecord
{
    FundingIndex index;
    decimal_t funding;
    decimal_t rate;
    Timestamp timestamp;
};

//-------------------------------------------------------------------------

/**
 * Funding accrual over a market's funding sequence. Stateless: everything it
 * reads lives in the ledger and the parameter store.
 *
 * Sign convention: positive skew (net long) yields a negative rate, which
 * accrues as negative funding for longs and positive funding for shorts.
 */
class FundingEngine
{
public:
    explicit FundingEngine(const market::ParameterStore* params) noexcept;

    [[nodiscard]] decimal_t proportionalSkew(
        const accounting::MarketLedger& market, const decimal_t& price) const;

    // Per day.
    [[nodiscard]] decimal_t currentFundingRate(
        const accounting::MarketLedger& market, const decimal_t& price) const;

    // Per unit of size, since the last recompute.
    [[nodiscard]] decimal_t unrecordedFunding(
        const accounting::MarketLedger& market, const decimal_t& price, Timestamp now) const;

    [[nodiscard]] decimal_t nextFundingEntry(
        const accounting::MarketLedger& market, const decimal_t& price, Timestamp now) const;

    [[nodiscard]] decimal_t netFundingPerUnit(
        const accounting::MarketLedger& market,
        FundingIndex fromIndex,
        const decimal_t& price,
        Timestamp now) const;

    [[nodiscard]] decimal_t accruedFunding(
        const accounting::MarketLedger& market,
        const accounting::Position& position,
        const decimal_t& price,
        Timestamp now) const;

    FundingRecord recomputeFunding(
        accounting::MarketLedger& market, const decimal_t& price, Timestamp now) const;

private:
    const market::ParameterStore* m_params;
};

//-------------------------------------------------------------------------

}  // namespace perpx::funding

//-------------------------------------------------------------------------
