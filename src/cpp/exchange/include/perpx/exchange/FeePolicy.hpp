/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "perpx/exchange/Fees.hpp"
#include "perpx/market/ParameterStore.hpp"

//-------------------------------------------------------------------------

namespace perpx::exchange
{

//-------------------------------------------------------------------------

struct TradeDesc
{
    MarketKey marketKey;
    // Pre-trade.
    decimal_t marketSkew;
    decimal_t sizeDelta;
};

//-------------------------------------------------------------------------

/**
 * Selects the fee rate charged on a trade. The part of |sizeDelta| that moves
 * the skew toward zero pays the maker rate, the rest pays the taker rate.
 */
class FeePolicy
{
public:
    virtual ~FeePolicy() noexcept = default;

    [[nodiscard]] virtual Fees getRates(const MarketKey& marketKey) const = 0;

    [[nodiscard]] decimal_t feeRate(const TradeDesc& tradeDesc) const;

    [[nodiscard]] static std::unique_ptr<FeePolicy> create(
        market::FeePolicyType type, const market::ParameterStore* params);

protected:
    FeePolicy() noexcept = default;
};

//-------------------------------------------------------------------------

class StaticFeePolicy : public FeePolicy
{
public:
    explicit StaticFeePolicy(const market::ParameterStore* params) noexcept;

    [[nodiscard]] Fees getRates(const MarketKey& marketKey) const override;

private:
    const market::ParameterStore* m_params;
};

//-------------------------------------------------------------------------

class SkewFeePolicy : public FeePolicy
{
public:
    explicit SkewFeePolicy(const market::ParameterStore* params) noexcept;

    [[nodiscard]] Fees getRates(const MarketKey& marketKey) const override;

private:
    const market::ParameterStore* m_params;
};

//-------------------------------------------------------------------------

}  // namespace perpx::exchange

//-------------------------------------------------------------------------
