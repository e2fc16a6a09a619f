/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace perpx::external
{

//-------------------------------------------------------------------------

/**
 * Settlement asset custody. burn() may realize less than requested (fee
 * reclamation); callers must account with the returned amount.
 */
class ITreasury
{
public:
    virtual ~ITreasury() noexcept = default;

    [[nodiscard]] virtual decimal_t burn(const AccountId& account, const decimal_t& amount) = 0;
    virtual void issue(const AccountId& account, const decimal_t& amount) = 0;

    [[nodiscard]] virtual const AccountId& feePoolAccount() const noexcept = 0;
};

//-------------------------------------------------------------------------

}  // namespace perpx::external

//-------------------------------------------------------------------------
