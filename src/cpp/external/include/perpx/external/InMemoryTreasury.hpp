/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "perpx/external/Treasury.hpp"

#include <mutex>

//-------------------------------------------------------------------------

namespace perpx::external
{

//-------------------------------------------------------------------------

class InMemoryTreasury : public ITreasury
{
public:
    explicit InMemoryTreasury(AccountId feePoolAccount = "FEE_POOL");

    [[nodiscard]] decimal_t burn(const AccountId& account, const decimal_t& amount) override;
    void issue(const AccountId& account, const decimal_t& amount) override;

    [[nodiscard]] const AccountId& feePoolAccount() const noexcept override
    {
        return m_feePoolAccount;
    }

    void credit(const AccountId& account, const decimal_t& amount);
    void setReclamation(const AccountId& account, const decimal_t& amount);

    [[nodiscard]] decimal_t balanceOf(const AccountId& account) const;
    [[nodiscard]] decimal_t totalIssued() const;
    [[nodiscard]] decimal_t totalBurned() const;

private:
    AccountId m_feePoolAccount;
    std::map<AccountId, decimal_t> m_balances;
    std::map<AccountId, decimal_t> m_reclamations;
    decimal_t m_totalIssued{};
    decimal_t m_totalBurned{};
    mutable std::mutex m_mtx;
};

//-------------------------------------------------------------------------

}  // namespace perpx::external

//-------------------------------------------------------------------------
