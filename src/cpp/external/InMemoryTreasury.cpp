/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "perpx/external/InMemoryTreasury.hpp"

#include "EngineError.hpp"

//-------------------------------------------------------------------------

namespace perpx::external
{

//-------------------------------------------------------------------------

InMemoryTreasury::InMemoryTreasury(AccountId feePoolAccount)
    : m_feePoolAccount{std::move(feePoolAccount)}
{}

//-------------------------------------------------------------------------

decimal_t InMemoryTreasury::burn(const AccountId& account, const decimal_t& amount)
{
    std::lock_guard lock{m_mtx};
    auto& balance = m_balances[account];
    if (balance < amount) {
        throw EngineError{
            ErrorCode::InsufficientBalance,
            fmt::format("account '{}' holds {}, cannot burn {}", account, balance, amount)};
    }
    balance -= amount;
    m_totalBurned += amount;

    decimal_t reclaimed{};
    if (auto it = m_reclamations.find(account); it != m_reclamations.end()) {
        reclaimed = util::min(it->second, amount);
        m_reclamations.erase(it);
    }
    return amount - reclaimed;
}

//-------------------------------------------------------------------------

void InMemoryTreasury::issue(const AccountId& account, const decimal_t& amount)
{
    std::lock_guard lock{m_mtx};
    m_balances[account] += amount;
    m_totalIssued += amount;
}

//-------------------------------------------------------------------------

void InMemoryTreasury::credit(const AccountId& account, const decimal_t& amount)
{
    std::lock_guard lock{m_mtx};
    m_balances[account] += amount;
}

//-------------------------------------------------------------------------

void InMemoryTreasury::setReclamation(const AccountId& account, const decimal_t& amount)
{
    std::lock_guard lock{m_mtx};
    m_reclamations[account] = amount;
}

//-------------------------------------------------------------------------

decimal_t InMemoryTreasury::balanceOf(const AccountId& account) const
{
    std::lock_guard lock{m_mtx};
    auto it = m_balances.find(account);
    return it != m_balances.end() ? it->second : decimal_t{};
}

//-------------------------------------------------------------------------

decimal_t InMemoryTreasury::totalIssued() const
{
    std::lock_guard lock{m_mtx};
    return m_totalIssued;
}

//-------------------------------------------------------------------------

decimal_t InMemoryTreasury::totalBurned() const
{
    std::lock_guard lock{m_mtx};
    return m_totalBurned;
}

//-------------------------------------------------------------------------

}  // namespace perpx::external

//-------------------------------------------------------------------------
