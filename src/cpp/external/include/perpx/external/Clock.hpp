/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Timestamp.hpp"

#include <atomic>

//-------------------------------------------------------------------------

namespace perpx::external
{

//-------------------------------------------------------------------------

class IClock
{
public:
    virtual ~IClock() noexcept = default;

    [[nodiscard]] virtual Timestamp now() const = 0;
};

//-------------------------------------------------------------------------

class ManualClock : public IClock
{
public:
    explicit ManualClock(Timestamp start = {}) noexcept : m_now{start} {}

    [[nodiscard]] Timestamp now() const override { return m_now.load(); }

    void set(Timestamp timestamp) noexcept { m_now.store(timestamp); }
    void advance(Timestamp seconds) noexcept { m_now.fetch_add(seconds); }

private:
    std::atomic<Timestamp> m_now;
};

//-------------------------------------------------------------------------

}  // namespace perpx::external

//-------------------------------------------------------------------------
