/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "perpx/accounting/Position.hpp"
#include "perpx/decimal/decimal.hpp"
#include "perpx/engine/Status.hpp"
#include "EngineError.hpp"

#include <ostream>

//-------------------------------------------------------------------------

namespace perpx
{

inline void PrintTo(const decimal_t& val, std::ostream* os)
{
    *os << fmt::format("{}", val);
}

inline void PrintTo(ErrorCode ec, std::ostream* os)
{
    *os << ErrorCode2StrView(ec);
}

}  // namespace perpx

//-------------------------------------------------------------------------

namespace perpx::accounting
{

inline void PrintTo(const Position& position, std::ostream* os)
{
    *os << fmt::format("{}", position);
}

}  // namespace perpx::accounting

//-------------------------------------------------------------------------

namespace perpx::engine
{

inline void PrintTo(Status status, std::ostream* os)
{
    *os << Status2StrView(status);
}

}  // namespace perpx::engine

//-------------------------------------------------------------------------
