/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "perpx/engine/Status.hpp"

//-------------------------------------------------------------------------

namespace perpx::engine
{

//-------------------------------------------------------------------------

ErrorCode status2ErrorCode(Status status)
{
    switch (status) {
        case Status::InvalidPrice: return ErrorCode::InvalidPrice;
        case Status::CanLiquidate: return ErrorCode::CanLiquidate;
        case Status::CannotLiquidate: return ErrorCode::PositionNotLiquidatable;
        case Status::MaxMarketSizeExceeded: return ErrorCode::MaxMarketSizeExceeded;
        case Status::MaxLeverageExceeded: return ErrorCode::MaxLeverageExceeded;
        case Status::InsufficientMargin: return ErrorCode::InsufficientMargin;
        case Status::NotPermitted: return ErrorCode::NotPermitted;
        case Status::NilOrder: return ErrorCode::NilOrder;
        case Status::NoPositionOpen: return ErrorCode::NoPositionOpen;
        default: break;
    }
    throw std::invalid_argument{fmt::format(
        "{}: Status {} has no error code",
        std::source_location::current().function_name(),
        status)};
}

//-------------------------------------------------------------------------

void throwIfNotOk(Status status, std::string_view detail, std::source_location sl)
{
    if (status == Status::Ok) return;
    throw EngineError{status2ErrorCode(status), detail, sl};
}

//-------------------------------------------------------------------------

}  // namespace perpx::engine

//-------------------------------------------------------------------------
