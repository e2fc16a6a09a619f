/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "EngineError.hpp"

#include <fmt/format.h>
#include <magic_enum.hpp>

//-------------------------------------------------------------------------

namespace perpx
{

//-------------------------------------------------------------------------

std::string_view ErrorCode2StrView(ErrorCode ec) noexcept
{
    return magic_enum::enum_name(ec);
}

//-------------------------------------------------------------------------

EngineError::EngineError(ErrorCode code, std::string_view detail, std::source_location sl)
    : std::runtime_error{fmt::format(
        "{}: {}{}{}",
        sl.function_name(),
        ErrorCode2StrView(code),
        detail.empty() ? "" : ": ",
        detail)},
      m_code{code}
{}

//-------------------------------------------------------------------------

}  // namespace perpx

//-------------------------------------------------------------------------
