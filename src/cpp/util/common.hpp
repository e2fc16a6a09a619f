/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Timestamp.hpp"
#include "perpx/decimal/decimal.hpp"

#include <boost/signals2.hpp>
#include <fmt/core.h>
#include <fmt/format.h>
#include <magic_enum.hpp>
#include <range/v3/all.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <source_location>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

namespace bs2 = boost::signals2;
namespace views = ranges::views;

using namespace perpx::literals;

//-------------------------------------------------------------------------

using MarketKey = std::string;
using AssetKey = std::string;
using AccountId = std::string;
using PositionId = uint64_t;
using FundingIndex = uint64_t;
using RoundId = uint64_t;

template<typename SlotType>
requires requires { typename std::function<SlotType>; }
using SyncSignal = bs2::signal<SlotType>;

//-------------------------------------------------------------------------
