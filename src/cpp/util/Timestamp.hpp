/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <cstdint>

//-------------------------------------------------------------------------

// Seconds.
using Timestamp = uint64_t;

inline constexpr Timestamp SECONDS_PER_DAY = 86'400;

//-------------------------------------------------------------------------
