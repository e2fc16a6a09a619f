/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>

#include <compare>
#include <concepts>
#include <cstdint>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

#define DEC(lit) ::perpx::decimal_t::fromString(#lit)

//-------------------------------------------------------------------------

namespace perpx
{

//-------------------------------------------------------------------------

struct ArithmeticOverflow : std::overflow_error
{
    using std::overflow_error::overflow_error;
};

struct DivisionByZero : std::domain_error
{
    using std::domain_error::domain_error;
};

//-------------------------------------------------------------------------

/**
 * Signed fixed-point decimal with 18 fractional digits, stored as a scaled
 * 128-bit integer. Every operation truncates toward zero; intermediates are
 * carried in 256 bits and narrowed with a range check.
 */
class Decimal
{
public:
    using raw_type = boost::multiprecision::int128_t;
    using wide_type = boost::multiprecision::int256_t;

    static constexpr uint32_t s_decimals = 18;

    Decimal() noexcept = default;

    template<std::integral T>
    Decimal(T units) : m_raw{raw_type{units} * scale()} {}

    Decimal(double) = delete;
    Decimal(float) = delete;

    [[nodiscard]] const raw_type& raw() const noexcept { return m_raw; }
    [[nodiscard]] bool isZero() const noexcept { return m_raw.is_zero(); }
    [[nodiscard]] int signum() const noexcept { return m_raw.sign(); }

    [[nodiscard]] std::string toString() const;
    [[nodiscard]] double toDouble() const;

    Decimal& operator+=(const Decimal& rhs);
    Decimal& operator-=(const Decimal& rhs);
    Decimal& operator*=(const Decimal& rhs);
    Decimal& operator/=(const Decimal& rhs);

    [[nodiscard]] Decimal operator-() const;

    friend Decimal operator+(Decimal lhs, const Decimal& rhs) { return lhs += rhs; }
    friend Decimal operator-(Decimal lhs, const Decimal& rhs) { return lhs -= rhs; }
    friend Decimal operator*(Decimal lhs, const Decimal& rhs) { return lhs *= rhs; }
    friend Decimal operator/(Decimal lhs, const Decimal& rhs) { return lhs /= rhs; }

    friend bool operator==(const Decimal& lhs, const Decimal& rhs) noexcept
    {
        return lhs.m_raw == rhs.m_raw;
    }

    friend std::strong_ordering operator<=>(const Decimal& lhs, const Decimal& rhs) noexcept
    {
        if (lhs.m_raw < rhs.m_raw) return std::strong_ordering::less;
        if (lhs.m_raw > rhs.m_raw) return std::strong_ordering::greater;
        return std::strong_ordering::equal;
    }

    friend std::ostream& operator<<(std::ostream& os, const Decimal& val)
    {
        return os << val.toString();
    }

    [[nodiscard]] static Decimal fromRaw(raw_type raw) noexcept;
    [[nodiscard]] static Decimal fromWide(const wide_type& wide);
    [[nodiscard]] static Decimal fromString(std::string_view str);
    [[nodiscard]] static Decimal max() noexcept;

    [[nodiscard]] static const raw_type& scale() noexcept;

private:
    raw_type m_raw{};
};

//-------------------------------------------------------------------------

using decimal_t = Decimal;

/**
 * a * b / SCALE, truncated toward zero.
 */
[[nodiscard]] decimal_t multiplyDecimal(const decimal_t& a, const decimal_t& b);

/**
 * a * SCALE / b, truncated toward zero. Throws DivisionByZero on b == 0.
 */
[[nodiscard]] decimal_t divideDecimal(const decimal_t& a, const decimal_t& b);

//-------------------------------------------------------------------------

}  // namespace perpx

//-------------------------------------------------------------------------

namespace perpx::util
{

[[nodiscard]] inline decimal_t abs(const decimal_t& val)
{
    return val.signum() < 0 ? -val : val;
}

[[nodiscard]] inline decimal_t min(const decimal_t& a, const decimal_t& b) noexcept
{
    return b < a ? b : a;
}

[[nodiscard]] inline decimal_t max(const decimal_t& a, const decimal_t& b) noexcept
{
    return a < b ? b : a;
}

[[nodiscard]] inline decimal_t clamp(
    const decimal_t& val, const decimal_t& lo, const decimal_t& hi) noexcept
{
    return val < lo ? lo : (hi < val ? hi : val);
}

[[nodiscard]] inline decimal_t dec1m(const decimal_t& val)
{
    return decimal_t{1} - val;
}

/**
 * Truncates toward zero at the given number of decimal places.
 */
[[nodiscard]] decimal_t round(const decimal_t& val, uint32_t decimalPlaces);

[[nodiscard]] inline double decimal2double(const decimal_t& val)
{
    return val.toDouble();
}

}  // namespace perpx::util

//-------------------------------------------------------------------------

namespace perpx::literals
{

[[nodiscard]] inline decimal_t operator"" _dec(const char* lit)
{
    return decimal_t::fromString(lit);
}

}  // namespace perpx::literals

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<perpx::decimal_t>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const perpx::decimal_t& val, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", val.toString());
    }
};

//-------------------------------------------------------------------------
