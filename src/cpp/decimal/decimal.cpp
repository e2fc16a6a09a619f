/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "perpx/decimal/decimal.hpp"

#include <algorithm>
#include <source_location>

//-------------------------------------------------------------------------

namespace perpx
{

//-------------------------------------------------------------------------

namespace
{

const Decimal::wide_type& wideScale()
{
    static const Decimal::wide_type s_wideScale{Decimal::scale()};
    return s_wideScale;
}

const Decimal::wide_type& wideRawMax()
{
    static const Decimal::wide_type s_max{std::numeric_limits<Decimal::raw_type>::max()};
    return s_max;
}

}  // namespace

//-------------------------------------------------------------------------

const Decimal::raw_type& Decimal::scale() noexcept
{
    static const raw_type s_scale{1'000'000'000'000'000'000ll};
    return s_scale;
}

//-------------------------------------------------------------------------

Decimal Decimal::fromRaw(raw_type raw) noexcept
{
    Decimal res;
    res.m_raw = std::move(raw);
    return res;
}

//-------------------------------------------------------------------------

Decimal Decimal::fromWide(const wide_type& wide)
{
    if (abs(wide) > wideRawMax()) {
        throw ArithmeticOverflow{fmt::format(
            "{}: value {} does not fit in {} bits",
            std::source_location::current().function_name(),
            wide.str(),
            std::numeric_limits<raw_type>::digits)};
    }
    return fromRaw(static_cast<raw_type>(wide));
}

//-------------------------------------------------------------------------

Decimal Decimal::fromString(std::string_view str)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const std::string_view orig = str;
    auto fail = [&] {
        return std::invalid_argument{fmt::format(
            "{}: '{}' is not a decimal number", ctx, orig)};
    };

    bool negative = false;
    if (!str.empty() && (str.front() == '-' || str.front() == '+')) {
        negative = str.front() == '-';
        str.remove_prefix(1);
    }
    if (str.empty()) {
        throw fail();
    }

    const auto dot = str.find('.');
    const std::string_view intPart = str.substr(0, dot);
    std::string_view fracPart =
        dot == std::string_view::npos ? std::string_view{} : str.substr(dot + 1);
    if (intPart.empty() && fracPart.empty()) {
        throw fail();
    }

    auto isDigit = [](char c) { return c >= '0' && c <= '9'; };
    if (!std::all_of(intPart.begin(), intPart.end(), isDigit)
        || !std::all_of(fracPart.begin(), fracPart.end(), isDigit)) {
        throw fail();
    }

    wide_type acc{};
    for (char c : intPart) {
        acc = acc * 10 + (c - '0');
        if (acc > wideRawMax()) {
            throw ArithmeticOverflow{fmt::format("{}: '{}' is out of range", ctx, orig)};
        }
    }
    acc *= wideScale();

    if (fracPart.size() > s_decimals) {
        fracPart = fracPart.substr(0, s_decimals);
    }
    wide_type frac{};
    for (char c : fracPart) {
        frac = frac * 10 + (c - '0');
    }
    for (auto i = fracPart.size(); i < s_decimals; ++i) {
        frac *= 10;
    }
    acc += frac;

    return fromWide(negative ? wide_type{-acc} : acc);
}

//-------------------------------------------------------------------------

Decimal Decimal::max() noexcept
{
    return fromRaw(std::numeric_limits<raw_type>::max());
}

//-------------------------------------------------------------------------

std::string Decimal::toString() const
{
    const wide_type mag = abs(wide_type{m_raw});
    const wide_type intPart = mag / wideScale();
    std::string frac = wide_type{mag % wideScale()}.str();
    if (frac == "0") {
        frac.clear();
    } else {
        frac.insert(0, s_decimals - frac.size(), '0');
        frac.erase(frac.find_last_not_of('0') + 1);
    }
    return fmt::format(
        "{}{}{}{}",
        m_raw.sign() < 0 ? "-" : "",
        intPart.str(),
        frac.empty() ? "" : ".",
        frac);
}

//-------------------------------------------------------------------------

double Decimal::toDouble() const
{
    return m_raw.convert_to<double>() / 1e18;
}

//-------------------------------------------------------------------------

Decimal& Decimal::operator+=(const Decimal& rhs)
{
    *this = fromWide(wide_type{m_raw} + wide_type{rhs.m_raw});
    return *this;
}

//-------------------------------------------------------------------------

Decimal& Decimal::operator-=(const Decimal& rhs)
{
    *this = fromWide(wide_type{m_raw} - wide_type{rhs.m_raw});
    return *this;
}

//-------------------------------------------------------------------------

Decimal& Decimal::operator*=(const Decimal& rhs)
{
    *this = multiplyDecimal(*this, rhs);
    return *this;
}

//-------------------------------------------------------------------------

Decimal& Decimal::operator/=(const Decimal& rhs)
{
    *this = divideDecimal(*this, rhs);
    return *this;
}

//-------------------------------------------------------------------------

Decimal Decimal::operator-() const
{
    return fromRaw(-m_raw);
}

//-------------------------------------------------------------------------

decimal_t multiplyDecimal(const decimal_t& a, const decimal_t& b)
{
    const decimal_t::wide_type product =
        decimal_t::wide_type{a.raw()} * decimal_t::wide_type{b.raw()};
    return decimal_t::fromWide(product / wideScale());
}

//-------------------------------------------------------------------------

decimal_t divideDecimal(const decimal_t& a, const decimal_t& b)
{
    if (b.isZero()) {
        throw DivisionByZero{fmt::format(
            "{}: {} / 0", std::source_location::current().function_name(), a)};
    }
    const decimal_t::wide_type numerator = decimal_t::wide_type{a.raw()} * wideScale();
    return decimal_t::fromWide(numerator / decimal_t::wide_type{b.raw()});
}

//-------------------------------------------------------------------------

}  // namespace perpx

//-------------------------------------------------------------------------

namespace perpx::util
{

decimal_t round(const decimal_t& val, uint32_t decimalPlaces)
{
    if (decimalPlaces >= decimal_t::s_decimals) {
        return val;
    }
    decimal_t::raw_type factor{1};
    for (auto i = decimalPlaces; i < decimal_t::s_decimals; ++i) {
        factor *= 10;
    }
    return decimal_t::fromRaw(decimal_t::raw_type{val.raw() / factor} * factor);
}

}  // namespace perpx::util

//-------------------------------------------------------------------------
