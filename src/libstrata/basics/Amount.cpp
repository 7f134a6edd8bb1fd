//------------------------------------------------------------------------------
/*
    This file is part of strata
    Copyright (c) 2026 The strata developers

    Permission to use, copy, modify, and/or distribute this software for any
    purpose  with  or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL ,  DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#include <strata/basics/Amount.h>
#include <strata/basics/contract.h>

#include <limits>
#include <stdexcept>

namespace strata {

namespace {

using wide_type = boost::multiprecision::uint256_t;

Amount::value_type
narrow(wide_type const& wide, char const* what)
{
    if (wide > wide_type(Amount::maxValue()))
        Throw<std::overflow_error>(std::string(what) + ": result exceeds 96 bits");
    return static_cast<Amount::value_type>(wide);
}

}  // namespace

Amount::Amount(value_type const& value) : value_(value)
{
    if (value_ > maxValue())
        Throw<std::overflow_error>("Amount: value exceeds 96 bits");
}

Amount::value_type const&
Amount::maxValue()
{
    static value_type const max = (value_type(1) << bits) - 1;
    return max;
}

Amount&
Amount::operator+=(Amount const& other)
{
    // Both operands are below 2^96 so the 128-bit sum cannot wrap.
    value_type const sum = value_ + other.value_;
    if (sum > maxValue())
        Throw<std::overflow_error>("Amount: addition exceeds 96 bits");
    value_ = sum;
    return *this;
}

Amount&
Amount::operator-=(Amount const& other)
{
    if (other.value_ > value_)
        Throw<std::underflow_error>("Amount: subtraction below zero");
    value_ -= other.value_;
    return *this;
}

std::optional<std::uint64_t>
Amount::toUInt64() const
{
    if (value_ > std::numeric_limits<std::uint64_t>::max())
        return std::nullopt;
    return static_cast<std::uint64_t>(value_);
}

Amount
saturatingSub(Amount const& a, Amount const& b)
{
    if (b >= a)
        return Amount{};
    return a - b;
}

Amount
mulDiv(Amount const& value, Amount const& mul, Amount const& div)
{
    if (!div)
        Throw<std::domain_error>("mulDiv: division by zero");
    wide_type const product = wide_type(value.value()) * wide_type(mul.value());
    return Amount(narrow(product / wide_type(div.value()), "mulDiv"));
}

Amount
mulDivCeil(Amount const& value, Amount const& mul, Amount const& div)
{
    if (!div)
        Throw<std::domain_error>("mulDivCeil: division by zero");
    wide_type const product = wide_type(value.value()) * wide_type(mul.value());
    wide_type const divisor(div.value());
    wide_type quotient = product / divisor;
    if (quotient * divisor != product)
        ++quotient;
    return Amount(narrow(quotient, "mulDivCeil"));
}

Amount
bipsOfValue(Amount const& value, std::uint32_t bips)
{
    return mulDiv(value, Amount{bips}, Amount{10000});
}

std::optional<Amount>
parseAmount(std::string const& text)
{
    if (text.empty() || text.size() > 29)
        return std::nullopt;
    for (auto const c : text)
    {
        if (c < '0' || c > '9')
            return std::nullopt;
    }
    Amount::value_type const value(text);
    if (value > Amount::maxValue())
        return std::nullopt;
    return Amount(value);
}

}  // namespace strata
