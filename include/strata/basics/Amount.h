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

#ifndef STRATA_BASICS_AMOUNT_H_INCLUDED
#define STRATA_BASICS_AMOUNT_H_INCLUDED

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/operators.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace strata {

/** An unsigned asset quantity held in 96 bits.

    Asset balances, share counts and loss figures all use this type. Any
    operation whose result falls outside [0, 2^96 - 1] throws, so a
    computation either produces a representable value or aborts the whole
    call that requested it.
*/
class Amount : private boost::totally_ordered<Amount>,
               private boost::additive<Amount>
{
public:
    using value_type = boost::multiprecision::uint128_t;

    static constexpr unsigned bits = 96;

    Amount() = default;

    Amount(std::uint64_t value) : value_(value)
    {
    }

    /** Construct from a wide value. Throws std::overflow_error when the
        value does not fit in 96 bits.
    */
    explicit Amount(value_type const& value);

    static value_type const&
    maxValue();

    static Amount
    max()
    {
        return Amount(maxValue());
    }

    value_type const&
    value() const
    {
        return value_;
    }

    explicit
    operator bool() const noexcept
    {
        return value_ != 0;
    }

    Amount&
    operator+=(Amount const& other);

    /** Throws std::underflow_error if other is larger. */
    Amount&
    operator-=(Amount const& other);

    bool
    operator==(Amount const& other) const
    {
        return value_ == other.value_;
    }

    bool
    operator<(Amount const& other) const
    {
        return value_ < other.value_;
    }

    /** Returns the value as a 64-bit integer if it fits. */
    std::optional<std::uint64_t>
    toUInt64() const;

    std::string
    to_string() const
    {
        return value_.str();
    }

private:
    value_type value_{0};
};

/** Subtract, clamping at zero instead of throwing. */
Amount
saturatingSub(Amount const& a, Amount const& b);

/** Compute floor(value * mul / div) with a 256-bit intermediate.

    Throws std::domain_error if div is zero and std::overflow_error if the
    quotient does not fit in 96 bits.
*/
Amount
mulDiv(Amount const& value, Amount const& mul, Amount const& div);

/** Same as mulDiv but rounds the quotient up. */
Amount
mulDivCeil(Amount const& value, Amount const& mul, Amount const& div);

/** Return value * bips / 10000, rounded down. */
Amount
bipsOfValue(Amount const& value, std::uint32_t bips);

/** Parse a non-negative decimal integer. Returns std::nullopt if the text
    is empty, contains anything but digits, or exceeds 96 bits.
*/
std::optional<Amount>
parseAmount(std::string const& text);

inline std::string
to_string(Amount const& amount)
{
    return amount.to_string();
}

inline std::ostream&
operator<<(std::ostream& os, Amount const& amount)
{
    return os << amount.value();
}

}  // namespace strata

#endif
