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

#ifndef STRATA_LEDGER_SHAREPRICE_H_INCLUDED
#define STRATA_LEDGER_SHAREPRICE_H_INCLUDED

#include <strata/basics/Amount.h>

#include <boost/multiprecision/cpp_int.hpp>

#include <string>

namespace strata {

/** Price of one share, scaled by sharePriceScale.

    Held in 256 bits since a small supply against large assets yields a
    price wider than an Amount.
*/
using SharePrice = boost::multiprecision::uint256_t;

/** Price of a share given the tranche's assets and share supply.

    A tranche without supply prices shares at one unit of asset.
*/
SharePrice
computeSharePrice(Amount const& assets, Amount const& supply);

/** Value of `shares` at `price`, rounded down. */
Amount
sharesToAmount(Amount const& shares, SharePrice const& price);

/** Shares worth at most `amount` at `price`, rounded down.

    Throws std::domain_error if the price is zero.
*/
Amount
amountToShares(Amount const& amount, SharePrice const& price);

inline std::string
to_string(SharePrice const& price)
{
    return price.str();
}

}  // namespace strata

#endif
