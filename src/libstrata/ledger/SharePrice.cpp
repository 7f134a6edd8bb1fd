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

#include <strata/basics/contract.h>
#include <strata/ledger/SharePrice.h>
#include <strata/protocol/Protocol.h>

#include <stdexcept>

namespace strata {

namespace {

Amount
toAmount(SharePrice const& value, char const* what)
{
    if (value > SharePrice(Amount::maxValue()))
        Throw<std::overflow_error>(std::string(what) + ": exceeds 96 bits");
    return Amount(static_cast<Amount::value_type>(value));
}

}  // namespace

SharePrice
computeSharePrice(Amount const& assets, Amount const& supply)
{
    if (!supply)
        return SharePrice(sharePriceScale);
    return SharePrice(assets.value()) * SharePrice(sharePriceScale) /
        SharePrice(supply.value());
}

Amount
sharesToAmount(Amount const& shares, SharePrice const& price)
{
    return toAmount(
        SharePrice(shares.value()) * price / SharePrice(sharePriceScale),
        "sharesToAmount");
}

Amount
amountToShares(Amount const& amount, SharePrice const& price)
{
    if (price == 0)
        Throw<std::domain_error>("amountToShares: zero share price");
    return toAmount(
        SharePrice(amount.value()) * SharePrice(sharePriceScale) / price,
        "amountToShares");
}

}  // namespace strata
