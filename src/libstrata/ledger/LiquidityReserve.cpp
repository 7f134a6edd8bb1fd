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

#include <strata/basics/instrumentation.h>
#include <strata/ledger/LiquidityReserve.h>
#include <strata/protocol/jss.h>

namespace strata {

void
PoolSafe::deposit(std::string const&, Amount const& amount)
{
    balance_ += amount;
}

void
PoolSafe::withdraw(std::string const&, Amount const& amount)
{
    STRATA_ASSERT(
        amount <= balance_,
        "strata::PoolSafe::withdraw : balance covers withdrawal");
    balance_ -= amount;
}

Json::Value
PoolSafe::getJson() const
{
    Json::Value ret(Json::objectValue);
    ret[jss::balance] = to_string(balance_);
    ret[jss::reservation_target] = to_string(reservationTarget_);
    ret[jss::available_reservation] = to_string(availableReservation());
    return ret;
}

}  // namespace strata
