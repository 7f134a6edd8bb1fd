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

#include <strata/ledger/ShareLedger.h>
#include <strata/protocol/jss.h>

namespace strata {

Amount
ShareLedger::balanceOf(LenderID const& holder) const
{
    auto const it = balances_.find(holder);
    if (it == balances_.end())
        return {};
    return it->second;
}

void
ShareLedger::mint(LenderID const& holder, Amount const& shares)
{
    totalSupply_ += shares;
    balances_[holder] += shares;
}

TER
ShareLedger::burn(LenderID const& holder, Amount const& shares)
{
    if (auto const ter = debit(holder, shares))
        return ter;
    totalSupply_ -= shares;
    return tesSUCCESS;
}

TER
ShareLedger::transfer(
    LenderID const& from,
    LenderID const& to,
    Amount const& shares)
{
    if (auto const ter = debit(from, shares))
        return ter;
    balances_[to] += shares;
    return tesSUCCESS;
}

TER
ShareLedger::debit(LenderID const& holder, Amount const& shares)
{
    auto const it = balances_.find(holder);
    if (it == balances_.end() || it->second < shares)
        return temINSUFFICIENT_SHARES;
    it->second -= shares;
    if (!it->second)
        balances_.erase(it);
    return tesSUCCESS;
}

Json::Value
ShareLedger::getJson() const
{
    Json::Value ret(Json::objectValue);
    ret[jss::total_supply] = to_string(totalSupply_);
    Json::Value& balances = ret[jss::balance] = Json::objectValue;
    for (auto const& [holder, shares] : balances_)
        balances[holder] = to_string(shares);
    return ret;
}

}  // namespace strata
