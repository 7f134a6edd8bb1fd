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

#ifndef STRATA_LEDGER_SHARELEDGER_H_INCLUDED
#define STRATA_LEDGER_SHARELEDGER_H_INCLUDED

#include <strata/basics/Amount.h>
#include <strata/protocol/TER.h>
#include <strata/protocol/Tranche.h>

#include <json/json.h>

#include <map>

namespace strata {

/** Share balances of one tranche. */
class ShareLedger
{
    std::map<LenderID, Amount> balances_;
    Amount totalSupply_;

public:
    Amount const&
    totalSupply() const
    {
        return totalSupply_;
    }

    Amount
    balanceOf(LenderID const& holder) const;

    void
    mint(LenderID const& holder, Amount const& shares);

    TER
    burn(LenderID const& holder, Amount const& shares);

    TER
    transfer(LenderID const& from, LenderID const& to, Amount const& shares);

    Json::Value
    getJson() const;

private:
    TER
    debit(LenderID const& holder, Amount const& shares);
};

}  // namespace strata

#endif
