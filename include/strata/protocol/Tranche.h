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

#ifndef STRATA_PROTOCOL_TRANCHE_H_INCLUDED
#define STRATA_PROTOCOL_TRANCHE_H_INCLUDED

#include <strata/basics/Amount.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace strata {

/** Identifies a lender. Lenders are opaque to the engine. */
using LenderID = std::string;

/** The two capital classes backing the pool. */
enum class Tranche : std::uint8_t { senior = 0, junior = 1 };

/** Both tranches, senior first. */
inline constexpr std::array<Tranche, 2> allTranches{
    Tranche::senior,
    Tranche::junior};

char const*
to_string(Tranche tranche);

std::optional<Tranche>
trancheFromString(std::string const& name);

/** A pair of amounts indexed by tranche. */
struct TrancheAmounts
{
    Amount senior;
    Amount junior;

    Amount&
    operator[](Tranche t)
    {
        return t == Tranche::senior ? senior : junior;
    }

    Amount const&
    operator[](Tranche t) const
    {
        return t == Tranche::senior ? senior : junior;
    }

    Amount
    total() const
    {
        return senior + junior;
    }

    bool
    operator==(TrancheAmounts const&) const = default;
};

/** Net asset value per tranche. */
using TrancheAssets = TrancheAmounts;

/** Cumulative unrecovered loss per tranche. */
using TrancheLosses = TrancheAmounts;

}  // namespace strata

#endif
