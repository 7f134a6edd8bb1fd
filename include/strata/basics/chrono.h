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

#ifndef STRATA_BASICS_CHRONO_H_INCLUDED
#define STRATA_BASICS_CHRONO_H_INCLUDED

#include <chrono>
#include <cstdint>
#include <string>

namespace strata {

/** Ledger time has one second resolution. */
using LedgerTime = std::chrono::sys_seconds;

/** Calendar days used for yield accrual. */
using LedgerDay = std::chrono::sys_days;

inline LedgerDay
toDay(LedgerTime t)
{
    return std::chrono::floor<std::chrono::days>(t);
}

/** Whole days from `from` to `to`, zero if `to` is not later. */
inline std::uint64_t
daysBetween(LedgerDay from, LedgerDay to)
{
    if (to <= from)
        return 0;
    return static_cast<std::uint64_t>((to - from).count());
}

inline LedgerTime
fromSeconds(std::int64_t seconds)
{
    return LedgerTime{std::chrono::seconds{seconds}};
}

inline std::int64_t
toSeconds(LedgerTime t)
{
    return t.time_since_epoch().count();
}

}  // namespace strata

#endif
