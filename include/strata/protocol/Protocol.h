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

#ifndef STRATA_PROTOCOL_PROTOCOL_H_INCLUDED
#define STRATA_PROTOCOL_PROTOCOL_H_INCLUDED

#include <cstddef>
#include <cstdint>

namespace strata {

/** Protocol specific constants.

    These constants are used by the pool ledger and must not change
    between releases, since results computed with them are persisted.
*/
/** @{ */

/** One hundred percent expressed in basis points. */
std::uint32_t constexpr bipsPerUnity = 10'000;

/** Length of the year used to accrue fixed senior yield. */
std::uint32_t constexpr daysInYear = 360;

/** Fixed point scale of a share price. */
std::uint64_t constexpr sharePriceScale = 1'000'000'000'000'000'000ULL;

/** The largest number of first-loss covers a pool can carry. */
std::size_t constexpr maxFirstLossCovers = 16;

/** @} */

}  // namespace strata

#endif
