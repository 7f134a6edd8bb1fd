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

#ifndef STRATA_LEDGER_EPOCHMANAGER_H_INCLUDED
#define STRATA_LEDGER_EPOCHMANAGER_H_INCLUDED

#include <strata/basics/Amount.h>
#include <strata/basics/Expected.h>
#include <strata/basics/Journal.h>
#include <strata/basics/chrono.h>
#include <strata/ledger/LiquidityReserve.h>
#include <strata/ledger/Pool.h>
#include <strata/ledger/SharePrice.h>
#include <strata/ledger/TrancheVault.h>
#include <strata/protocol/PoolConfig.h>
#include <strata/protocol/TER.h>
#include <strata/protocol/Tranche.h>

#include <json/json.h>

#include <cstdint>
#include <memory>

namespace strata {

struct Epoch
{
    std::uint64_t id = 0;
    LedgerTime endTime{};
};

/** Outcome of one epoch close. */
struct RedemptionSummary
{
    std::uint64_t closedEpochId = 0;
    TrancheAmounts sharesProcessed;
    TrancheAmounts amountProcessed;
    // Value of the requests still queued, at the prices after the close.
    Amount unmetDemand;
};

/** Drives the redemption epochs.

    Closing an epoch prices both tranches, fills queued redemption epochs
    from the reserve in FIFO order subject to the senior to junior ratio,
    hands each vault its fills, and opens the next epoch.
*/
class EpochManager
{
    std::shared_ptr<PoolConfig const> config_;
    Epoch current_;
    Journal j_;

public:
    EpochManager(std::shared_ptr<PoolConfig const> config, Journal j);

    Epoch const&
    currentEpoch() const
    {
        return current_;
    }

    std::uint64_t
    currentEpochId() const
    {
        return current_.id;
    }

    /** Open the next epoch, ending one window after `now`. */
    void
    startNewEpoch(LedgerTime now);

    /** An epoch is mature once the flex window has passed since it. */
    bool
    isMature(std::uint64_t epochId) const;

    /** Settle queued redemptions and open the next epoch.

        Returns terEPOCH_NOT_ENDED before the epoch's end time and
        terNO_LIQUIDITY when requests are queued but the reserve is empty.
        Neither changes anything.
    */
    Expected<RedemptionSummary, TER>
    closeEpoch(
        Pool& pool,
        TrancheVault& seniorVault,
        TrancheVault& juniorVault,
        LiquidityReserve& reserve,
        LedgerTime now);

    Json::Value
    getJson() const;
};

}  // namespace strata

#endif
