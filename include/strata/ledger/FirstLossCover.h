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

#ifndef STRATA_LEDGER_FIRSTLOSSCOVER_H_INCLUDED
#define STRATA_LEDGER_FIRSTLOSSCOVER_H_INCLUDED

#include <strata/basics/Amount.h>
#include <strata/protocol/PoolConfig.h>
#include <strata/protocol/TER.h>

#include <json/json.h>

#include <string>
#include <vector>

namespace strata {

/** A reserve that absorbs pool losses ahead of the tranches.

    Covers form an ordered list. Index 0 absorbs loss first and is the last
    to be repaid from a recovery.
*/
class FirstLossCover
{
    FirstLossCoverConfig config_;
    Amount totalAssets_;
    // Loss paid by this cover and not yet recovered.
    Amount coveredLoss_;

public:
    explicit FirstLossCover(FirstLossCoverConfig config);

    FirstLossCoverConfig const&
    config() const
    {
        return config_;
    }

    std::string const&
    name() const
    {
        return config_.name;
    }

    Amount const&
    totalAssets() const
    {
        return totalAssets_;
    }

    Amount const&
    coveredLoss() const
    {
        return coveredLoss_;
    }

    /** Amount this cover pays toward `loss`: the configured share of the
        loss, bounded by the per-loss cap and by the cover's assets.
    */
    Amount
    calcLossCover(Amount const& loss) const;

    /** Pay toward `loss` and return the part left uncovered. */
    Amount
    coverLoss(Amount const& loss);

    /** Amount of `recovery` this cover takes back. */
    Amount
    calcLossRecover(Amount const& recovery) const;

    /** Take back part of `recovery` and return what is left. */
    Amount
    recoverLoss(Amount const& recovery);

    /** Profit-sharing weight: assets scaled by the risk yield multiplier. */
    Amount
    weight() const;

    /** Credit a profit share. */
    void
    addCoverAssets(Amount const& amount);

    TER
    depositCover(Amount const& amount);

    /** Withdraw from the excess over the minimum liquidity. */
    TER
    redeemCover(Amount const& amount);

    /** Assets above the minimum liquidity. */
    Amount
    availableCapacity() const;

    bool
    isSufficient() const
    {
        return totalAssets_ >= config_.minLiquidity;
    }

    Json::Value
    getJson() const;
};

/** Profit shares of the covers and the junior tranche. */
struct CoverProfitAllocation
{
    std::vector<Amount> coverProfits;
    Amount juniorProfit;
};

/** Divide profit bound for the non-senior capital between the junior
    tranche and the covers in proportion to their weights.

    Each cover's share is rounded down on its own and the junior tranche
    takes the remainder, so the shares always sum to `nonSeniorProfit`.
    When every weight is zero, junior takes it all.
*/
CoverProfitAllocation
allocateNonSeniorProfit(
    Amount const& nonSeniorProfit,
    Amount const& juniorAssets,
    std::vector<FirstLossCover> const& covers);

}  // namespace strata

#endif
