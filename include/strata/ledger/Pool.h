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

#ifndef STRATA_LEDGER_POOL_H_INCLUDED
#define STRATA_LEDGER_POOL_H_INCLUDED

#include <strata/basics/Amount.h>
#include <strata/basics/Expected.h>
#include <strata/basics/Journal.h>
#include <strata/basics/chrono.h>
#include <strata/ledger/FirstLossCover.h>
#include <strata/ledger/TranchesPolicy.h>
#include <strata/protocol/PoolConfig.h>
#include <strata/protocol/TER.h>
#include <strata/protocol/Tranche.h>

#include <json/json.h>

#include <cstddef>
#include <memory>
#include <vector>

namespace strata {

/** Where a profit went. */
struct ProfitDistribution
{
    Amount seniorProfit;
    Amount juniorProfit;
    std::vector<Amount> coverProfits;
};

/** Who absorbed a loss. */
struct LossDistribution
{
    std::vector<Amount> coverLosses;
    TrancheLosses trancheLosses;
};

/** Who a recovery repaid. */
struct RecoveryDistribution
{
    TrancheAmounts trancheRecoveries;
    std::vector<Amount> coverRecoveries;
};

/** The tranche asset ledger and the waterfall that feeds it.

    Holds the assets and unrecovered losses of both tranches together with
    the first-loss covers, and distributes profit, loss and recovery
    across them. Every distribution either applies completely or returns
    an error before changing anything.
*/
class Pool
{
    std::shared_ptr<PoolConfig const> config_;
    std::unique_ptr<TranchesPolicy> policy_;
    std::vector<FirstLossCover> covers_;
    TrancheAssets assets_;
    TrancheLosses losses_;
    Journal j_;

public:
    Pool(std::shared_ptr<PoolConfig const> config, Journal j);

    Pool(Pool const& other);

    Pool&
    operator=(Pool const& other);

    Pool(Pool&&) = default;

    Pool&
    operator=(Pool&&) = default;

    PoolConfig const&
    config() const
    {
        return *config_;
    }

    TrancheAssets const&
    assets() const
    {
        return assets_;
    }

    TrancheLosses const&
    losses() const
    {
        return losses_;
    }

    std::vector<FirstLossCover> const&
    covers() const
    {
        return covers_;
    }

    /** Returns nullptr for an index past the end. */
    FirstLossCover*
    cover(std::size_t index);

    TranchesPolicy const&
    policy() const
    {
        return *policy_;
    }

    /** Run the waterfall for a profit net of fees.

        The tranche policy decides the senior share. The rest is divided
        between the junior tranche and the covers by weight. A zero profit
        changes nothing.
    */
    Expected<ProfitDistribution, TER>
    distributeProfit(Amount const& poolProfit, LedgerTime now);

    /** Absorb a loss: covers in order, then junior, then senior.

        Returns temLOSS_EXCEEDS_ASSETS if the covers and tranches together
        cannot absorb the whole loss.
    */
    Expected<LossDistribution, TER>
    distributeLoss(Amount const& loss, LedgerTime now);

    /** Repay a recovery: senior, then junior, then covers in reverse.

        Returns temRECOVERY_EXCEEDS_LOSS if the recovery is larger than
        all outstanding loss.
    */
    Expected<RecoveryDistribution, TER>
    distributeLossRecovery(Amount const& recovery, LedgerTime now);

    /** Replace tranche assets after a deposit or a redemption. */
    void
    updateTranchesAssets(TrancheAssets const& assets, LedgerTime now);

    /** Smallest junior asset figure that keeps `seniorAssets` within the
        senior to junior ratio, rounded up.
    */
    Amount
    minJuniorAssets(Amount const& seniorAssets) const;

    /** Deposit headroom left in a tranche under the liquidity cap and,
        for senior, under the senior to junior ratio.
    */
    Amount
    trancheAvailableCap(Tranche tranche) const;

    Json::Value
    getJson() const;
};

}  // namespace strata

#endif
