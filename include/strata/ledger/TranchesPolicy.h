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

#ifndef STRATA_LEDGER_TRANCHESPOLICY_H_INCLUDED
#define STRATA_LEDGER_TRANCHESPOLICY_H_INCLUDED

#include <strata/basics/Amount.h>
#include <strata/basics/Expected.h>
#include <strata/basics/chrono.h>
#include <strata/protocol/PoolConfig.h>
#include <strata/protocol/TER.h>
#include <strata/protocol/Tranche.h>

#include <json/json.h>

#include <cstdint>
#include <memory>

namespace strata {

/** How a profit amount divides between the tranches. */
struct ProfitSplit
{
    Amount senior;
    Amount junior;
};

/** Tranche assets after a loss and the loss each tranche took. */
struct TrancheLossSplit
{
    TrancheAssets assets;
    TrancheLosses lossDelta;
};

/** Tranche state after a recovery, and the recovery left for the covers. */
struct TrancheRecoverySplit
{
    Amount remaining;
    TrancheAssets assets;
    TrancheLosses losses;
};

/** Decides how profit is shared between the senior and junior tranches.

    A pool uses exactly one policy, chosen by configuration. Loss and
    recovery do not depend on the policy, see distributeLoss and
    distributeLossRecovery below.
*/
class TranchesPolicy
{
public:
    virtual ~TranchesPolicy() = default;

    virtual std::unique_ptr<TranchesPolicy>
    clone() const = 0;

    virtual TranchesPolicyType
    type() const = 0;

    /** Bring any time dependent state forward to `now`. */
    virtual void
    refresh(LedgerTime now);

    /** Rebase the policy after senior assets changed outside of profit
        distribution. Accrual up to `now` uses the previous base.
    */
    virtual void
    resync(Amount const& seniorAssets, LedgerTime now);

    /** Split `profit` so that senior + junior == profit exactly.

        Callers must refresh() first.
    */
    virtual Expected<ProfitSplit, TER>
    splitProfit(Amount const& profit, TrancheAssets const& assets) = 0;

    virtual Json::Value
    getJson() const;
};

//------------------------------------------------------------------------------

/** Senior receives its asset-weighted share of profit minus a risk
    adjustment that goes to junior.
*/
class RiskAdjustedTranchesPolicy final : public TranchesPolicy
{
    std::uint32_t riskAdjustmentBps_;

public:
    explicit RiskAdjustedTranchesPolicy(std::uint32_t riskAdjustmentBps);

    std::unique_ptr<TranchesPolicy>
    clone() const override;

    TranchesPolicyType
    type() const override
    {
        return TranchesPolicyType::riskAdjusted;
    }

    Expected<ProfitSplit, TER>
    splitProfit(Amount const& profit, TrancheAssets const& assets) override;

    Json::Value
    getJson() const override;
};

//------------------------------------------------------------------------------

/** Yield owed to the senior tranche under a fixed yield policy. */
struct SeniorYieldTracker
{
    // Base the yield accrues on.
    Amount totalAssets;
    // Accrued yield not yet paid out of profit.
    Amount unpaidYield;
    LedgerDay lastUpdatedDay{};
};

/** Senior receives a fixed yield accrued daily on its assets, paid from
    profit as far as profit allows; junior receives the rest.
*/
class FixedSeniorYieldTranchesPolicy final : public TranchesPolicy
{
    std::uint32_t yieldBps_;
    SeniorYieldTracker tracker_;

public:
    explicit FixedSeniorYieldTranchesPolicy(std::uint32_t yieldBps);

    std::unique_ptr<TranchesPolicy>
    clone() const override;

    TranchesPolicyType
    type() const override
    {
        return TranchesPolicyType::fixedSeniorYield;
    }

    void
    refresh(LedgerTime now) override;

    void
    resync(Amount const& seniorAssets, LedgerTime now) override;

    Expected<ProfitSplit, TER>
    splitProfit(Amount const& profit, TrancheAssets const& assets) override;

    SeniorYieldTracker const&
    tracker() const
    {
        return tracker_;
    }

    Json::Value
    getJson() const override;
};

//------------------------------------------------------------------------------

std::unique_ptr<TranchesPolicy>
makeTranchesPolicy(PoolConfig const& config);

/** Apply a loss to the tranches, junior first.

    The loss must not exceed the total tranche assets.
*/
TrancheLossSplit
distributeLoss(Amount const& loss, TrancheAssets const& assets);

/** Apply a recovery to the tranches, senior first, each up to its
    outstanding loss. Whatever is left is returned in `remaining`.
*/
TrancheRecoverySplit
distributeLossRecovery(
    Amount const& recovery,
    TrancheAssets const& assets,
    TrancheLosses const& losses);

}  // namespace strata

#endif
