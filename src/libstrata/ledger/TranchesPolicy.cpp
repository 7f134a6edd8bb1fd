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
#include <strata/ledger/TranchesPolicy.h>
#include <strata/protocol/Protocol.h>
#include <strata/protocol/jss.h>

#include <algorithm>

namespace strata {

void
TranchesPolicy::refresh(LedgerTime)
{
}

void
TranchesPolicy::resync(Amount const&, LedgerTime)
{
}

Json::Value
TranchesPolicy::getJson() const
{
    Json::Value ret(Json::objectValue);
    ret[jss::type] = to_string(type());
    return ret;
}

//------------------------------------------------------------------------------

RiskAdjustedTranchesPolicy::RiskAdjustedTranchesPolicy(
    std::uint32_t riskAdjustmentBps)
    : riskAdjustmentBps_(riskAdjustmentBps)
{
}

std::unique_ptr<TranchesPolicy>
RiskAdjustedTranchesPolicy::clone() const
{
    return std::make_unique<RiskAdjustedTranchesPolicy>(*this);
}

Expected<ProfitSplit, TER>
RiskAdjustedTranchesPolicy::splitProfit(
    Amount const& profit,
    TrancheAssets const& assets)
{
    auto const total = assets.total();
    if (!total)
        return Unexpected(temZERO_TOTAL_ASSETS);

    auto const raw = mulDiv(profit, assets.senior, total);
    auto const seniorProfit = raw - bipsOfValue(raw, riskAdjustmentBps_);
    return ProfitSplit{seniorProfit, profit - seniorProfit};
}

Json::Value
RiskAdjustedTranchesPolicy::getJson() const
{
    auto ret = TranchesPolicy::getJson();
    ret[jss::risk_adjustment_bps] = riskAdjustmentBps_;
    return ret;
}

//------------------------------------------------------------------------------

FixedSeniorYieldTranchesPolicy::FixedSeniorYieldTranchesPolicy(
    std::uint32_t yieldBps)
    : yieldBps_(yieldBps)
{
}

std::unique_ptr<TranchesPolicy>
FixedSeniorYieldTranchesPolicy::clone() const
{
    return std::make_unique<FixedSeniorYieldTranchesPolicy>(*this);
}

void
FixedSeniorYieldTranchesPolicy::refresh(LedgerTime now)
{
    auto const today = toDay(now);
    auto const days = daysBetween(tracker_.lastUpdatedDay, today);
    if (days > 0 && tracker_.totalAssets)
    {
        tracker_.unpaidYield += mulDiv(
            tracker_.totalAssets,
            Amount{std::uint64_t{yieldBps_} * days},
            Amount{std::uint64_t{daysInYear} * bipsPerUnity});
    }
    if (today > tracker_.lastUpdatedDay)
        tracker_.lastUpdatedDay = today;
}

void
FixedSeniorYieldTranchesPolicy::resync(
    Amount const& seniorAssets,
    LedgerTime now)
{
    refresh(now);
    tracker_.totalAssets = seniorAssets;
}

Expected<ProfitSplit, TER>
FixedSeniorYieldTranchesPolicy::splitProfit(
    Amount const& profit,
    TrancheAssets const&)
{
    auto const seniorProfit = std::min(profit, tracker_.unpaidYield);
    tracker_.unpaidYield -= seniorProfit;
    return ProfitSplit{seniorProfit, profit - seniorProfit};
}

Json::Value
FixedSeniorYieldTranchesPolicy::getJson() const
{
    auto ret = TranchesPolicy::getJson();
    ret[jss::fixed_yield_bps] = yieldBps_;

    Json::Value tracker(Json::objectValue);
    tracker[jss::total_assets] = to_string(tracker_.totalAssets);
    tracker[jss::unpaid_yield] = to_string(tracker_.unpaidYield);
    tracker[jss::last_updated_day] = static_cast<Json::Int64>(
        tracker_.lastUpdatedDay.time_since_epoch().count());
    ret[jss::senior_yield_tracker] = tracker;
    return ret;
}

//------------------------------------------------------------------------------

std::unique_ptr<TranchesPolicy>
makeTranchesPolicy(PoolConfig const& config)
{
    switch (config.policyType)
    {
        case TranchesPolicyType::riskAdjusted:
            return std::make_unique<RiskAdjustedTranchesPolicy>(
                config.riskAdjustmentBps);
        case TranchesPolicyType::fixedSeniorYield:
            return std::make_unique<FixedSeniorYieldTranchesPolicy>(
                config.fixedYieldBps);
    }
    return nullptr;  // LCOV_EXCL_LINE
}

TrancheLossSplit
distributeLoss(Amount const& loss, TrancheAssets const& assets)
{
    STRATA_ASSERT(
        loss <= assets.total(),
        "strata::distributeLoss : loss within tranche assets");

    TrancheLossSplit result{assets, {}};
    result.lossDelta.junior = std::min(assets.junior, loss);
    result.lossDelta.senior = loss - result.lossDelta.junior;
    result.assets.junior -= result.lossDelta.junior;
    result.assets.senior -= result.lossDelta.senior;
    return result;
}

TrancheRecoverySplit
distributeLossRecovery(
    Amount const& recovery,
    TrancheAssets const& assets,
    TrancheLosses const& losses)
{
    TrancheRecoverySplit result{recovery, assets, losses};
    for (auto const tranche : allTranches)
    {
        auto const recovered =
            std::min(result.remaining, result.losses[tranche]);
        result.losses[tranche] -= recovered;
        result.assets[tranche] += recovered;
        result.remaining -= recovered;
    }
    return result;
}

}  // namespace strata
