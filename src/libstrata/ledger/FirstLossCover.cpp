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

#include <strata/ledger/FirstLossCover.h>
#include <strata/protocol/Protocol.h>
#include <strata/protocol/jss.h>

#include <algorithm>
#include <utility>

namespace strata {

FirstLossCover::FirstLossCover(FirstLossCoverConfig config)
    : config_(std::move(config))
{
}

Amount
FirstLossCover::calcLossCover(Amount const& loss) const
{
    return std::min(
        {bipsOfValue(loss, config_.coverRatePerLossBps),
         config_.coverCapPerLoss,
         totalAssets_});
}

Amount
FirstLossCover::coverLoss(Amount const& loss)
{
    auto const covered = calcLossCover(loss);
    totalAssets_ -= covered;
    coveredLoss_ += covered;
    return loss - covered;
}

Amount
FirstLossCover::calcLossRecover(Amount const& recovery) const
{
    return std::min(coveredLoss_, recovery);
}

Amount
FirstLossCover::recoverLoss(Amount const& recovery)
{
    auto const recovered = calcLossRecover(recovery);
    totalAssets_ += recovered;
    coveredLoss_ -= recovered;
    return recovery - recovered;
}

Amount
FirstLossCover::weight() const
{
    return mulDiv(
        totalAssets_, Amount{config_.riskYieldMultiplierBps}, bipsPerUnity);
}

void
FirstLossCover::addCoverAssets(Amount const& amount)
{
    totalAssets_ += amount;
}

TER
FirstLossCover::depositCover(Amount const& amount)
{
    if (!amount)
        return temBAD_AMOUNT;
    if (amount > saturatingSub(config_.maxLiquidity, totalAssets_))
        return terCOVER_CAP;
    totalAssets_ += amount;
    return tesSUCCESS;
}

TER
FirstLossCover::redeemCover(Amount const& amount)
{
    if (!amount)
        return temBAD_AMOUNT;
    if (amount > availableCapacity())
        return temINSUFFICIENT_COVER;
    totalAssets_ -= amount;
    return tesSUCCESS;
}

Amount
FirstLossCover::availableCapacity() const
{
    return saturatingSub(totalAssets_, config_.minLiquidity);
}

Json::Value
FirstLossCover::getJson() const
{
    Json::Value ret(Json::objectValue);
    ret[jss::name] = config_.name;
    ret[jss::total_assets] = to_string(totalAssets_);
    ret[jss::covered_loss] = to_string(coveredLoss_);
    ret[jss::cover_rate_per_loss_bps] = config_.coverRatePerLossBps;
    ret[jss::cover_cap_per_loss] = to_string(config_.coverCapPerLoss);
    ret[jss::risk_yield_multiplier_bps] = config_.riskYieldMultiplierBps;
    ret[jss::min_liquidity] = to_string(config_.minLiquidity);
    ret[jss::max_liquidity] = to_string(config_.maxLiquidity);
    return ret;
}

//------------------------------------------------------------------------------

CoverProfitAllocation
allocateNonSeniorProfit(
    Amount const& nonSeniorProfit,
    Amount const& juniorAssets,
    std::vector<FirstLossCover> const& covers)
{
    CoverProfitAllocation result;
    result.coverProfits.resize(covers.size());
    result.juniorProfit = nonSeniorProfit;

    std::vector<Amount> weights;
    weights.reserve(covers.size());
    Amount totalWeight = juniorAssets;
    for (auto const& cover : covers)
    {
        weights.push_back(cover.weight());
        totalWeight += weights.back();
    }

    if (!totalWeight || !nonSeniorProfit)
        return result;

    for (std::size_t i = 0; i < covers.size(); ++i)
    {
        result.coverProfits[i] =
            mulDiv(nonSeniorProfit, weights[i], totalWeight);
        result.juniorProfit -= result.coverProfits[i];
    }

    return result;
}

}  // namespace strata
