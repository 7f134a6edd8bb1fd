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

#include <strata/ledger/FeeCollector.h>
#include <strata/protocol/jss.h>

namespace strata {

FlatRateFeeCollector::FlatRateFeeCollector(FeeConfig const& config)
    : config_(config)
{
}

std::unique_ptr<FeeCollector>
FlatRateFeeCollector::clone() const
{
    return std::make_unique<FlatRateFeeCollector>(*this);
}

PoolFeeDistribution
FlatRateFeeCollector::calcPoolFeeDistribution(Amount const& profit) const
{
    PoolFeeDistribution result;
    result.protocolFee = bipsOfValue(profit, config_.protocolFeeBps);
    auto const remaining = profit - result.protocolFee;
    result.poolOwnerReward = bipsOfValue(remaining, config_.poolOwnerRewardBps);
    result.evaluationAgentReward =
        bipsOfValue(remaining, config_.evaluationAgentRewardBps);
    result.poolProfit =
        remaining - result.poolOwnerReward - result.evaluationAgentReward;
    return result;
}

Amount
FlatRateFeeCollector::distributePoolFees(Amount const& profit)
{
    auto const fees = calcPoolFeeDistribution(profit);
    protocolIncome_ += fees.protocolFee;
    poolOwnerIncome_ += fees.poolOwnerReward;
    evaluationAgentIncome_ += fees.evaluationAgentReward;
    return fees.poolProfit;
}

Json::Value
FlatRateFeeCollector::getJson() const
{
    Json::Value ret(Json::objectValue);
    ret[jss::protocol] = to_string(protocolIncome_);
    ret[jss::pool_owner] = to_string(poolOwnerIncome_);
    ret[jss::evaluation_agent] = to_string(evaluationAgentIncome_);
    return ret;
}

}  // namespace strata
