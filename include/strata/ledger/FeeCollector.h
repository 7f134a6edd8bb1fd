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

#ifndef STRATA_LEDGER_FEECOLLECTOR_H_INCLUDED
#define STRATA_LEDGER_FEECOLLECTOR_H_INCLUDED

#include <strata/basics/Amount.h>
#include <strata/protocol/PoolConfig.h>

#include <json/json.h>

#include <memory>

namespace strata {

/** Fee cuts taken out of a profit and what is left for the pool. */
struct PoolFeeDistribution
{
    Amount protocolFee;
    Amount poolOwnerReward;
    Amount evaluationAgentReward;
    Amount poolProfit;
};

/** Takes the protocol, pool owner and evaluation agent cuts from profit
    before it reaches the tranches.
*/
class FeeCollector
{
public:
    virtual ~FeeCollector() = default;

    virtual std::unique_ptr<FeeCollector>
    clone() const = 0;

    /** Compute the cuts without recording them. */
    virtual PoolFeeDistribution
    calcPoolFeeDistribution(Amount const& profit) const = 0;

    /** Record the cuts and return the profit left for the pool. */
    virtual Amount
    distributePoolFees(Amount const& profit) = 0;

    virtual Json::Value
    getJson() const = 0;
};

/** Takes fixed basis point cuts and accrues them per recipient. */
class FlatRateFeeCollector final : public FeeCollector
{
    FeeConfig config_;
    Amount protocolIncome_;
    Amount poolOwnerIncome_;
    Amount evaluationAgentIncome_;

public:
    explicit FlatRateFeeCollector(FeeConfig const& config);

    std::unique_ptr<FeeCollector>
    clone() const override;

    PoolFeeDistribution
    calcPoolFeeDistribution(Amount const& profit) const override;

    Amount
    distributePoolFees(Amount const& profit) override;

    Json::Value
    getJson() const override;
};

}  // namespace strata

#endif
