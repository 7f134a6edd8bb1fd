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

#include <strata/basics/Log.h>
#include <strata/basics/instrumentation.h>
#include <strata/ledger/Pool.h>
#include <strata/protocol/Protocol.h>
#include <strata/protocol/jss.h>

#include <algorithm>
#include <utility>

namespace strata {

Pool::Pool(std::shared_ptr<PoolConfig const> config, Journal j)
    : config_(std::move(config)), policy_(makeTranchesPolicy(*config_)), j_(j)
{
    covers_.reserve(config_->covers.size());
    for (auto const& cover : config_->covers)
        covers_.emplace_back(cover);
}

Pool::Pool(Pool const& other)
    : config_(other.config_)
    , policy_(other.policy_->clone())
    , covers_(other.covers_)
    , assets_(other.assets_)
    , losses_(other.losses_)
    , j_(other.j_)
{
}

Pool&
Pool::operator=(Pool const& other)
{
    if (this != &other)
    {
        config_ = other.config_;
        policy_ = other.policy_->clone();
        covers_ = other.covers_;
        assets_ = other.assets_;
        losses_ = other.losses_;
        j_ = other.j_;
    }
    return *this;
}

FirstLossCover*
Pool::cover(std::size_t index)
{
    if (index >= covers_.size())
        return nullptr;
    return &covers_[index];
}

Expected<ProfitDistribution, TER>
Pool::distributeProfit(Amount const& poolProfit, LedgerTime now)
{
    ProfitDistribution result;
    result.coverProfits.resize(covers_.size());
    if (!poolProfit)
        return result;

    policy_->refresh(now);
    auto const split = policy_->splitProfit(poolProfit, assets_);
    if (!split)
    {
        JLOG(j_.debug()) << "distributeProfit: tranche policy rejected "
                         << poolProfit << ": " << transToken(split.error());
        return Unexpected(split.error());
    }

    auto const allocation =
        allocateNonSeniorProfit(split->junior, assets_.junior, covers_);

    assets_.senior += split->senior;
    assets_.junior += allocation.juniorProfit;
    for (std::size_t i = 0; i < covers_.size(); ++i)
        covers_[i].addCoverAssets(allocation.coverProfits[i]);
    policy_->resync(assets_.senior, now);

    result.seniorProfit = split->senior;
    result.juniorProfit = allocation.juniorProfit;
    result.coverProfits = allocation.coverProfits;

    Amount distributed = result.seniorProfit + result.juniorProfit;
    for (auto const& share : result.coverProfits)
        distributed += share;
    STRATA_ASSERT(
        distributed == poolProfit,
        "strata::Pool::distributeProfit : profit fully distributed");

    JLOG(j_.debug()) << "distributeProfit: " << poolProfit
                     << " senior=" << result.seniorProfit
                     << " junior=" << result.juniorProfit;
    return result;
}

Expected<LossDistribution, TER>
Pool::distributeLoss(Amount const& loss, LedgerTime now)
{
    LossDistribution result;
    result.coverLosses.resize(covers_.size());
    if (!loss)
        return result;

    // Covers only ever pay part of what reaches them, so walk them on the
    // side first to learn how much the tranches must take.
    Amount remaining = loss;
    for (std::size_t i = 0; i < covers_.size() && remaining; ++i)
    {
        result.coverLosses[i] = covers_[i].calcLossCover(remaining);
        remaining -= result.coverLosses[i];
    }

    if (remaining > assets_.total())
    {
        JLOG(j_.warn()) << "distributeLoss: loss " << loss
                        << " exceeds cover and tranche assets";
        return Unexpected(temLOSS_EXCEEDS_ASSETS);
    }

    Amount left = loss;
    for (std::size_t i = 0; i < covers_.size() && left; ++i)
        left = covers_[i].coverLoss(left);
    STRATA_ASSERT(
        left == remaining,
        "strata::Pool::distributeLoss : covers absorbed the planned amounts");

    auto const split = strata::distributeLoss(remaining, assets_);
    assets_ = split.assets;
    losses_.senior += split.lossDelta.senior;
    losses_.junior += split.lossDelta.junior;
    result.trancheLosses = split.lossDelta;

    policy_->resync(assets_.senior, now);

    JLOG(j_.debug()) << "distributeLoss: " << loss << " tranches took "
                     << remaining << " (junior=" << split.lossDelta.junior
                     << " senior=" << split.lossDelta.senior << ")";
    return result;
}

Expected<RecoveryDistribution, TER>
Pool::distributeLossRecovery(Amount const& recovery, LedgerTime now)
{
    RecoveryDistribution result;
    result.coverRecoveries.resize(covers_.size());
    if (!recovery)
        return result;

    Amount outstanding = losses_.total();
    for (auto const& cover : covers_)
        outstanding += cover.coveredLoss();
    if (recovery > outstanding)
    {
        JLOG(j_.warn()) << "distributeLossRecovery: recovery " << recovery
                        << " exceeds outstanding loss " << outstanding;
        return Unexpected(temRECOVERY_EXCEEDS_LOSS);
    }

    auto const split =
        strata::distributeLossRecovery(recovery, assets_, losses_);
    for (auto const tranche : allTranches)
        result.trancheRecoveries[tranche] =
            split.assets[tranche] - assets_[tranche];
    assets_ = split.assets;
    losses_ = split.losses;

    Amount remaining = split.remaining;
    for (auto i = covers_.size(); i-- > 0 && remaining;)
    {
        auto const before = remaining;
        remaining = covers_[i].recoverLoss(remaining);
        result.coverRecoveries[i] = before - remaining;
    }

    STRATA_ASSERT(
        !remaining,
        "strata::Pool::distributeLossRecovery : recovery fully applied");

    policy_->resync(assets_.senior, now);

    JLOG(j_.debug()) << "distributeLossRecovery: " << recovery
                     << " senior=" << result.trancheRecoveries.senior
                     << " junior=" << result.trancheRecoveries.junior;
    return result;
}

void
Pool::updateTranchesAssets(TrancheAssets const& assets, LedgerTime now)
{
    assets_ = assets;
    policy_->resync(assets_.senior, now);
}

Amount
Pool::minJuniorAssets(Amount const& seniorAssets) const
{
    return mulDivCeil(
        seniorAssets, bipsPerUnity, Amount{config_->maxSeniorJuniorRatioBps});
}

Amount
Pool::trancheAvailableCap(Tranche tranche) const
{
    auto const total = assets_.total();
    auto cap = saturatingSub(config_->liquidityCap, total);
    if (tranche == Tranche::senior)
    {
        auto const maxSenior = mulDiv(
            assets_.junior,
            Amount{config_->maxSeniorJuniorRatioBps},
            bipsPerUnity);
        cap = std::min(cap, saturatingSub(maxSenior, assets_.senior));
    }
    return cap;
}

Json::Value
Pool::getJson() const
{
    Json::Value ret(Json::objectValue);

    Json::Value& assets = ret[jss::total_assets] = Json::objectValue;
    assets[jss::senior] = to_string(assets_.senior);
    assets[jss::junior] = to_string(assets_.junior);

    Json::Value& losses = ret[jss::losses] = Json::objectValue;
    losses[jss::senior] = to_string(losses_.senior);
    losses[jss::junior] = to_string(losses_.junior);

    Json::Value& covers = ret[jss::first_loss_covers] = Json::arrayValue;
    for (std::size_t i = 0; i < covers_.size(); ++i)
    {
        auto cover = covers_[i].getJson();
        cover[jss::index] = static_cast<Json::UInt>(i);
        covers.append(cover);
    }

    ret[jss::policy] = policy_->getJson();
    return ret;
}

}  // namespace strata
