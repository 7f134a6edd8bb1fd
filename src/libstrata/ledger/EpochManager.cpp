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
#include <strata/ledger/EpochManager.h>
#include <strata/protocol/Protocol.h>
#include <strata/protocol/jss.h>

#include <boost/multiprecision/cpp_int.hpp>

#include <algorithm>
#include <array>
#include <initializer_list>
#include <vector>

namespace strata {

namespace detail {

inline bool
withinSeniorRatio(TrancheAssets const& assets, std::uint32_t ratioBps)
{
    using wide = boost::multiprecision::uint256_t;
    return wide(assets.junior.value()) * ratioBps >=
        wide(assets.senior.value()) * bipsPerUnity;
}

/** Settlement state of one tranche while an epoch close runs. */
struct TrancheRedemption
{
    Tranche tranche;
    SharePrice price;
    std::vector<EpochInfo> mature;
    std::vector<EpochInfo> immature;
    std::vector<EpochSettlement> settlements;
    Amount sharesProcessed;
    Amount amountProcessed;
};

class RedemptionProcessor
{
    Pool const& pool_;
    TrancheAssets assets_;
    Amount available_;

public:
    RedemptionProcessor(Pool const& pool, Amount const& available)
        : pool_(pool), assets_(pool.assets()), available_(available)
    {
    }

    TrancheAssets const&
    assets() const
    {
        return assets_;
    }

    // Fill `epochs` oldest first until liquidity or the junior cap runs
    // out. An epoch left short stops the walk so no later epoch of the
    // tranche is filled ahead of it.
    void
    process(TrancheRedemption& redemption, std::vector<EpochInfo>& epochs)
    {
        if (redemption.price == 0)
            return;

        for (auto& epoch : epochs)
        {
            if (!available_)
                return;

            auto const remaining = epoch.unprocessedShares();
            if (!remaining)
                continue;

            auto maxShares = amountToShares(available_, redemption.price);
            if (redemption.tranche == Tranche::junior)
            {
                auto const cap = saturatingSub(
                    assets_.junior, pool_.minJuniorAssets(assets_.senior));
                maxShares =
                    std::min(maxShares, amountToShares(cap, redemption.price));
            }

            auto const shares = std::min(remaining, maxShares);
            if (!shares)
                return;

            auto const amount = sharesToAmount(shares, redemption.price);
            epoch.totalSharesProcessed += shares;
            epoch.totalAmountProcessed += amount;
            available_ -= amount;
            assets_[redemption.tranche] -= amount;
            redemption.sharesProcessed += shares;
            redemption.amountProcessed += amount;

            auto const it = std::find_if(
                redemption.settlements.begin(),
                redemption.settlements.end(),
                [&](EpochSettlement const& s) {
                    return s.epochId == epoch.epochId;
                });
            if (it == redemption.settlements.end())
                redemption.settlements.push_back(
                    {epoch.epochId, shares, amount});
            else
            {
                it->sharesProcessed += shares;
                it->amountProcessed += amount;
            }

            if (shares < remaining)
                return;
        }
    }
};

}  // namespace detail

EpochManager::EpochManager(std::shared_ptr<PoolConfig const> config, Journal j)
    : config_(std::move(config)), j_(j)
{
}

void
EpochManager::startNewEpoch(LedgerTime now)
{
    auto endTime = current_.endTime;
    if (endTime == LedgerTime{} || endTime > now)
        endTime = now + config_->epochWindow;
    else
    {
        // Keep ends on the original schedule, skipping missed windows.
        auto const missed = (now - endTime) / config_->epochWindow;
        endTime += (missed + 1) * config_->epochWindow;
    }

    current_.id += 1;
    current_.endTime = endTime;

    JLOG(j_.info()) << "Epoch " << current_.id << " started, ends at "
                    << toSeconds(current_.endTime);
}

bool
EpochManager::isMature(std::uint64_t epochId) const
{
    return epochId + config_->flexWindowEpochs <= current_.id;
}

Expected<RedemptionSummary, TER>
EpochManager::closeEpoch(
    Pool& pool,
    TrancheVault& seniorVault,
    TrancheVault& juniorVault,
    LiquidityReserve& reserve,
    LedgerTime now)
{
    if (now < current_.endTime)
    {
        JLOG(j_.debug()) << "closeEpoch: epoch " << current_.id
                         << " ends at " << toSeconds(current_.endTime);
        return Unexpected(terEPOCH_NOT_ENDED);
    }

    auto const assets = pool.assets();
    std::array<TrancheVault*, 2> const vaults{&seniorVault, &juniorVault};

    std::array<detail::TrancheRedemption, 2> redemptions;
    bool demand = false;
    for (auto const tranche : allTranches)
    {
        auto& redemption = redemptions[static_cast<std::size_t>(tranche)];
        auto const& vault = *vaults[static_cast<std::size_t>(tranche)];
        redemption.tranche = tranche;
        redemption.price =
            computeSharePrice(assets[tranche], vault.totalSupply());
        for (auto const& epoch : vault.unprocessedEpochInfos())
        {
            demand = true;
            if (isMature(epoch.epochId))
                redemption.mature.push_back(epoch);
            else
                redemption.immature.push_back(epoch);
        }
    }

    auto const available = reserve.availableReservation();
    if (demand && !available)
    {
        JLOG(j_.info()) << "closeEpoch: epoch " << current_.id
                        << " has queued redemptions and no liquidity";
        return Unexpected(terNO_LIQUIDITY);
    }

    detail::RedemptionProcessor processor(pool, available);
    auto& senior = redemptions[static_cast<std::size_t>(Tranche::senior)];
    auto& junior = redemptions[static_cast<std::size_t>(Tranche::junior)];
    processor.process(senior, senior.mature);
    processor.process(junior, junior.mature);
    if (config_->flexWindowEpochs > 0)
    {
        // Mature epochs are revisited first so that an immature epoch is
        // never filled while an older one of its tranche is short.
        for (auto* redemption : {&senior, &junior})
        {
            processor.process(*redemption, redemption->mature);
            processor.process(*redemption, redemption->immature);
        }
    }

    RedemptionSummary summary;
    summary.closedEpochId = current_.id;
    for (auto const tranche : allTranches)
    {
        auto const& redemption = redemptions[static_cast<std::size_t>(tranche)];
        auto& vault = *vaults[static_cast<std::size_t>(tranche)];

        if (auto const ter = vault.applySettlement(redemption.settlements))
            return Unexpected(ter);
        if (redemption.amountProcessed)
            reserve.withdraw(to_string(tranche), redemption.amountProcessed);

        summary.sharesProcessed[tranche] = redemption.sharesProcessed;
        summary.amountProcessed[tranche] = redemption.amountProcessed;
    }

    pool.updateTranchesAssets(processor.assets(), now);

    auto const ratioBps = config_->maxSeniorJuniorRatioBps;
    STRATA_ASSERT(
        !detail::withinSeniorRatio(assets, ratioBps) ||
            detail::withinSeniorRatio(pool.assets(), ratioBps),
        "strata::EpochManager::closeEpoch : senior to junior ratio kept");

    for (auto const tranche : allTranches)
    {
        auto const& vault = *vaults[static_cast<std::size_t>(tranche)];
        auto const price =
            computeSharePrice(pool.assets()[tranche], vault.totalSupply());
        for (auto const& epoch : vault.unprocessedEpochInfos())
            summary.unmetDemand +=
                sharesToAmount(epoch.unprocessedShares(), price);
    }
    reserve.setReservationTarget(summary.unmetDemand);

    JLOG(j_.info()) << "Epoch " << current_.id << " closed: senior "
                    << summary.sharesProcessed.senior << " shares for "
                    << summary.amountProcessed.senior << ", junior "
                    << summary.sharesProcessed.junior << " shares for "
                    << summary.amountProcessed.junior << ", unmet "
                    << summary.unmetDemand;

    startNewEpoch(now);
    return summary;
}

Json::Value
EpochManager::getJson() const
{
    Json::Value ret(Json::objectValue);
    ret[jss::id] = static_cast<Json::UInt64>(current_.id);
    ret[jss::end_time] = static_cast<Json::Int64>(toSeconds(current_.endTime));
    return ret;
}

}  // namespace strata
