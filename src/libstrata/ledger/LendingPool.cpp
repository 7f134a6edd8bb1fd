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

#include <strata/ledger/LendingPool.h>
#include <strata/protocol/jss.h>

#include <optional>
#include <stdexcept>
#include <utility>

namespace strata {

LendingPool::LendingPool(PoolConfig config, Logs& logs)
    : LendingPool(
          config,
          std::make_unique<FlatRateFeeCollector>(config.fees),
          logs)
{
}

LendingPool::LendingPool(
    PoolConfig config,
    std::unique_ptr<FeeCollector> fees,
    Logs& logs)
    : config_(std::make_shared<PoolConfig const>(std::move(config)))
    , fees_(std::move(fees))
    , j_(logs.journal("LendingPool"))
    , state_{
          Pool(config_, logs.journal("Pool")),
          TrancheVault(Tranche::senior, logs.journal("TrancheVault")),
          TrancheVault(Tranche::junior, logs.journal("TrancheVault")),
          EpochManager(config_, logs.journal("EpochManager")),
          PoolSafe{},
          false}
{
}

TER
LendingPool::apply(char const* operation, std::function<TER(State&)> const& f)
{
    std::lock_guard lock(mutex_);
    return applyLocked(operation, f);
}

TER
LendingPool::applyLocked(
    char const* operation,
    std::function<TER(State&)> const& f)
{
    TER result = tesSUCCESS;
    try
    {
        State sandbox = state_;
        result = f(sandbox);
        if (isTesSuccess(result))
            state_ = std::move(sandbox);
    }
    catch (std::overflow_error const& e)
    {
        JLOG(j_.fatal()) << operation << ": arithmetic overflow: " << e.what();
        result = tefOVERFLOW;
    }
    catch (std::underflow_error const& e)
    {
        JLOG(j_.fatal()) << operation << ": arithmetic underflow: " << e.what();
        result = tefOVERFLOW;
    }
    catch (std::exception const& e)
    {
        JLOG(j_.fatal()) << operation << ": exception: " << e.what();
        result = tefEXCEPTION;
    }

    if (!isTesSuccess(result))
        JLOG(j_.debug()) << operation << ": " << transToken(result) << " ("
                         << transHuman(result) << ")";
    return result;
}

TER
LendingPool::enablePool(LedgerTime now)
{
    return apply("enablePool", [&](State& state) -> TER {
        state.enabled = true;
        if (state.epochs.currentEpochId() == 0)
            state.epochs.startNewEpoch(now);
        JLOG(j_.info()) << "Pool enabled";
        return tesSUCCESS;
    });
}

TER
LendingPool::disablePool()
{
    return apply("disablePool", [&](State& state) -> TER {
        state.enabled = false;
        JLOG(j_.info()) << "Pool disabled";
        return tesSUCCESS;
    });
}

bool
LendingPool::isEnabled() const
{
    std::lock_guard lock(mutex_);
    return state_.enabled;
}

Expected<Amount, TER>
LendingPool::deposit(
    Tranche tranche,
    LenderID const& lender,
    Amount const& amount,
    LedgerTime now)
{
    Amount minted;
    auto const ter = apply("deposit", [&](State& state) -> TER {
        if (!state.enabled)
            return terPOOL_DISABLED;
        if (lender == TrancheVault::escrowAccount())
            return temMALFORMED;
        if (!amount)
            return temBAD_AMOUNT;
        if (amount < config_->minDeposit)
            return temBELOW_MIN_DEPOSIT;

        auto assets = state.pool.assets();
        if (amount > saturatingSub(config_->liquidityCap, assets.total()))
            return terLIQUIDITY_CAP;
        if (tranche == Tranche::senior &&
            amount > state.pool.trancheAvailableCap(Tranche::senior))
            return terSENIOR_RATIO;

        auto& vault = state.vault(tranche);
        auto const shares = vault.convertToShares(amount, assets[tranche]);
        if (!shares)
            return shares.error();
        if (!*shares)
            return temBAD_AMOUNT;

        vault.deposit(lender, *shares, now);
        state.safe.deposit(lender, amount);
        assets[tranche] += amount;
        state.pool.updateTranchesAssets(assets, now);
        minted = *shares;

        JLOG(j_.debug()) << lender << " deposited " << amount << " into "
                         << to_string(tranche) << " for " << minted
                         << " shares";
        return tesSUCCESS;
    });
    if (ter)
        return Unexpected(ter);
    return minted;
}

TER
LendingPool::addRedemptionRequest(
    Tranche tranche,
    LenderID const& lender,
    Amount const& shares,
    LedgerTime now)
{
    return apply("addRedemptionRequest", [&](State& state) -> TER {
        if (!state.enabled)
            return terPOOL_DISABLED;
        return state.vault(tranche).addRedemptionRequest(
            lender,
            shares,
            state.epochs.currentEpochId(),
            now,
            config_->withdrawalLockout);
    });
}

TER
LendingPool::cancelRedemptionRequest(
    Tranche tranche,
    LenderID const& lender,
    Amount const& shares)
{
    return apply("cancelRedemptionRequest", [&](State& state) -> TER {
        if (!state.enabled)
            return terPOOL_DISABLED;
        return state.vault(tranche).cancelRedemptionRequest(
            lender, shares, state.epochs.currentEpochId());
    });
}

Amount
LendingPool::cancellableRedemptionShares(
    Tranche tranche,
    LenderID const& lender) const
{
    std::lock_guard lock(mutex_);
    return state_.vault(tranche).cancellableRedemptionShares(
        lender, state_.epochs.currentEpochId());
}

Amount
LendingPool::computeWithdrawable(Tranche tranche, LenderID const& lender)
    const
{
    std::lock_guard lock(mutex_);
    return state_.vault(tranche).computeWithdrawable(lender).amount;
}

Expected<Amount, TER>
LendingPool::disburse(Tranche tranche, LenderID const& lender)
{
    Amount paid;
    auto const ter = apply("disburse", [&](State& state) -> TER {
        auto const result = state.vault(tranche).disburse(lender);
        if (!result)
            return result.error();
        paid = *result;
        return tesSUCCESS;
    });
    if (ter)
        return Unexpected(ter);
    return paid;
}

Expected<ProfitDistribution, TER>
LendingPool::distributeProfit(Amount const& profit, LedgerTime now)
{
    std::lock_guard lock(mutex_);

    // Fees accrue on a copy of the collector that is kept only if the
    // waterfall commits.
    auto fees = fees_->clone();
    ProfitDistribution distribution;
    auto const ter = applyLocked("distributeProfit", [&](State& state) -> TER {
        auto const poolProfit = fees->distributePoolFees(profit);
        auto const result = state.pool.distributeProfit(poolProfit, now);
        if (!result)
            return result.error();
        distribution = *result;
        return tesSUCCESS;
    });
    if (ter)
        return Unexpected(ter);

    fees_ = std::move(fees);
    return distribution;
}

Expected<LossDistribution, TER>
LendingPool::distributeLoss(Amount const& loss, LedgerTime now)
{
    LossDistribution distribution;
    auto const ter = apply("distributeLoss", [&](State& state) -> TER {
        auto const result = state.pool.distributeLoss(loss, now);
        if (!result)
            return result.error();
        distribution = *result;
        return tesSUCCESS;
    });
    if (ter)
        return Unexpected(ter);
    return distribution;
}

Expected<RecoveryDistribution, TER>
LendingPool::distributeLossRecovery(Amount const& recovery, LedgerTime now)
{
    RecoveryDistribution distribution;
    auto const ter = apply("distributeLossRecovery", [&](State& state) -> TER {
        auto const result = state.pool.distributeLossRecovery(recovery, now);
        if (!result)
            return result.error();
        distribution = *result;
        return tesSUCCESS;
    });
    if (ter)
        return Unexpected(ter);
    return distribution;
}

Expected<RedemptionSummary, TER>
LendingPool::closeEpoch(LedgerTime now)
{
    RedemptionSummary summary;
    auto const ter = apply("closeEpoch", [&](State& state) -> TER {
        if (!state.enabled)
            return terPOOL_DISABLED;
        auto const result = state.epochs.closeEpoch(
            state.pool, state.senior, state.junior, state.safe, now);
        if (!result)
            return result.error();
        summary = *result;
        return tesSUCCESS;
    });
    if (ter)
        return Unexpected(ter);
    return summary;
}

TER
LendingPool::depositCover(std::size_t index, Amount const& amount)
{
    return apply("depositCover", [&](State& state) -> TER {
        auto const cover = state.pool.cover(index);
        if (!cover)
            return temBAD_COVER;
        return cover->depositCover(amount);
    });
}

TER
LendingPool::redeemCover(std::size_t index, Amount const& amount)
{
    return apply("redeemCover", [&](State& state) -> TER {
        auto const cover = state.pool.cover(index);
        if (!cover)
            return temBAD_COVER;
        return cover->redeemCover(amount);
    });
}

std::optional<bool>
LendingPool::isCoverSufficient(std::size_t index) const
{
    std::lock_guard lock(mutex_);
    auto const& covers = state_.pool.covers();
    if (index >= covers.size())
        return std::nullopt;
    return covers[index].isSufficient();
}

TER
LendingPool::drawdown(Amount const& amount)
{
    return apply("drawdown", [&](State& state) -> TER {
        if (!amount)
            return temBAD_AMOUNT;
        if (amount > state.safe.availableForLending())
            return terNO_LIQUIDITY;
        state.safe.withdraw("credit", amount);
        return tesSUCCESS;
    });
}

TER
LendingPool::repay(Amount const& amount)
{
    return apply("repay", [&](State& state) -> TER {
        if (!amount)
            return temBAD_AMOUNT;
        state.safe.deposit("credit", amount);
        return tesSUCCESS;
    });
}

TrancheAssets
LendingPool::assets() const
{
    std::lock_guard lock(mutex_);
    return state_.pool.assets();
}

TrancheLosses
LendingPool::losses() const
{
    std::lock_guard lock(mutex_);
    return state_.pool.losses();
}

Amount
LendingPool::trancheAvailableCap(Tranche tranche) const
{
    std::lock_guard lock(mutex_);
    return state_.pool.trancheAvailableCap(tranche);
}

Amount
LendingPool::balanceOf(Tranche tranche, LenderID const& lender) const
{
    std::lock_guard lock(mutex_);
    return state_.vault(tranche).balanceOf(lender);
}

std::uint64_t
LendingPool::currentEpochId() const
{
    std::lock_guard lock(mutex_);
    return state_.epochs.currentEpochId();
}

Json::Value
LendingPool::getJson() const
{
    std::lock_guard lock(mutex_);

    Json::Value ret(Json::objectValue);
    ret[jss::enabled] = state_.enabled;
    ret[jss::current_epoch] = state_.epochs.getJson();

    auto pool = state_.pool.getJson();
    Json::Value& tranches = ret[jss::tranches] = Json::objectValue;
    for (auto const tranche : allTranches)
    {
        auto const& vault = state_.vault(tranche);
        Json::Value& t = tranches[to_string(tranche)] = vault.getJson();
        t[jss::total_assets] = pool[jss::total_assets][to_string(tranche)];
        t[jss::losses] = pool[jss::losses][to_string(tranche)];
        t[jss::share_price] = to_string(computeSharePrice(
            state_.pool.assets()[tranche], vault.totalSupply()));
    }

    ret[jss::first_loss_covers] = pool[jss::first_loss_covers];
    ret[jss::policy] = pool[jss::policy];
    ret[jss::liquidity] = state_.safe.getJson();
    ret[jss::fees] = fees_->getJson();
    return ret;
}

}  // namespace strata
