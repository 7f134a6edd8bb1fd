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

#ifndef STRATA_LEDGER_LENDINGPOOL_H_INCLUDED
#define STRATA_LEDGER_LENDINGPOOL_H_INCLUDED

#include <strata/basics/Amount.h>
#include <strata/basics/Expected.h>
#include <strata/basics/Log.h>
#include <strata/basics/chrono.h>
#include <strata/ledger/EpochManager.h>
#include <strata/ledger/FeeCollector.h>
#include <strata/ledger/LiquidityReserve.h>
#include <strata/ledger/Pool.h>
#include <strata/ledger/TrancheVault.h>
#include <strata/protocol/PoolConfig.h>
#include <strata/protocol/TER.h>
#include <strata/protocol/Tranche.h>

#include <json/json.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace strata {

/** The capital structure of one lending pool.

    Owns the tranche asset ledger, both tranche vaults, the epoch manager
    and the pool safe, and is the only entry point that changes them.
    Calls are serialized. Each call runs against a copy of the state and
    the copy replaces the state only if the call succeeds, so a rejected
    or failed call leaves no trace.
*/
class LendingPool
{
    struct State
    {
        Pool pool;
        TrancheVault senior;
        TrancheVault junior;
        EpochManager epochs;
        PoolSafe safe;
        bool enabled = false;

        TrancheVault&
        vault(Tranche tranche)
        {
            return tranche == Tranche::senior ? senior : junior;
        }

        TrancheVault const&
        vault(Tranche tranche) const
        {
            return tranche == Tranche::senior ? senior : junior;
        }
    };

    std::shared_ptr<PoolConfig const> config_;
    std::unique_ptr<FeeCollector> fees_;
    Journal j_;
    std::mutex mutable mutex_;
    State state_;

public:
    LendingPool(PoolConfig config, Logs& logs);

    LendingPool(
        PoolConfig config,
        std::unique_ptr<FeeCollector> fees,
        Logs& logs);

    LendingPool(LendingPool const&) = delete;
    LendingPool&
    operator=(LendingPool const&) = delete;

    PoolConfig const&
    config() const
    {
        return *config_;
    }

    /** Turn the pool on. The first call opens epoch 1. */
    TER
    enablePool(LedgerTime now);

    TER
    disablePool();

    bool
    isEnabled() const;

    /** Deposit assets into a tranche and return the shares minted. */
    Expected<Amount, TER>
    deposit(
        Tranche tranche,
        LenderID const& lender,
        Amount const& amount,
        LedgerTime now);

    TER
    addRedemptionRequest(
        Tranche tranche,
        LenderID const& lender,
        Amount const& shares,
        LedgerTime now);

    TER
    cancelRedemptionRequest(
        Tranche tranche,
        LenderID const& lender,
        Amount const& shares);

    Amount
    cancellableRedemptionShares(Tranche tranche, LenderID const& lender)
        const;

    Amount
    computeWithdrawable(Tranche tranche, LenderID const& lender) const;

    Expected<Amount, TER>
    disburse(Tranche tranche, LenderID const& lender);

    /** Take fees from `profit` and run the rest through the waterfall.
        Fees are charged only if the waterfall succeeds.
    */
    Expected<ProfitDistribution, TER>
    distributeProfit(Amount const& profit, LedgerTime now);

    Expected<LossDistribution, TER>
    distributeLoss(Amount const& loss, LedgerTime now);

    Expected<RecoveryDistribution, TER>
    distributeLossRecovery(Amount const& recovery, LedgerTime now);

    Expected<RedemptionSummary, TER>
    closeEpoch(LedgerTime now);

    TER
    depositCover(std::size_t index, Amount const& amount);

    TER
    redeemCover(std::size_t index, Amount const& amount);

    /** Returns std::nullopt for an unknown cover. */
    std::optional<bool>
    isCoverSufficient(std::size_t index) const;

    /** Lend cash out of the safe. Cash reserved for redemptions stays. */
    TER
    drawdown(Amount const& amount);

    /** Return lent cash to the safe. */
    TER
    repay(Amount const& amount);

    TrancheAssets
    assets() const;

    TrancheLosses
    losses() const;

    Amount
    trancheAvailableCap(Tranche tranche) const;

    Amount
    balanceOf(Tranche tranche, LenderID const& lender) const;

    std::uint64_t
    currentEpochId() const;

    Json::Value
    getJson() const;

private:
    /** Run `f` on a copy of the state and keep the copy on success. */
    TER
    apply(char const* operation, std::function<TER(State&)> const& f);

    // Same as apply, for callers already holding mutex_.
    TER
    applyLocked(char const* operation, std::function<TER(State&)> const& f);
};

}  // namespace strata

#endif
