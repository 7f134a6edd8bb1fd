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

#ifndef STRATA_LEDGER_TRANCHEVAULT_H_INCLUDED
#define STRATA_LEDGER_TRANCHEVAULT_H_INCLUDED

#include <strata/basics/Amount.h>
#include <strata/basics/Expected.h>
#include <strata/basics/Journal.h>
#include <strata/basics/chrono.h>
#include <strata/ledger/ShareLedger.h>
#include <strata/protocol/TER.h>
#include <strata/protocol/Tranche.h>

#include <json/json.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace strata {

/** Redemption demand and fulfilment of one epoch in one tranche.

    An epoch is open while nothing is processed, partially filled while
    0 < processed < requested, and fulfilled once processed == requested.
    A fulfilled epoch is never touched again.
*/
struct EpochInfo
{
    std::uint64_t epochId = 0;
    Amount totalSharesRequested;
    Amount totalSharesProcessed;
    Amount totalAmountProcessed;

    bool
    fulfilled() const
    {
        return totalSharesProcessed == totalSharesRequested;
    }

    Amount
    unprocessedShares() const
    {
        return totalSharesRequested - totalSharesProcessed;
    }
};

/** One lender's request in one epoch. */
struct LenderRedemptionRequest
{
    std::uint64_t epochId = 0;
    Amount sharesRequested;
};

/** How far a lender's requests have been paid out.

    requestsIndex only moves forward. The partial fields hold what was
    already counted for the request at requestsIndex while its epoch is
    partially filled, and return to zero once the cursor moves past it.
*/
struct LenderDisbursementCursor
{
    std::size_t requestsIndex = 0;
    Amount partialSharesProcessed;
    Amount partialAmountProcessed;

    bool
    operator==(LenderDisbursementCursor const&) const = default;
};

struct LenderRecord
{
    std::vector<LenderRedemptionRequest> requests;
    LenderDisbursementCursor cursor;
    // Total paid out by disburse.
    Amount withdrawn;
    std::optional<LedgerTime> lastDepositTime;
};

/** Result of computeWithdrawable: the amount not yet paid out and the
    cursor to store once it is paid.
*/
struct WithdrawableAmount
{
    Amount amount;
    Amount shares;
    LenderDisbursementCursor cursor;
};

/** Fill applied to one epoch by an epoch close. */
struct EpochSettlement
{
    std::uint64_t epochId = 0;
    Amount sharesProcessed;
    Amount amountProcessed;
};

/** Share ledger and redemption queue of one tranche.

    Shares under a redemption request sit in escrow in the vault until an
    epoch close burns them. The proceeds are held by the vault until the
    lender calls disburse.
*/
class TrancheVault
{
    Tranche tranche_;
    ShareLedger shares_;
    std::map<std::uint64_t, EpochInfo> epochs_;
    // Epochs with unprocessed shares, oldest first.
    std::vector<std::uint64_t> unprocessedEpochIds_;
    std::map<LenderID, LenderRecord> lenders_;
    // Settled redemption proceeds not yet disbursed.
    Amount held_;
    Journal j_;

public:
    TrancheVault(Tranche tranche, Journal j);

    /** The share holder that keeps shares under redemption. */
    static LenderID const&
    escrowAccount();

    Tranche
    tranche() const
    {
        return tranche_;
    }

    Amount const&
    totalSupply() const
    {
        return shares_.totalSupply();
    }

    Amount
    balanceOf(LenderID const& lender) const
    {
        return shares_.balanceOf(lender);
    }

    Amount const&
    heldForDisbursement() const
    {
        return held_;
    }

    EpochInfo const*
    epochInfo(std::uint64_t epochId) const;

    /** Epochs still waiting for fills, oldest first. */
    std::vector<EpochInfo>
    unprocessedEpochInfos() const;

    LenderRecord const*
    lenderRecord(LenderID const& lender) const;

    /** Shares minted for `assets` when the tranche holds
        `trancheAssets`. One share per unit while there is no supply.
    */
    Expected<Amount, TER>
    convertToShares(Amount const& assets, Amount const& trancheAssets) const;

    Amount
    convertToAssets(Amount const& shares, Amount const& trancheAssets) const;

    void
    deposit(LenderID const& lender, Amount const& shares, LedgerTime now);

    /** Queue `shares` for redemption in the current epoch.

        The shares move into escrow. A second request in the same epoch
        merges into the lender's last entry.
    */
    TER
    addRedemptionRequest(
        LenderID const& lender,
        Amount const& shares,
        std::uint64_t currentEpochId,
        LedgerTime now,
        std::chrono::seconds lockout);

    /** Withdraw part or all of the lender's request in the current epoch
        and return the shares from escrow.
    */
    TER
    cancelRedemptionRequest(
        LenderID const& lender,
        Amount const& shares,
        std::uint64_t currentEpochId);

    Amount
    cancellableRedemptionShares(
        LenderID const& lender,
        std::uint64_t currentEpochId) const;

    /** Record the fills of an epoch close, burn the processed shares and
        hold the proceeds for disbursement.
    */
    TER
    applySettlement(std::vector<EpochSettlement> const& settlements);

    /** Amount the lender can take out now. Does not change anything. */
    WithdrawableAmount
    computeWithdrawable(LenderID const& lender) const;

    /** Pay out computeWithdrawable and store the advanced cursor. */
    Expected<Amount, TER>
    disburse(LenderID const& lender);

    Json::Value
    getJson() const;
};

}  // namespace strata

#endif
