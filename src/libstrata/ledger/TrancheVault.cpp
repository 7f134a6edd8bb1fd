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
#include <strata/ledger/TrancheVault.h>
#include <strata/protocol/jss.h>

#include <algorithm>

namespace strata {

TrancheVault::TrancheVault(Tranche tranche, Journal j)
    : tranche_(tranche), j_(j)
{
}

LenderID const&
TrancheVault::escrowAccount()
{
    static LenderID const account;
    return account;
}

EpochInfo const*
TrancheVault::epochInfo(std::uint64_t epochId) const
{
    auto const it = epochs_.find(epochId);
    if (it == epochs_.end())
        return nullptr;
    return &it->second;
}

std::vector<EpochInfo>
TrancheVault::unprocessedEpochInfos() const
{
    std::vector<EpochInfo> result;
    result.reserve(unprocessedEpochIds_.size());
    for (auto const id : unprocessedEpochIds_)
        result.push_back(epochs_.at(id));
    return result;
}

LenderRecord const*
TrancheVault::lenderRecord(LenderID const& lender) const
{
    auto const it = lenders_.find(lender);
    if (it == lenders_.end())
        return nullptr;
    return &it->second;
}

Expected<Amount, TER>
TrancheVault::convertToShares(
    Amount const& assets,
    Amount const& trancheAssets) const
{
    auto const& supply = shares_.totalSupply();
    if (!supply)
        return assets;
    if (!trancheAssets)
        return Unexpected(temZERO_TOTAL_ASSETS);
    return mulDiv(assets, supply, trancheAssets);
}

Amount
TrancheVault::convertToAssets(
    Amount const& shares,
    Amount const& trancheAssets) const
{
    auto const& supply = shares_.totalSupply();
    if (!supply)
        return shares;
    return mulDiv(shares, trancheAssets, supply);
}

void
TrancheVault::deposit(
    LenderID const& lender,
    Amount const& shares,
    LedgerTime now)
{
    shares_.mint(lender, shares);
    lenders_[lender].lastDepositTime = now;
}

TER
TrancheVault::addRedemptionRequest(
    LenderID const& lender,
    Amount const& shares,
    std::uint64_t currentEpochId,
    LedgerTime now,
    std::chrono::seconds lockout)
{
    if (!shares)
        return temBAD_AMOUNT;
    if (lender == escrowAccount())
        return temMALFORMED;

    if (auto const record = lenderRecord(lender);
        record && record->lastDepositTime &&
        now < *record->lastDepositTime + lockout)
    {
        JLOG(j_.debug()) << to_string(tranche_) << " redemption by "
                         << lender << " inside withdrawal lockout";
        return terWITHDRAWAL_LOCKED;
    }

    if (auto const ter = shares_.transfer(lender, escrowAccount(), shares))
        return ter;

    auto [it, inserted] = epochs_.try_emplace(currentEpochId);
    auto& epoch = it->second;
    if (inserted)
    {
        epoch.epochId = currentEpochId;
        unprocessedEpochIds_.push_back(currentEpochId);
    }
    epoch.totalSharesRequested += shares;

    auto& requests = lenders_[lender].requests;
    if (!requests.empty() && requests.back().epochId == currentEpochId)
        requests.back().sharesRequested += shares;
    else
        requests.push_back({currentEpochId, shares});

    JLOG(j_.trace()) << to_string(tranche_) << " epoch " << currentEpochId
                     << ": " << lender << " requested " << shares;
    return tesSUCCESS;
}

TER
TrancheVault::cancelRedemptionRequest(
    LenderID const& lender,
    Amount const& shares,
    std::uint64_t currentEpochId)
{
    if (!shares)
        return temBAD_AMOUNT;

    auto const it = lenders_.find(lender);
    if (it == lenders_.end() || it->second.requests.empty())
        return temNO_REDEMPTION_REQUEST;

    auto& requests = it->second.requests;
    auto& last = requests.back();
    if (last.epochId != currentEpochId)
        return temEPOCH_NOT_CURRENT;
    if (shares > last.sharesRequested)
        return temINSUFFICIENT_SHARES;

    auto const epochIt = epochs_.find(currentEpochId);
    if (epochIt == epochs_.end() ||
        epochIt->second.totalSharesRequested < shares)
    {
        // LCOV_EXCL_START
        JLOG(j_.warn()) << to_string(tranche_) << " epoch " << currentEpochId
                        << " aggregate is smaller than a lender request";
        return tefBAD_LEDGER;
        // LCOV_EXCL_STOP
    }

    if (auto const ter = shares_.transfer(escrowAccount(), lender, shares))
        return ter;

    last.sharesRequested -= shares;
    if (!last.sharesRequested)
        requests.pop_back();

    auto& epoch = epochIt->second;
    epoch.totalSharesRequested -= shares;
    if (!epoch.totalSharesRequested)
    {
        epochs_.erase(epochIt);
        std::erase(unprocessedEpochIds_, currentEpochId);
    }

    JLOG(j_.trace()) << to_string(tranche_) << " epoch " << currentEpochId
                     << ": " << lender << " cancelled " << shares;
    return tesSUCCESS;
}

Amount
TrancheVault::cancellableRedemptionShares(
    LenderID const& lender,
    std::uint64_t currentEpochId) const
{
    auto const record = lenderRecord(lender);
    if (!record || record->requests.empty())
        return {};
    auto const& last = record->requests.back();
    if (last.epochId != currentEpochId)
        return {};
    return last.sharesRequested;
}

TER
TrancheVault::applySettlement(std::vector<EpochSettlement> const& settlements)
{
    for (auto const& settlement : settlements)
    {
        auto const it = epochs_.find(settlement.epochId);
        if (it == epochs_.end() ||
            settlement.sharesProcessed > it->second.unprocessedShares())
        {
            // LCOV_EXCL_START
            JLOG(j_.warn()) << to_string(tranche_) << " settlement of epoch "
                            << settlement.epochId
                            << " exceeds its unprocessed shares";
            return tefBAD_LEDGER;
            // LCOV_EXCL_STOP
        }

        if (auto const ter =
                shares_.burn(escrowAccount(), settlement.sharesProcessed))
        {
            // LCOV_EXCL_START
            JLOG(j_.warn()) << to_string(tranche_)
                            << " escrow cannot cover a settlement";
            return tefBAD_LEDGER;
            // LCOV_EXCL_STOP
        }

        auto& epoch = it->second;
        epoch.totalSharesProcessed += settlement.sharesProcessed;
        epoch.totalAmountProcessed += settlement.amountProcessed;
        held_ += settlement.amountProcessed;
    }

    std::erase_if(unprocessedEpochIds_, [this](std::uint64_t id) {
        return epochs_.at(id).fulfilled();
    });
    return tesSUCCESS;
}

WithdrawableAmount
TrancheVault::computeWithdrawable(LenderID const& lender) const
{
    WithdrawableAmount result;
    auto const record = lenderRecord(lender);
    if (!record)
        return result;

    result.cursor = record->cursor;
    auto& cursor = result.cursor;
    for (auto i = cursor.requestsIndex; i < record->requests.size(); ++i)
    {
        auto const& request = record->requests[i];
        auto const epoch = epochInfo(request.epochId);
        STRATA_ASSERT(
            epoch,
            "strata::TrancheVault::computeWithdrawable : request epoch "
            "exists");

        auto const sharesProcessed = mulDiv(
            request.sharesRequested,
            epoch->totalSharesProcessed,
            epoch->totalSharesRequested);
        auto const amountProcessed = mulDiv(
            request.sharesRequested,
            epoch->totalAmountProcessed,
            epoch->totalSharesRequested);

        result.shares += sharesProcessed - cursor.partialSharesProcessed;
        result.amount += amountProcessed - cursor.partialAmountProcessed;

        if (!epoch->fulfilled())
        {
            cursor.partialSharesProcessed = sharesProcessed;
            cursor.partialAmountProcessed = amountProcessed;
            break;
        }

        cursor.requestsIndex = i + 1;
        cursor.partialSharesProcessed = {};
        cursor.partialAmountProcessed = {};
    }
    return result;
}

Expected<Amount, TER>
TrancheVault::disburse(LenderID const& lender)
{
    auto const withdrawable = computeWithdrawable(lender);
    auto const it = lenders_.find(lender);
    if (it == lenders_.end())
        return Amount{};

    if (withdrawable.amount > held_)
    {
        // LCOV_EXCL_START
        JLOG(j_.warn()) << to_string(tranche_)
                        << " vault holds less than a lender is owed";
        return Unexpected(tefBAD_LEDGER);
        // LCOV_EXCL_STOP
    }

    held_ -= withdrawable.amount;
    it->second.cursor = withdrawable.cursor;
    it->second.withdrawn += withdrawable.amount;

    JLOG(j_.debug()) << to_string(tranche_) << " disbursed "
                     << withdrawable.amount << " to " << lender;
    return withdrawable.amount;
}

Json::Value
TrancheVault::getJson() const
{
    Json::Value ret(Json::objectValue);
    ret[jss::shares] = shares_.getJson();
    ret[jss::held] = to_string(held_);

    Json::Value& epochs = ret[jss::epochs] = Json::arrayValue;
    for (auto const& [id, epoch] : epochs_)
    {
        Json::Value& e = epochs.append(Json::objectValue);
        e[jss::id] = static_cast<Json::UInt64>(id);
        e[jss::shares_requested] = to_string(epoch.totalSharesRequested);
        e[jss::shares_processed] = to_string(epoch.totalSharesProcessed);
        e[jss::amount_processed] = to_string(epoch.totalAmountProcessed);
    }

    Json::Value& pending = ret[jss::first_unprocessed_epoch];
    if (!unprocessedEpochIds_.empty())
        pending = static_cast<Json::UInt64>(unprocessedEpochIds_.front());

    Json::Value& lenders = ret[jss::lenders] = Json::objectValue;
    for (auto const& [lender, record] : lenders_)
    {
        Json::Value& l = lenders[lender] = Json::objectValue;
        Json::Value& requests = l[jss::requests] = Json::arrayValue;
        for (auto const& request : record.requests)
        {
            Json::Value& r = requests.append(Json::objectValue);
            r[jss::id] = static_cast<Json::UInt64>(request.epochId);
            r[jss::shares_requested] = to_string(request.sharesRequested);
        }

        Json::Value& cursor = l[jss::disbursement] = Json::objectValue;
        cursor[jss::requests_index] =
            static_cast<Json::UInt64>(record.cursor.requestsIndex);
        cursor[jss::partial_shares] =
            to_string(record.cursor.partialSharesProcessed);
        cursor[jss::partial_amount] =
            to_string(record.cursor.partialAmountProcessed);

        l[jss::withdrawn] = to_string(record.withdrawn);
        if (record.lastDepositTime)
            l[jss::last_deposit_time] =
                static_cast<Json::Int64>(toSeconds(*record.lastDepositTime));
    }
    return ret;
}

}  // namespace strata
