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

#include <strata/app/Replay.h>
#include <strata/basics/Log.h>
#include <strata/protocol/jss.h>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include <limits>
#include <optional>

namespace strata {

namespace {

std::optional<Tranche>
parseTranche(std::string const& text)
{
    return trancheFromString(boost::algorithm::to_lower_copy(text));
}

template <class T>
std::optional<T>
parseNumber(std::string const& text)
{
    try
    {
        return boost::lexical_cast<T>(text);
    }
    catch (boost::bad_lexical_cast const&)
    {
        return std::nullopt;
    }
}

void
setResult(Json::Value& result, TER ter)
{
    result[jss::result] = transToken(ter);
    result[jss::result_class] = to_string(classify(ter));
}

Json::Value
toJson(std::vector<Amount> const& amounts)
{
    Json::Value ret(Json::arrayValue);
    for (auto const& amount : amounts)
        ret.append(to_string(amount));
    return ret;
}

}  // namespace

Replay::Replay(
    LendingPool& pool,
    std::ostream& out,
    Journal j,
    LedgerTime start)
    : pool_(pool), out_(out), j_(j), now_(start)
{
}

bool
Replay::run(std::istream& script)
{
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(script, line))
    {
        ++lineNumber;
        if (!execute(line, lineNumber))
            return false;
    }
    return true;
}

bool
Replay::execute(std::string const& line, std::size_t lineNumber)
{
    auto const trimmed = boost::algorithm::trim_copy(line);
    if (trimmed.empty() || trimmed[0] == '#')
        return true;

    std::vector<std::string> args;
    boost::algorithm::split(
        args,
        trimmed,
        boost::algorithm::is_space(),
        boost::algorithm::token_compress_on);

    Json::Value result(Json::objectValue);
    result[jss::line] = static_cast<Json::UInt64>(lineNumber);
    result[jss::command] = args[0];
    if (!dispatch(args, result))
    {
        JLOG(j_.error()) << "line " << lineNumber << ": malformed command: "
                         << trimmed;
        return false;
    }
    write(result);
    return true;
}

bool
Replay::dispatch(std::vector<std::string> const& args, Json::Value& result)
{
    auto const& command = args[0];
    auto const argc = args.size() - 1;

    if (command == "time" && argc == 1)
    {
        auto const seconds = parseNumber<std::int64_t>(args[1]);
        if (!seconds)
            return false;
        now_ = fromSeconds(*seconds);
        result[jss::now] = static_cast<Json::Int64>(toSeconds(now_));
        return true;
    }

    if (command == "advance" && argc == 1)
    {
        auto const seconds = parseNumber<std::int64_t>(args[1]);
        if (!seconds || *seconds < 0)
            return false;
        auto const current = toSeconds(now_);
        if (current > 0 &&
            *seconds > std::numeric_limits<std::int64_t>::max() - current)
            return false;
        now_ += std::chrono::seconds{*seconds};
        result[jss::now] = static_cast<Json::Int64>(toSeconds(now_));
        return true;
    }

    if (command == "enable" && argc == 0)
    {
        setResult(result, pool_.enablePool(now_));
        return true;
    }

    if (command == "disable" && argc == 0)
    {
        setResult(result, pool_.disablePool());
        return true;
    }

    if (command == "dump" && argc == 0)
    {
        result[jss::state] = pool_.getJson();
        return true;
    }

    if (command == "close" && argc == 0)
    {
        auto const summary = pool_.closeEpoch(now_);
        if (!summary)
        {
            setResult(result, summary.error());
            return true;
        }
        setResult(result, tesSUCCESS);
        result[jss::epoch] = static_cast<Json::UInt64>(summary->closedEpochId);
        for (auto const tranche : allTranches)
        {
            Json::Value& t = result[to_string(tranche)] = Json::objectValue;
            t[jss::shares_processed] =
                to_string(summary->sharesProcessed[tranche]);
            t[jss::amount_processed] =
                to_string(summary->amountProcessed[tranche]);
        }
        result[jss::unmet_demand] = to_string(summary->unmetDemand);
        return true;
    }

    // Commands taking a single amount.
    if (argc == 1 &&
        (command == "profit" || command == "loss" || command == "recovery" ||
         command == "drawdown" || command == "repay"))
    {
        auto const amount = parseAmount(args[1]);
        if (!amount)
            return false;

        if (command == "profit")
        {
            auto const r = pool_.distributeProfit(*amount, now_);
            setResult(result, r ? TER{tesSUCCESS} : r.error());
            if (r)
            {
                result[jss::senior] = to_string(r->seniorProfit);
                result[jss::junior] = to_string(r->juniorProfit);
                result[jss::covers] = toJson(r->coverProfits);
            }
        }
        else if (command == "loss")
        {
            auto const r = pool_.distributeLoss(*amount, now_);
            setResult(result, r ? TER{tesSUCCESS} : r.error());
            if (r)
            {
                result[jss::covers] = toJson(r->coverLosses);
                result[jss::junior] = to_string(r->trancheLosses.junior);
                result[jss::senior] = to_string(r->trancheLosses.senior);
            }
        }
        else if (command == "recovery")
        {
            auto const r = pool_.distributeLossRecovery(*amount, now_);
            setResult(result, r ? TER{tesSUCCESS} : r.error());
            if (r)
            {
                result[jss::senior] = to_string(r->trancheRecoveries.senior);
                result[jss::junior] = to_string(r->trancheRecoveries.junior);
                result[jss::covers] = toJson(r->coverRecoveries);
            }
        }
        else if (command == "drawdown")
            setResult(result, pool_.drawdown(*amount));
        else
            setResult(result, pool_.repay(*amount));
        return true;
    }

    if ((command == "cover_deposit" || command == "cover_redeem") && argc == 2)
    {
        auto const index = parseNumber<std::size_t>(args[1]);
        auto const amount = parseAmount(args[2]);
        if (!index || !amount)
            return false;
        setResult(
            result,
            command == "cover_deposit" ? pool_.depositCover(*index, *amount)
                                       : pool_.redeemCover(*index, *amount));
        return true;
    }

    // Commands naming a tranche and a lender.
    if (argc < 2)
        return false;
    auto const tranche = parseTranche(args[1]);
    if (!tranche)
        return false;
    auto const& lender = args[2];
    result[jss::tranche] = to_string(*tranche);
    result[jss::lender] = lender;

    if (command == "withdrawable" && argc == 2)
    {
        setResult(result, tesSUCCESS);
        result[jss::amount] =
            to_string(pool_.computeWithdrawable(*tranche, lender));
        return true;
    }

    if (command == "disburse" && argc == 2)
    {
        auto const r = pool_.disburse(*tranche, lender);
        setResult(result, r ? TER{tesSUCCESS} : r.error());
        if (r)
            result[jss::amount] = to_string(*r);
        return true;
    }

    if (argc != 3)
        return false;
    auto const amount = parseAmount(args[3]);
    if (!amount)
        return false;

    if (command == "deposit")
    {
        auto const r = pool_.deposit(*tranche, lender, *amount, now_);
        setResult(result, r ? TER{tesSUCCESS} : r.error());
        if (r)
            result[jss::shares] = to_string(*r);
        return true;
    }

    if (command == "redeem")
    {
        setResult(
            result,
            pool_.addRedemptionRequest(*tranche, lender, *amount, now_));
        return true;
    }

    if (command == "cancel")
    {
        setResult(
            result, pool_.cancelRedemptionRequest(*tranche, lender, *amount));
        return true;
    }

    return false;
}

void
Replay::write(Json::Value const& value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    out_ << Json::writeString(builder, value) << std::endl;
}

}  // namespace strata
