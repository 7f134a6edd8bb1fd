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

#include <strata/protocol/TER.h>

#include <boost/range/adaptor/transformed.hpp>
#include <boost/range/iterator_range_core.hpp>

#include <type_traits>
#include <unordered_map>

namespace strata {

namespace {

std::unordered_map<
    TERUnderlyingType,
    std::pair<char const* const, char const* const>> const&
transResults()
{
    // clang-format off

    // Macros are convenient because they put the name of the TER
    // code in the list as well.
#define MAKE_ERROR(code, desc) { code, { #code, desc } }

    static std::unordered_map<
        TERUnderlyingType,
        std::pair<char const* const, char const* const>> const results
    {
        MAKE_ERROR(tefFAILURE,               "Failed to apply."),
        MAKE_ERROR(tefOVERFLOW,              "An amount exceeded the 96-bit range."),
        MAKE_ERROR(tefEXCEPTION,             "An unexpected exception was raised."),
        MAKE_ERROR(tefBAD_LEDGER,            "Ledger in unexpected state."),

        MAKE_ERROR(temMALFORMED,             "Malformed request."),
        MAKE_ERROR(temBAD_AMOUNT,            "Amount must be positive."),
        MAKE_ERROR(temZERO_TOTAL_ASSETS,     "Tranche assets are zero."),
        MAKE_ERROR(temRECOVERY_EXCEEDS_LOSS, "Recovery exceeds the outstanding loss."),
        MAKE_ERROR(temLOSS_EXCEEDS_ASSETS,   "Loss exceeds the assets able to absorb it."),
        MAKE_ERROR(temEPOCH_NOT_CURRENT,     "Redemption request is not in the current epoch."),
        MAKE_ERROR(temNO_REDEMPTION_REQUEST, "Lender has no redemption request."),
        MAKE_ERROR(temINSUFFICIENT_SHARES,   "Not enough shares for the request."),
        MAKE_ERROR(temBELOW_MIN_DEPOSIT,     "Deposit is below the pool minimum."),
        MAKE_ERROR(temBAD_COVER,             "No first-loss cover at that index."),
        MAKE_ERROR(temINSUFFICIENT_COVER,    "First-loss cover has no redeemable excess."),

        MAKE_ERROR(terRETRY,                 "Retry operation."),
        MAKE_ERROR(terNO_LIQUIDITY,          "No liquidity is reserved for pending redemptions."),
        MAKE_ERROR(terEPOCH_NOT_ENDED,       "The current epoch has not ended yet."),
        MAKE_ERROR(terLIQUIDITY_CAP,         "Deposit would exceed the pool liquidity cap."),
        MAKE_ERROR(terSENIOR_RATIO,          "Deposit would exceed the senior to junior ratio."),
        MAKE_ERROR(terWITHDRAWAL_LOCKED,     "Shares are still inside the withdrawal lockout."),
        MAKE_ERROR(terPOOL_DISABLED,         "The pool is not enabled."),
        MAKE_ERROR(terCOVER_CAP,             "First-loss cover would exceed its maximum liquidity."),

        MAKE_ERROR(tesSUCCESS,               "The operation was applied."),
    };
    // clang-format on

#undef MAKE_ERROR

    return results;
}

}  // namespace

bool
transResultInfo(TER code, std::string& token, std::string& text)
{
    auto& results = transResults();

    auto const r = results.find(TERtoInt(code));

    if (r == results.end())
        return false;

    token = r->second.first;
    text = r->second.second;
    return true;
}

std::string
transToken(TER code)
{
    std::string token;
    std::string text;

    return transResultInfo(code, token, text) ? token : "-";
}

std::string
transHuman(TER code)
{
    std::string token;
    std::string text;

    return transResultInfo(code, token, text) ? text : "-";
}

std::optional<TER>
transCode(std::string const& token)
{
    static auto const results = [] {
        auto& byTer = transResults();
        auto range = boost::make_iterator_range(byTer.begin(), byTer.end());
        auto tRange = boost::adaptors::transform(range, [](auto const& r) {
            return std::make_pair(r.second.first, r.first);
        });
        std::unordered_map<std::string, TERUnderlyingType> const byToken(
            tRange.begin(), tRange.end());
        return byToken;
    }();

    auto const r = results.find(token);

    if (r == results.end())
        return std::nullopt;

    return TER::fromInt(r->second);
}

std::optional<TER>
TER::fromInt(TERUnderlyingType from)
{
    if (transResults().count(from) == 0)
        return std::nullopt;
    TER result;
    result.code_ = from;
    return result;
}

ResultClass
classify(TER code)
{
    if (isTesSuccess(code))
        return ResultClass::success;
    if (isTerRetry(code))
        return ResultClass::constraintBlocked;
    if (isTemMalformed(code))
        return ResultClass::preconditionViolation;
    return ResultClass::fatalFailure;
}

std::string
to_string(ResultClass rc)
{
    switch (rc)
    {
        case ResultClass::success:
            return "success";
        case ResultClass::preconditionViolation:
            return "precondition_violation";
        case ResultClass::constraintBlocked:
            return "constraint_blocked";
        case ResultClass::fatalFailure:
            return "fatal_failure";
    }
    return "unknown";  // LCOV_EXCL_LINE
}

}  // namespace strata
