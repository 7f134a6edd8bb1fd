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

#ifndef STRATA_PROTOCOL_TER_H_INCLUDED
#define STRATA_PROTOCOL_TER_H_INCLUDED

#include <optional>
#include <ostream>
#include <string>

namespace strata {

// Engine result codes. Every public LendingPool operation reports one.
//
using TERUnderlyingType = int;

//------------------------------------------------------------------------------

enum TEMcodes : TERUnderlyingType {
    // Note: Range is stable.
    // Exact numbers are used in the JSON state dump and the replay output.
    // DO NOT CHANGE THESE NUMBERS: They appear in persisted results.

    // -299 .. -200: M Malformed or misused (the request is invalid)
    //
    // Causes:
    // - Zero or oversized amount, bad configuration index.
    // - Request that contradicts the current ledger state.
    //
    // Implications:
    // - Rejected without touching the ledger.
    // - Retrying the same request will fail the same way.
    temMALFORMED = -299,

    temBAD_AMOUNT,
    temZERO_TOTAL_ASSETS,
    temRECOVERY_EXCEEDS_LOSS,
    temLOSS_EXCEEDS_ASSETS,
    temEPOCH_NOT_CURRENT,
    temNO_REDEMPTION_REQUEST,
    temINSUFFICIENT_SHARES,
    temBELOW_MIN_DEPOSIT,
    temBAD_COVER,
    temINSUFFICIENT_COVER,
};

//------------------------------------------------------------------------------

enum TEFcodes : TERUnderlyingType {
    // Note: Range is stable.
    // Exact numbers are used in the JSON state dump and the replay output.
    // DO NOT CHANGE THESE NUMBERS: They appear in persisted results.

    // -199 .. -100: F
    //    Failure (arithmetic overflow or internal error)
    //
    // Causes:
    // - An amount left the representable range.
    // - An internal invariant did not hold.
    //
    // Implications:
    // - The whole operation is discarded.
    // - Indicates a bug or values outside the supported range.
    tefFAILURE = -199,
    tefOVERFLOW,
    tefEXCEPTION,
    tefBAD_LEDGER,
};

//------------------------------------------------------------------------------

enum TERcodes : TERUnderlyingType {
    // Note: Range is stable.
    // Exact numbers are used in the JSON state dump and the replay output.
    // DO NOT CHANGE THESE NUMBERS: They appear in persisted results.

    // -99 .. -1: R Retry
    //
    // Cause:
    //   A constraint of the pool blocks the request right now.
    //
    // Implications:
    // - Not applied.
    // - The same request might succeed after deposits, settlements or time.
    terRETRY = -99,
    terNO_LIQUIDITY,
    terEPOCH_NOT_ENDED,
    terLIQUIDITY_CAP,
    terSENIOR_RATIO,
    terWITHDRAWAL_LOCKED,
    terPOOL_DISABLED,
    terCOVER_CAP,
};

//------------------------------------------------------------------------------

enum TEScodes : TERUnderlyingType {
    // Note: Exact number must stay stable.

    // 0: S Success (success)
    // Causes:
    // - Success.
    // Implications:
    // - Applied
    tesSUCCESS = 0
};

//------------------------------------------------------------------------------

/** The result of applying an operation to the pool ledger.

    Converts implicitly from any of the code enumerations. Evaluates to
    `true` in a boolean context when the result is anything but
    tesSUCCESS, which supports

        if (auto const ter = step(...))
            return ter;
*/
class TER
{
    TERUnderlyingType code_;

public:
    constexpr TER() : code_(tesSUCCESS)
    {
    }

    constexpr TER(TEMcodes code) : code_(code)
    {
    }

    constexpr TER(TEFcodes code) : code_(code)
    {
    }

    constexpr TER(TERcodes code) : code_(code)
    {
    }

    constexpr TER(TEScodes code) : code_(code)
    {
    }

    /** Build from a raw code. Returns std::nullopt for unknown values. */
    static std::optional<TER>
    fromInt(TERUnderlyingType from);

    constexpr explicit
    operator bool() const
    {
        return code_ != tesSUCCESS;
    }

    friend constexpr TERUnderlyingType
    TERtoInt(TER v)
    {
        return v.code_;
    }

    friend constexpr bool
    operator==(TER const& lhs, TER const& rhs)
    {
        return lhs.code_ == rhs.code_;
    }
};

/** The class of failure a result belongs to. */
enum class ResultClass {
    success,
    preconditionViolation,
    constraintBlocked,
    fatalFailure
};

inline bool
isTemMalformed(TER x)
{
    return (TERtoInt(x) >= temMALFORMED && TERtoInt(x) < tefFAILURE);
}

inline bool
isTefFailure(TER x)
{
    return (TERtoInt(x) >= tefFAILURE && TERtoInt(x) < terRETRY);
}

inline bool
isTerRetry(TER x)
{
    return (TERtoInt(x) >= terRETRY && TERtoInt(x) < tesSUCCESS);
}

inline bool
isTesSuccess(TER x)
{
    return (TERtoInt(x) == tesSUCCESS);
}

ResultClass
classify(TER code);

std::string
to_string(ResultClass rc);

bool
transResultInfo(TER code, std::string& token, std::string& text);

std::string
transToken(TER code);

std::string
transHuman(TER code);

std::optional<TER>
transCode(std::string const& token);

inline std::ostream&
operator<<(std::ostream& os, TER const& code)
{
    return os << transToken(code);
}

}  // namespace strata

#endif
