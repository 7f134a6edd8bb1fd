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

#ifndef STRATA_APP_REPLAY_H_INCLUDED
#define STRATA_APP_REPLAY_H_INCLUDED

#include <strata/basics/Journal.h>
#include <strata/basics/chrono.h>
#include <strata/ledger/LendingPool.h>

#include <json/json.h>

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace strata {

/** Plays a line oriented event script against a LendingPool.

    Each line holds one command and its arguments separated by blanks.
    Blank lines and lines starting with '#' are skipped. For every command
    one JSON object is written to the output, holding the line number, the
    command, the result code and the command's figures.

    Commands:

        time <unix seconds>         advance <seconds>
        enable                      disable
        deposit <tranche> <lender> <amount>
        redeem <tranche> <lender> <shares>
        cancel <tranche> <lender> <shares>
        withdrawable <tranche> <lender>
        disburse <tranche> <lender>
        profit <amount>             loss <amount>
        recovery <amount>           close
        cover_deposit <index> <amount>
        cover_redeem <index> <amount>
        drawdown <amount>           repay <amount>
        dump
*/
class Replay
{
    LendingPool& pool_;
    std::ostream& out_;
    Journal j_;
    LedgerTime now_;

public:
    Replay(LendingPool& pool, std::ostream& out, Journal j, LedgerTime start);

    LedgerTime
    now() const
    {
        return now_;
    }

    /** Run every line. Returns false at the first malformed line. */
    bool
    run(std::istream& script);

    /** Run one line. Returns false if the line is malformed. */
    bool
    execute(std::string const& line, std::size_t lineNumber);

private:
    bool
    dispatch(std::vector<std::string> const& args, Json::Value& result);

    void
    write(Json::Value const& value);
};

}  // namespace strata

#endif
