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

#include <doctest/doctest.h>

#include <sstream>

using namespace strata;

TEST_SUITE_BEGIN("Logs");

struct LogsFixture
{
    std::ostringstream out;
    Logs logs{Journal::severities::kWarning, out};
};

TEST_CASE_FIXTURE(LogsFixture, "threshold filters messages")
{
    auto const j = logs.journal("Pool");
    JLOG(j.debug()) << "hidden";
    JLOG(j.warn()) << "shown " << 42;
    CHECK(out.str() == "Pool:WRN shown 42\n");
    CHECK(!j.active(Journal::severities::kInfo));
    CHECK(j.active(Journal::severities::kError));
}

TEST_CASE_FIXTURE(LogsFixture, "changing the threshold reaches every partition")
{
    auto const j = logs.journal("EpochManager");
    logs.threshold(Journal::severities::kTrace);
    CHECK(logs.threshold() == Journal::severities::kTrace);
    JLOG(j.trace()) << "closing";
    CHECK(out.str() == "EpochManager:TRC closing\n");
}

TEST_CASE_FIXTURE(LogsFixture, "partitions are shared by name")
{
    CHECK(&logs.get("Pool") == &logs["Pool"]);
    CHECK(&logs.get("Pool") != &logs.get("TrancheVault"));
}

TEST_CASE("severity names")
{
    CHECK(Logs::fromString("warn") == Journal::severities::kWarning);
    CHECK(Logs::fromString("Debug") == Journal::severities::kDebug);
    CHECK(Logs::fromString("none") == Journal::severities::kDisabled);
    CHECK(!Logs::fromString("loud"));
    CHECK(Logs::toString(Journal::severities::kError) == "Error");
    CHECK(
        Logs::format(Journal::severities::kInfo, "Replay", "ok") ==
        "Replay:NFO ok");
}

TEST_CASE("null sink discards everything")
{
    Journal const j(Journal::getNullSink());
    CHECK(!j.active(Journal::severities::kFatal));
    JLOG(j.fatal()) << "nothing";
}

TEST_SUITE_END();
