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

#include <doctest/doctest.h>
#include <json/json.h>

#include <sstream>
#include <string>
#include <vector>

using namespace strata;

TEST_SUITE_BEGIN("Replay");

namespace {

struct ReplayFixture
{
    std::ostringstream log;
    Logs logs{Journal::severities::kError, log};
    LendingPool pool{makeConfig(), logs};
    std::ostringstream out;
    Replay replay{
        pool,
        out,
        logs.journal("Replay"),
        fromSeconds(1'700'000'000)};

    static PoolConfig
    makeConfig()
    {
        PoolConfig config;
        config.riskAdjustmentBps = 2000;
        FirstLossCoverConfig cover;
        cover.name = "borrower";
        cover.riskYieldMultiplierBps = 15'000;
        config.covers.push_back(cover);
        return config;
    }

    // Each output line parsed as JSON.
    std::vector<Json::Value>
    results() const
    {
        std::vector<Json::Value> values;
        std::istringstream lines(out.str());
        std::string line;
        Json::CharReaderBuilder builder;
        while (std::getline(lines, line))
        {
            Json::Value value;
            std::string errors;
            std::istringstream in(line);
            REQUIRE(Json::parseFromStream(builder, in, &value, &errors));
            values.push_back(value);
        }
        return values;
    }
};

}  // namespace

TEST_CASE_FIXTURE(ReplayFixture, "a script of pool events")
{
    std::istringstream script(R"(
# fund the pool
enable
cover_deposit 0 50
deposit junior bob 200
deposit senior alice 800
profit 100
redeem senior alice 100
close
advance 86400
close
withdrawable senior alice
disburse senior alice
)");
    REQUIRE(replay.run(script));

    auto const r = results();
    REQUIRE(r.size() == 11);

    CHECK(r[0]["command"] == "enable");
    CHECK(r[0]["result"] == "tesSUCCESS");
    CHECK(r[0]["class"] == "success");
    CHECK(r[0]["line"] == 3);

    CHECK(r[2]["shares"] == "200");

    CHECK(r[4]["senior"] == "64");
    CHECK(r[4]["junior"] == "27");
    CHECK(r[4]["covers"][0u] == "9");

    CHECK(r[6]["result"] == "terEPOCH_NOT_ENDED");
    CHECK(r[6]["class"] == "constraint_blocked");

    CHECK(r[7]["now"] == 1'700'086'400);

    CHECK(r[8]["result"] == "tesSUCCESS");
    CHECK(r[8]["epoch"] == 1);
    CHECK(r[8]["senior"]["shares_processed"] == "100");
    // 100 shares at 864 / 800.
    CHECK(r[8]["senior"]["amount_processed"] == "108");

    CHECK(r[9]["amount"] == "108");
    CHECK(r[10]["amount"] == "108");
    CHECK(pool.computeWithdrawable(Tranche::senior, "alice") == Amount{});
}

TEST_CASE_FIXTURE(ReplayFixture, "rejections are reported, not fatal")
{
    std::istringstream script(R"(enable
deposit senior alice 100
loss 5
recovery 1
cover_redeem 4 1
)");
    REQUIRE(replay.run(script));

    auto const r = results();
    REQUIRE(r.size() == 5);
    CHECK(r[1]["result"] == "terSENIOR_RATIO");
    CHECK(r[2]["result"] == "temLOSS_EXCEEDS_ASSETS");
    CHECK(r[2]["class"] == "precondition_violation");
    CHECK(r[3]["result"] == "temRECOVERY_EXCEEDS_LOSS");
    CHECK(r[4]["result"] == "temBAD_COVER");
}

TEST_CASE_FIXTURE(ReplayFixture, "malformed lines stop the run")
{
    std::istringstream script("enable\ndeposit mezzanine bob 10\nenable\n");
    CHECK(!replay.run(script));
    CHECK(results().size() == 1);
    CHECK(log.str().find("Replay:ERR line 2") != std::string::npos);

    CHECK(!replay.execute("profit lots", 4));
    CHECK(!replay.execute("advance -5", 5));
    CHECK(!replay.execute("deposit junior bob", 6));
    CHECK(!replay.execute("explode", 7));
    CHECK(replay.execute("   ", 8));
}

TEST_CASE_FIXTURE(ReplayFixture, "time")
{
    CHECK(replay.execute("time 1800000000", 1));
    CHECK(replay.now() == fromSeconds(1'800'000'000));
    CHECK(replay.execute("advance 60", 2));
    CHECK(replay.now() == fromSeconds(1'800'000'060));

    // An advance past the representable range is rejected and leaves the
    // clock where it was.
    CHECK(!replay.execute("advance 9223372036854775807", 3));
    CHECK(replay.now() == fromSeconds(1'800'000'060));
    CHECK(replay.execute("advance 0", 4));
    CHECK(replay.now() == fromSeconds(1'800'000'060));
}

TEST_CASE_FIXTURE(ReplayFixture, "dump")
{
    CHECK(replay.execute("enable", 1));
    CHECK(replay.execute("dump", 2));
    auto const r = results();
    REQUIRE(r.size() == 2);
    auto const& state = r[1]["state"];
    CHECK(state["enabled"] == true);
    CHECK(state["current_epoch"]["id"] == 1);
    CHECK(state["policy"]["type"] == "risk_adjusted");
    CHECK(state["tranches"]["junior"]["share_price"] == "1000000000000000000");
}

TEST_SUITE_END();
