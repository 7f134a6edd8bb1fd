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

#include <strata/basics/BasicConfig.h>

#include <doctest/doctest.h>

#include <stdexcept>
#include <string>

using namespace strata;

TEST_SUITE_BEGIN("BasicConfig");

TEST_CASE("sections, keys and values")
{
    BasicConfig config;
    config.loadFromString(R"(
# leading comment
[pool]
liquidity_cap = 5000
min_deposit=10   # trailing comment

[first_loss_covers]
borrower
affiliate
)");

    CHECK(config.exists("pool"));
    CHECK(!config.exists("fees"));

    auto const& pool = config.section("pool");
    CHECK(pool.get("liquidity_cap") == std::string("5000"));
    CHECK(pool.get<int>("min_deposit") == 10);
    CHECK(pool.had_trailing_comments());
    CHECK(pool.value_or<int>("missing", 3) == 3);
    CHECK(!pool.exists("missing"));

    auto const& covers = config.section("first_loss_covers");
    REQUIRE(covers.values().size() == 2);
    CHECK(covers.values()[0] == "borrower");
    CHECK(covers.values()[1] == "affiliate");
}

TEST_CASE("missing section is empty")
{
    BasicConfig const config;
    auto const& section = config.section("absent");
    CHECK(section.values().empty());
    CHECK(!section.get("anything"));
}

TEST_CASE("overwrite")
{
    BasicConfig config;
    config.loadFromString("[pool]\nmin_deposit = 1\n");
    config.overwrite("pool", "min_deposit", "25");
    config.overwrite("logging", "severity", "debug");
    CHECK(config.section("pool").get<int>("min_deposit") == 25);
    CHECK(config.section("logging").get("severity") == std::string("debug"));
}

TEST_CASE("typed get and set")
{
    Section section("pool");
    section.append("flex_window_epochs = 2");
    section.append("bad_number = two");

    CHECK(get<int>(section, "flex_window_epochs", 0) == 2);
    CHECK(get<int>(section, "bad_number", 9) == 9);

    int value = 0;
    CHECK(set(value, "flex_window_epochs", section));
    CHECK(value == 2);
    CHECK(!set(value, "bad_number", section));
    CHECK(value == 2);
}

TEST_CASE("unreadable file")
{
    BasicConfig config;
    CHECK_THROWS_AS(
        config.loadFromFile("/nonexistent/strata.cfg"), std::runtime_error);
}

TEST_SUITE_END();
