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

#include <strata/basics/Amount.h>

#include <doctest/doctest.h>

#include <sstream>
#include <stdexcept>

using namespace strata;

TEST_SUITE_BEGIN("Amount");

TEST_CASE("construction and limits")
{
    CHECK(!Amount{});
    CHECK(Amount{7});
    CHECK(Amount{7}.value() == 7);
    CHECK(Amount::max().to_string() == "79228162514264337593543950335");

    Amount::value_type const tooBig = Amount::value_type(1) << 96;
    CHECK_THROWS_AS(Amount{tooBig}, std::overflow_error);
    CHECK_NOTHROW(Amount{tooBig - 1});
}

TEST_CASE("addition and subtraction")
{
    Amount a{100};
    a += 23;
    CHECK(a == Amount{123});
    a -= 23;
    CHECK(a == Amount{100});
    CHECK(Amount{5} + Amount{6} == Amount{11});
    CHECK(Amount{5} < Amount{6});
    CHECK(Amount{6} >= Amount{6});

    SUBCASE("overflow throws and leaves the value")
    {
        Amount m = Amount::max();
        CHECK_THROWS_AS(m += 1, std::overflow_error);
        CHECK(m == Amount::max());
    }

    SUBCASE("underflow throws and leaves the value")
    {
        Amount s{3};
        CHECK_THROWS_AS(s -= 4, std::underflow_error);
        CHECK(s == Amount{3});
    }

    CHECK(saturatingSub(Amount{3}, Amount{4}) == Amount{});
    CHECK(saturatingSub(Amount{10}, Amount{4}) == Amount{6});
}

TEST_CASE("mulDiv")
{
    CHECK(mulDiv(Amount{10}, Amount{3}, Amount{4}) == Amount{7});
    CHECK(mulDivCeil(Amount{10}, Amount{3}, Amount{4}) == Amount{8});
    CHECK(mulDivCeil(Amount{12}, Amount{3}, Amount{4}) == Amount{9});

    // The intermediate product exceeds 128 bits.
    CHECK(mulDiv(Amount::max(), Amount::max(), Amount::max()) == Amount::max());

    CHECK_THROWS_AS(
        mulDiv(Amount{1}, Amount{1}, Amount{}), std::domain_error);
    CHECK_THROWS_AS(
        mulDivCeil(Amount{1}, Amount{1}, Amount{}), std::domain_error);
    CHECK_THROWS_AS(
        mulDiv(Amount::max(), Amount{2}, Amount{1}), std::overflow_error);

    CHECK(bipsOfValue(Amount{100}, 2000) == Amount{20});
    CHECK(bipsOfValue(Amount{99}, 5000) == Amount{49});
}

TEST_CASE("parseAmount")
{
    CHECK(parseAmount("0") == Amount{});
    CHECK(parseAmount("1500") == Amount{1500});
    CHECK(
        parseAmount("79228162514264337593543950335") == Amount::max());
    CHECK(!parseAmount("79228162514264337593543950336"));
    CHECK(!parseAmount(""));
    CHECK(!parseAmount("-1"));
    CHECK(!parseAmount("12a"));
    CHECK(!parseAmount(" 12"));
}

TEST_CASE("formatting")
{
    std::ostringstream ss;
    ss << Amount{42};
    CHECK(ss.str() == "42");
    CHECK(to_string(Amount{1000}) == "1000");
    CHECK(Amount{1000}.toUInt64() == 1000u);
    CHECK(!Amount::max().toUInt64());
}

TEST_SUITE_END();
