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
#include <strata/protocol/Tranche.h>

#include <doctest/doctest.h>

#include <sstream>

using namespace strata;

TEST_SUITE_BEGIN("TER");

TEST_CASE("boolean context is true for failures")
{
    CHECK(!TER{tesSUCCESS});
    CHECK(TER{temBAD_AMOUNT});
    CHECK(TER{terNO_LIQUIDITY});
    CHECK(TER{tefOVERFLOW});
    CHECK(TER{} == tesSUCCESS);
}

TEST_CASE("result classes")
{
    CHECK(classify(tesSUCCESS) == ResultClass::success);
    CHECK(classify(temRECOVERY_EXCEEDS_LOSS) == ResultClass::preconditionViolation);
    CHECK(classify(temINSUFFICIENT_COVER) == ResultClass::preconditionViolation);
    CHECK(classify(terEPOCH_NOT_ENDED) == ResultClass::constraintBlocked);
    CHECK(classify(terCOVER_CAP) == ResultClass::constraintBlocked);
    CHECK(classify(tefEXCEPTION) == ResultClass::fatalFailure);

    CHECK(to_string(ResultClass::preconditionViolation) == "precondition_violation");
    CHECK(to_string(ResultClass::constraintBlocked) == "constraint_blocked");
    CHECK(to_string(ResultClass::fatalFailure) == "fatal_failure");
}

TEST_CASE("tokens and descriptions")
{
    CHECK(transToken(terSENIOR_RATIO) == "terSENIOR_RATIO");
    CHECK(transToken(tesSUCCESS) == "tesSUCCESS");
    CHECK(transHuman(temZERO_TOTAL_ASSETS) == "Tranche assets are zero.");

    std::ostringstream ss;
    ss << TER{terWITHDRAWAL_LOCKED};
    CHECK(ss.str() == "terWITHDRAWAL_LOCKED");

    auto const code = transCode("temLOSS_EXCEEDS_ASSETS");
    REQUIRE(code);
    CHECK(*code == temLOSS_EXCEEDS_ASSETS);
    CHECK(!transCode("temNOT_A_CODE"));
}

TEST_CASE("raw codes")
{
    CHECK(TERtoInt(temMALFORMED) == -299);
    CHECK(TERtoInt(tefFAILURE) == -199);
    CHECK(TERtoInt(terRETRY) == -99);

    auto const code = TER::fromInt(TERtoInt(terNO_LIQUIDITY));
    REQUIRE(code);
    CHECK(*code == terNO_LIQUIDITY);
    CHECK(!TER::fromInt(-1000));
    CHECK(transToken(TER{}) == "tesSUCCESS");
}

TEST_CASE("tranche names")
{
    CHECK(std::string(to_string(Tranche::senior)) == "senior");
    CHECK(trancheFromString("junior") == Tranche::junior);
    CHECK(!trancheFromString("mezzanine"));

    TrancheAmounts amounts{Amount{800}, Amount{200}};
    CHECK(amounts[Tranche::senior] == Amount{800});
    amounts[Tranche::junior] += 50;
    CHECK(amounts.total() == Amount{1050});
}

TEST_SUITE_END();
