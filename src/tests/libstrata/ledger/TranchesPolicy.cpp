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

#include <strata/ledger/SharePrice.h>
#include <strata/ledger/TranchesPolicy.h>
#include <strata/protocol/Protocol.h>

#include <doctest/doctest.h>

#include <stdexcept>

using namespace strata;
using namespace std::chrono_literals;

TEST_SUITE_BEGIN("TranchesPolicy");

TEST_CASE("risk adjusted split")
{
    RiskAdjustedTranchesPolicy policy(2000);
    auto const split =
        policy.splitProfit(Amount{100}, TrancheAssets{Amount{800}, Amount{200}});
    REQUIRE(split.has_value());
    CHECK(split->senior == Amount{64});
    CHECK(split->junior == Amount{36});
}

TEST_CASE("risk adjusted split rounds in favor of junior")
{
    RiskAdjustedTranchesPolicy policy(0);
    auto const split =
        policy.splitProfit(Amount{10}, TrancheAssets{Amount{2}, Amount{1}});
    REQUIRE(split.has_value());
    CHECK(split->senior == Amount{6});
    CHECK(split->junior == Amount{4});
}

TEST_CASE("risk adjusted split needs assets")
{
    RiskAdjustedTranchesPolicy policy(2000);
    auto const split = policy.splitProfit(Amount{100}, TrancheAssets{});
    REQUIRE(!split);
    CHECK(split.error() == temZERO_TOTAL_ASSETS);
}

TEST_CASE("fixed senior yield accrues daily")
{
    // 36% a year on 1000 is 1 per day.
    FixedSeniorYieldTranchesPolicy policy(3600);
    auto const start = fromSeconds(19'675 * 86'400);
    policy.resync(Amount{1000}, start);
    CHECK(policy.tracker().totalAssets == Amount{1000});
    CHECK(policy.tracker().unpaidYield == Amount{});

    // Accrual counts whole days only.
    policy.refresh(start + 23h);
    CHECK(policy.tracker().unpaidYield == Amount{});

    policy.refresh(start + 10 * 24h);
    CHECK(policy.tracker().unpaidYield == Amount{10});

    auto const first = policy.splitProfit(Amount{100}, TrancheAssets{});
    REQUIRE(first.has_value());
    CHECK(first->senior == Amount{10});
    CHECK(first->junior == Amount{90});
    CHECK(policy.tracker().unpaidYield == Amount{});

    policy.refresh(start + 30 * 24h);
    auto const second = policy.splitProfit(Amount{5}, TrancheAssets{});
    REQUIRE(second.has_value());
    CHECK(second->senior == Amount{5});
    CHECK(second->junior == Amount{});
    CHECK(policy.tracker().unpaidYield == Amount{15});
}

TEST_CASE("fixed senior yield resync accrues on the old base first")
{
    FixedSeniorYieldTranchesPolicy policy(3600);
    auto const start = fromSeconds(19'675 * 86'400);
    policy.resync(Amount{1000}, start);
    policy.resync(Amount{2000}, start + 5 * 24h);
    CHECK(policy.tracker().unpaidYield == Amount{5});
    policy.refresh(start + 6 * 24h);
    CHECK(policy.tracker().unpaidYield == Amount{7});
}

TEST_CASE("policies are chosen by configuration")
{
    PoolConfig config;
    config.policyType = TranchesPolicyType::fixedSeniorYield;
    config.fixedYieldBps = 500;
    auto const fixed = makeTranchesPolicy(config);
    REQUIRE(fixed);
    CHECK(fixed->type() == TranchesPolicyType::fixedSeniorYield);

    config.policyType = TranchesPolicyType::riskAdjusted;
    auto const risk = makeTranchesPolicy(config);
    REQUIRE(risk);
    CHECK(risk->type() == TranchesPolicyType::riskAdjusted);

    auto const copy = risk->clone();
    CHECK(copy->type() == TranchesPolicyType::riskAdjusted);
    CHECK(copy->getJson() == risk->getJson());
}

TEST_CASE("loss hits junior first")
{
    auto const small =
        distributeLoss(Amount{150}, TrancheAssets{Amount{800}, Amount{200}});
    CHECK(small.lossDelta.junior == Amount{150});
    CHECK(small.lossDelta.senior == Amount{});
    CHECK(small.assets == TrancheAssets{Amount{800}, Amount{50}});

    auto const large =
        distributeLoss(Amount{300}, TrancheAssets{Amount{800}, Amount{200}});
    CHECK(large.lossDelta.junior == Amount{200});
    CHECK(large.lossDelta.senior == Amount{100});
    CHECK(large.assets == TrancheAssets{Amount{700}, Amount{}});

    CHECK_THROWS_AS(
        distributeLoss(Amount{1001}, TrancheAssets{Amount{800}, Amount{200}}),
        std::logic_error);
}

TEST_CASE("recovery repays senior first")
{
    auto const split = distributeLossRecovery(
        Amount{150},
        TrancheAssets{Amount{700}, Amount{}},
        TrancheLosses{Amount{100}, Amount{200}});
    CHECK(split.remaining == Amount{});
    CHECK(split.assets == TrancheAssets{Amount{800}, Amount{50}});
    CHECK(split.losses == TrancheLosses{Amount{}, Amount{150}});

    auto const excess = distributeLossRecovery(
        Amount{400},
        TrancheAssets{Amount{700}, Amount{}},
        TrancheLosses{Amount{100}, Amount{200}});
    CHECK(excess.remaining == Amount{100});
    CHECK(excess.losses == TrancheLosses{});
}

TEST_CASE("share price")
{
    CHECK(computeSharePrice(Amount{}, Amount{}) == SharePrice(sharePriceScale));
    auto const price = computeSharePrice(Amount{2000}, Amount{1000});
    CHECK(price == SharePrice(SharePrice(2) * sharePriceScale));
    CHECK(sharesToAmount(Amount{750}, price) == Amount{1500});
    CHECK(amountToShares(Amount{1500}, price) == Amount{750});
    CHECK(amountToShares(Amount{1501}, price) == Amount{750});
    CHECK(computeSharePrice(Amount{}, Amount{10}) == 0);
    CHECK_THROWS_AS(amountToShares(Amount{1}, SharePrice(0)), std::domain_error);
}

TEST_SUITE_END();
