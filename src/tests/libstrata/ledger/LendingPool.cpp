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

#include <strata/ledger/LendingPool.h>

#include <doctest/doctest.h>

#include <sstream>

using namespace strata;
using namespace std::chrono_literals;

TEST_SUITE_BEGIN("LendingPool");

namespace {

struct LendingPoolFixture
{
    std::ostringstream log;
    Logs logs{Journal::severities::kError, log};
    LedgerTime const now = fromSeconds(1'700'000'000);

    static PoolConfig
    makeConfig()
    {
        PoolConfig config;
        config.riskAdjustmentBps = 2000;
        FirstLossCoverConfig cover;
        cover.name = "borrower";
        cover.riskYieldMultiplierBps = 15'000;
        cover.minLiquidity = Amount{20};
        config.covers.push_back(cover);
        return config;
    }
};

}  // namespace

TEST_CASE_FIXTURE(LendingPoolFixture, "lifecycle")
{
    LendingPool pool(makeConfig(), logs);
    CHECK(!pool.isEnabled());
    CHECK(pool.currentEpochId() == 0);

    auto const disabled = pool.deposit(Tranche::junior, "bob", Amount{100}, now);
    REQUIRE(!disabled);
    CHECK(disabled.error() == terPOOL_DISABLED);
    CHECK(!pool.closeEpoch(now));

    CHECK(isTesSuccess(pool.enablePool(now)));
    CHECK(pool.isEnabled());
    CHECK(pool.currentEpochId() == 1);

    CHECK(isTesSuccess(pool.disablePool()));
    CHECK(isTesSuccess(pool.enablePool(now + 1h)));
    CHECK(pool.currentEpochId() == 1);
}

TEST_CASE_FIXTURE(LendingPoolFixture, "deposit rules")
{
    auto config = makeConfig();
    config.liquidityCap = Amount{1005};
    config.minDeposit = Amount{10};
    LendingPool pool(config, logs);
    REQUIRE(isTesSuccess(pool.enablePool(now)));

    auto check = [&](Tranche tranche, Amount const& amount, TER expected) {
        auto const result = pool.deposit(tranche, "bob", amount, now);
        if (isTesSuccess(expected))
        {
            CHECK(result.has_value());
        }
        else
        {
            REQUIRE(!result);
            CHECK(result.error() == expected);
        }
    };

    check(Tranche::junior, Amount{}, temBAD_AMOUNT);
    check(Tranche::junior, Amount{9}, temBELOW_MIN_DEPOSIT);
    check(Tranche::senior, Amount{10}, terSENIOR_RATIO);
    check(Tranche::junior, Amount{200}, tesSUCCESS);
    check(Tranche::senior, Amount{801}, terSENIOR_RATIO);
    check(Tranche::senior, Amount{800}, tesSUCCESS);
    check(Tranche::junior, Amount{1}, temBELOW_MIN_DEPOSIT);
    check(Tranche::junior, Amount{10}, terLIQUIDITY_CAP);

    auto const escrow = pool.deposit(
        Tranche::junior, TrancheVault::escrowAccount(), Amount{10}, now);
    REQUIRE(!escrow);
    CHECK(escrow.error() == temMALFORMED);

    CHECK(pool.assets() == TrancheAssets{Amount{800}, Amount{200}});
    CHECK(pool.balanceOf(Tranche::senior, "bob") == Amount{800});
    CHECK(pool.trancheAvailableCap(Tranche::junior) == Amount{5});
}

TEST_CASE_FIXTURE(LendingPoolFixture, "profit, fees and covers")
{
    auto config = makeConfig();
    config.fees.protocolFeeBps = 1000;
    LendingPool pool(config, logs);
    REQUIRE(isTesSuccess(pool.enablePool(now)));
    REQUIRE(pool.deposit(Tranche::junior, "bob", Amount{200}, now).has_value());
    REQUIRE(pool.deposit(Tranche::senior, "alice", Amount{800}, now).has_value());
    REQUIRE(isTesSuccess(pool.depositCover(0, Amount{50})));
    CHECK(pool.depositCover(1, Amount{50}) == temBAD_COVER);

    // 10% of 111 goes to the protocol first and leaves 100.
    auto const profit = pool.distributeProfit(Amount{111}, now);
    REQUIRE(profit.has_value());
    CHECK(profit->seniorProfit == Amount{64});
    CHECK(profit->juniorProfit == Amount{27});
    CHECK(profit->coverProfits[0] == Amount{9});
    CHECK(pool.assets() == TrancheAssets{Amount{864}, Amount{227}});

    auto const json = pool.getJson();
    CHECK(json["fees"]["protocol"].asString() == "11");
    CHECK(json["first_loss_covers"][0u]["total_assets"].asString() == "59");
    CHECK(json["tranches"]["senior"]["total_assets"].asString() == "864");

    CHECK(pool.isCoverSufficient(0) == true);
    CHECK(!pool.isCoverSufficient(3));
    CHECK(pool.redeemCover(0, Amount{40}) == temINSUFFICIENT_COVER);
    CHECK(isTesSuccess(pool.redeemCover(0, Amount{39})));
}

TEST_CASE_FIXTURE(LendingPoolFixture, "failed operations leave no trace")
{
    LendingPool pool(makeConfig(), logs);
    REQUIRE(isTesSuccess(pool.enablePool(now)));
    auto const nearMax = Amount::max() - Amount{10};
    REQUIRE(pool.deposit(Tranche::junior, "bob", nearMax, now).has_value());
    auto const before = pool.getJson();

    auto const overflow = pool.distributeProfit(Amount{100}, now);
    REQUIRE(!overflow);
    CHECK(overflow.error() == tefOVERFLOW);
    CHECK(pool.getJson() == before);
    CHECK(log.str().find("LendingPool:FTL") != std::string::npos);

    auto const loss = pool.distributeLoss(Amount::max(), now);
    REQUIRE(!loss);
    CHECK(loss.error() == temLOSS_EXCEEDS_ASSETS);
    CHECK(pool.getJson() == before);
}

TEST_CASE_FIXTURE(LendingPoolFixture, "fee overflow rolls back the waterfall")
{
    auto config = makeConfig();
    config.fees.protocolFeeBps = 9000;
    LendingPool pool(config, logs);
    REQUIRE(isTesSuccess(pool.enablePool(now)));
    REQUIRE(pool.deposit(Tranche::junior, "bob", Amount{1000}, now).has_value());

    auto const half = mulDiv(Amount::max(), Amount{1}, Amount{2});
    REQUIRE(pool.distributeProfit(half, now).has_value());
    REQUIRE(pool.distributeProfit(half, now).has_value());
    auto const before = pool.getJson();

    // The third protocol cut no longer fits in the fee accumulator.
    auto const overflow = pool.distributeProfit(half, now);
    REQUIRE(!overflow);
    CHECK(overflow.error() == tefOVERFLOW);
    CHECK(pool.getJson() == before);
}

TEST_CASE_FIXTURE(LendingPoolFixture, "redemption round trip")
{
    LendingPool pool(makeConfig(), logs);
    REQUIRE(isTesSuccess(pool.enablePool(now)));
    REQUIRE(pool.deposit(Tranche::junior, "bob", Amount{500}, now).has_value());
    REQUIRE(pool.deposit(Tranche::senior, "alice", Amount{1000}, now).has_value());

    CHECK(isTesSuccess(pool.addRedemptionRequest(
        Tranche::senior, "alice", Amount{400}, now)));
    CHECK(pool.cancellableRedemptionShares(Tranche::senior, "alice") ==
          Amount{400});
    CHECK(isTesSuccess(pool.cancelRedemptionRequest(
        Tranche::senior, "alice", Amount{100})));
    CHECK(pool.balanceOf(Tranche::senior, "alice") == Amount{700});

    // Lend most of the cash; the reserve only keeps what is not lent.
    REQUIRE(isTesSuccess(pool.drawdown(Amount{1400})));
    CHECK(pool.drawdown(Amount{101}) == terNO_LIQUIDITY);

    auto const early = pool.closeEpoch(now);
    REQUIRE(!early);
    CHECK(early.error() == terEPOCH_NOT_ENDED);

    auto const summary = pool.closeEpoch(now + 24h);
    REQUIRE(summary.has_value());
    CHECK(summary->sharesProcessed.senior == Amount{100});
    CHECK(summary->unmetDemand == Amount{200});
    CHECK(pool.currentEpochId() == 2);
    CHECK(pool.computeWithdrawable(Tranche::senior, "alice") == Amount{100});

    // Cash reserved for the queued demand cannot be lent.
    REQUIRE(isTesSuccess(pool.repay(Amount{300})));
    CHECK(pool.drawdown(Amount{101}) == terNO_LIQUIDITY);
    CHECK(isTesSuccess(pool.drawdown(Amount{100})));

    auto const paid = pool.disburse(Tranche::senior, "alice");
    REQUIRE(paid.has_value());
    CHECK(*paid == Amount{100});
    CHECK(pool.computeWithdrawable(Tranche::senior, "alice") == Amount{});

    auto const closed = pool.closeEpoch(now + 48h);
    REQUIRE(closed.has_value());
    CHECK(closed->sharesProcessed.senior == Amount{200});
    CHECK(pool.computeWithdrawable(Tranche::senior, "alice") == Amount{200});
    CHECK(pool.assets() == TrancheAssets{Amount{700}, Amount{500}});
}

TEST_CASE_FIXTURE(LendingPoolFixture, "withdrawal lockout")
{
    auto config = makeConfig();
    config.withdrawalLockout = 1h;
    LendingPool pool(config, logs);
    REQUIRE(isTesSuccess(pool.enablePool(now)));
    REQUIRE(pool.deposit(Tranche::junior, "bob", Amount{500}, now).has_value());

    CHECK(
        pool.addRedemptionRequest(Tranche::junior, "bob", Amount{10}, now) ==
        terWITHDRAWAL_LOCKED);
    CHECK(isTesSuccess(pool.addRedemptionRequest(
        Tranche::junior, "bob", Amount{10}, now + 1h)));
}

TEST_SUITE_END();

TEST_SUITE_BEGIN("FeeCollector");

TEST_CASE("flat rate cuts")
{
    FeeConfig config;
    config.protocolFeeBps = 100;
    config.poolOwnerRewardBps = 200;
    config.evaluationAgentRewardBps = 100;
    FlatRateFeeCollector fees(config);

    auto const plan = fees.calcPoolFeeDistribution(Amount{10'000});
    CHECK(plan.protocolFee == Amount{100});
    CHECK(plan.poolOwnerReward == Amount{198});
    CHECK(plan.evaluationAgentReward == Amount{99});
    CHECK(plan.poolProfit == Amount{9'603});

    CHECK(fees.getJson()["protocol"].asString() == "0");
    CHECK(fees.distributePoolFees(Amount{10'000}) == Amount{9'603});
    CHECK(fees.getJson()["pool_owner"].asString() == "198");
}

TEST_SUITE_END();
