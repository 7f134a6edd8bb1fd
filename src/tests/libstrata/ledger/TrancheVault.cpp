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

#include <strata/ledger/TrancheVault.h>

#include <doctest/doctest.h>

using namespace strata;
using namespace std::chrono_literals;

TEST_SUITE_BEGIN("TrancheVault");

namespace {

struct VaultFixture
{
    LedgerTime const now = fromSeconds(1'700'000'000);
    TrancheVault vault{Tranche::senior, Journal(Journal::getNullSink())};

    VaultFixture()
    {
        vault.deposit("alice", Amount{400}, now);
        vault.deposit("bob", Amount{600}, now);
    }

    TER
    request(LenderID const& lender, Amount const& shares, std::uint64_t epoch)
    {
        return vault.addRedemptionRequest(lender, shares, epoch, now, 0s);
    }
};

}  // namespace

TEST_CASE_FIXTURE(VaultFixture, "share conversion")
{
    TrancheVault empty{Tranche::junior, Journal(Journal::getNullSink())};
    auto const first = empty.convertToShares(Amount{500}, Amount{});
    REQUIRE(first.has_value());
    CHECK(*first == Amount{500});

    auto const shares = vault.convertToShares(Amount{500}, Amount{2000});
    REQUIRE(shares.has_value());
    CHECK(*shares == Amount{250});
    CHECK(vault.convertToAssets(Amount{250}, Amount{2000}) == Amount{500});

    auto const wiped = vault.convertToShares(Amount{500}, Amount{});
    REQUIRE(!wiped);
    CHECK(wiped.error() == temZERO_TOTAL_ASSETS);
}

TEST_CASE_FIXTURE(VaultFixture, "requests move shares into escrow")
{
    CHECK(isTesSuccess(request("alice", Amount{100}, 1)));
    CHECK(isTesSuccess(request("alice", Amount{50}, 1)));
    CHECK(vault.balanceOf("alice") == Amount{250});
    CHECK(vault.balanceOf(TrancheVault::escrowAccount()) == Amount{150});
    CHECK(vault.totalSupply() == Amount{1000});

    auto const record = vault.lenderRecord("alice");
    REQUIRE(record);
    REQUIRE(record->requests.size() == 1);
    CHECK(record->requests[0].sharesRequested == Amount{150});

    auto const epoch = vault.epochInfo(1);
    REQUIRE(epoch);
    CHECK(epoch->totalSharesRequested == Amount{150});
    CHECK(vault.unprocessedEpochInfos().size() == 1);

    CHECK(request("alice", Amount{}, 1) == temBAD_AMOUNT);
    CHECK(request("alice", Amount{251}, 1) == temINSUFFICIENT_SHARES);
    CHECK(request("carol", Amount{1}, 1) == temINSUFFICIENT_SHARES);
    CHECK(
        request(TrancheVault::escrowAccount(), Amount{1}, 1) == temMALFORMED);
}

TEST_CASE_FIXTURE(VaultFixture, "withdrawal lockout")
{
    CHECK(
        vault.addRedemptionRequest("alice", Amount{10}, 1, now + 59s, 60s) ==
        terWITHDRAWAL_LOCKED);
    CHECK(isTesSuccess(
        vault.addRedemptionRequest("alice", Amount{10}, 1, now + 60s, 60s)));
}

TEST_CASE_FIXTURE(VaultFixture, "cancel")
{
    CHECK(
        vault.cancelRedemptionRequest("alice", Amount{1}, 1) ==
        temNO_REDEMPTION_REQUEST);

    REQUIRE(isTesSuccess(request("alice", Amount{100}, 1)));
    CHECK(vault.cancellableRedemptionShares("alice", 1) == Amount{100});
    CHECK(
        vault.cancelRedemptionRequest("alice", Amount{101}, 1) ==
        temINSUFFICIENT_SHARES);
    CHECK(
        vault.cancelRedemptionRequest("alice", Amount{}, 1) == temBAD_AMOUNT);

    CHECK(isTesSuccess(vault.cancelRedemptionRequest("alice", Amount{40}, 1)));
    CHECK(vault.balanceOf("alice") == Amount{340});
    CHECK(vault.epochInfo(1)->totalSharesRequested == Amount{60});

    CHECK(vault.cancellableRedemptionShares("alice", 2) == Amount{});
    CHECK(
        vault.cancelRedemptionRequest("alice", Amount{10}, 2) ==
        temEPOCH_NOT_CURRENT);

    CHECK(isTesSuccess(vault.cancelRedemptionRequest("alice", Amount{60}, 1)));
    CHECK(vault.balanceOf("alice") == Amount{400});
    CHECK(!vault.epochInfo(1));
    CHECK(vault.unprocessedEpochInfos().empty());
    CHECK(vault.lenderRecord("alice")->requests.empty());
}

TEST_CASE_FIXTURE(VaultFixture, "partial then full settlement")
{
    REQUIRE(isTesSuccess(request("alice", Amount{400}, 1)));
    REQUIRE(isTesSuccess(request("bob", Amount{600}, 1)));

    REQUIRE(isTesSuccess(vault.applySettlement({{1, Amount{750}, Amount{1500}}})));
    CHECK(vault.totalSupply() == Amount{250});
    CHECK(vault.heldForDisbursement() == Amount{1500});
    CHECK(!vault.epochInfo(1)->fulfilled());

    auto const first = vault.computeWithdrawable("alice");
    CHECK(first.amount == Amount{600});
    CHECK(first.shares == Amount{300});
    CHECK(first.cursor.requestsIndex == 0);

    // Reading changes nothing.
    CHECK(vault.computeWithdrawable("alice").amount == Amount{600});

    auto const paid = vault.disburse("alice");
    REQUIRE(paid.has_value());
    CHECK(*paid == Amount{600});
    CHECK(vault.computeWithdrawable("alice").amount == Amount{});
    auto const again = vault.disburse("alice");
    REQUIRE(again.has_value());
    CHECK(*again == Amount{});

    REQUIRE(isTesSuccess(vault.applySettlement({{1, Amount{250}, Amount{500}}})));
    CHECK(vault.epochInfo(1)->fulfilled());
    CHECK(vault.unprocessedEpochInfos().empty());

    auto const rest = vault.computeWithdrawable("alice");
    CHECK(rest.amount == Amount{200});
    CHECK(rest.shares == Amount{100});
    CHECK(rest.cursor.requestsIndex == 1);
    CHECK(rest.cursor.partialAmountProcessed == Amount{});

    CHECK(vault.computeWithdrawable("bob").amount == Amount{1200});
    REQUIRE(vault.disburse("alice").has_value());
    REQUIRE(vault.disburse("bob").has_value());
    CHECK(vault.heldForDisbursement() == Amount{});
    CHECK(vault.lenderRecord("alice")->withdrawn == Amount{800});
    CHECK(vault.computeWithdrawable("nobody").amount == Amount{});
}

TEST_CASE_FIXTURE(VaultFixture, "requests across epochs are paid in order")
{
    REQUIRE(isTesSuccess(request("alice", Amount{100}, 1)));
    REQUIRE(isTesSuccess(request("alice", Amount{100}, 2)));
    CHECK(vault.lenderRecord("alice")->requests.size() == 2);

    REQUIRE(isTesSuccess(vault.applySettlement(
        {{1, Amount{100}, Amount{100}}, {2, Amount{50}, Amount{50}}})));
    auto const withdrawable = vault.computeWithdrawable("alice");
    CHECK(withdrawable.amount == Amount{150});
    CHECK(withdrawable.cursor.requestsIndex == 1);
    CHECK(withdrawable.cursor.partialSharesProcessed == Amount{50});
}

TEST_SUITE_END();
