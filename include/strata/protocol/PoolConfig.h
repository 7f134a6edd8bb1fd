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

#ifndef STRATA_PROTOCOL_POOLCONFIG_H_INCLUDED
#define STRATA_PROTOCOL_POOLCONFIG_H_INCLUDED

#include <strata/basics/Amount.h>
#include <strata/basics/BasicConfig.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace strata {

enum class TranchesPolicyType { riskAdjusted, fixedSeniorYield };

char const*
to_string(TranchesPolicyType type);

/** Parameters of one first-loss cover. */
struct FirstLossCoverConfig
{
    std::string name;

    // Share of each loss the cover pays, in basis points of the loss.
    std::uint32_t coverRatePerLossBps = 10'000;

    // Most the cover pays for a single loss.
    Amount coverCapPerLoss = Amount::max();

    // Weight multiplier applied to the cover's assets when sharing profit.
    std::uint32_t riskYieldMultiplierBps = 0;

    // Assets that must stay in the cover; only the excess is redeemable.
    Amount minLiquidity;

    // Upper bound on cover assets accepted through deposits.
    Amount maxLiquidity = Amount::max();
};

/** Fee cuts taken from profit before the waterfall. */
struct FeeConfig
{
    std::uint32_t protocolFeeBps = 0;
    std::uint32_t poolOwnerRewardBps = 0;
    std::uint32_t evaluationAgentRewardBps = 0;
};

/** Pool wide settings. Loaded once at startup and never changed. */
struct PoolConfig
{
    Amount liquidityCap = Amount::max();
    std::uint32_t maxSeniorJuniorRatioBps = 40'000;
    std::chrono::seconds epochWindow{std::chrono::hours{24}};
    std::uint32_t flexWindowEpochs = 0;
    std::chrono::seconds withdrawalLockout{0};
    Amount minDeposit;

    TranchesPolicyType policyType = TranchesPolicyType::riskAdjusted;
    std::uint32_t riskAdjustmentBps = 0;
    std::uint32_t fixedYieldBps = 0;

    // Absorption order: index 0 absorbs loss first.
    std::vector<FirstLossCoverConfig> covers;

    FeeConfig fees;
};

/** Build a PoolConfig from the [pool], [tranches_policy],
    [first_loss_covers], [first_loss_cover.<name>] and [fees] sections.

    Throws std::runtime_error naming the section and key of the first
    invalid setting.
*/
PoolConfig
loadPoolConfig(BasicConfig const& config);

}  // namespace strata

#endif
