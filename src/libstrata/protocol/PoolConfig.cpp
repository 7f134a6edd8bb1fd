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

#include <strata/basics/contract.h>
#include <strata/protocol/PoolConfig.h>
#include <strata/protocol/Protocol.h>

#include <set>
#include <stdexcept>

namespace strata {

namespace {

[[noreturn]] void
badSetting(
    std::string const& section,
    std::string const& key,
    std::string const& why)
{
    Throw<std::runtime_error>(
        "Invalid setting [" + section + "] " + key + ": " + why);
}

Amount
getAmount(Section const& section, std::string const& key, Amount const& def)
{
    auto const text = section.get(key);
    if (!text)
        return def;
    auto const amount = parseAmount(*text);
    if (!amount)
        badSetting(section.name(), key, "not an amount: " + *text);
    return *amount;
}

template <class T>
T
getNumber(Section const& section, std::string const& key, T const& def)
{
    try
    {
        return section.value_or<T>(key, def);
    }
    catch (boost::bad_lexical_cast const&)
    {
        badSetting(section.name(), key, "not a number");
    }
}

std::uint32_t
getBips(
    Section const& section,
    std::string const& key,
    std::uint32_t def,
    std::uint32_t max = bipsPerUnity)
{
    auto const bips = getNumber<std::uint32_t>(section, key, def);
    if (bips > max)
        badSetting(section.name(), key, "exceeds " + std::to_string(max));
    return bips;
}

FirstLossCoverConfig
loadCover(BasicConfig const& config, std::string const& name)
{
    auto const sectionName = "first_loss_cover." + name;
    if (!config.exists(sectionName))
        badSetting("first_loss_covers", name, "missing [" + sectionName + "]");
    auto const& section = config.section(sectionName);

    FirstLossCoverConfig cover;
    cover.name = name;
    cover.coverRatePerLossBps = getBips(
        section, "cover_rate_per_loss_bps", cover.coverRatePerLossBps);
    cover.coverCapPerLoss =
        getAmount(section, "cover_cap_per_loss", Amount::max());
    cover.riskYieldMultiplierBps = getNumber<std::uint32_t>(
        section, "risk_yield_multiplier_bps", 0);
    cover.minLiquidity = getAmount(section, "min_liquidity", Amount{});
    cover.maxLiquidity = getAmount(section, "max_liquidity", Amount::max());
    if (cover.minLiquidity > cover.maxLiquidity)
        badSetting(sectionName, "min_liquidity", "exceeds max_liquidity");
    return cover;
}

}  // namespace

char const*
to_string(TranchesPolicyType type)
{
    switch (type)
    {
        case TranchesPolicyType::riskAdjusted:
            return "risk_adjusted";
        case TranchesPolicyType::fixedSeniorYield:
            return "fixed_senior_yield";
    }
    return "unknown";  // LCOV_EXCL_LINE
}

PoolConfig
loadPoolConfig(BasicConfig const& config)
{
    PoolConfig result;

    {
        auto const& pool = config.section("pool");
        result.liquidityCap =
            getAmount(pool, "liquidity_cap", result.liquidityCap);
        result.maxSeniorJuniorRatioBps = getNumber<std::uint32_t>(
            pool, "max_senior_junior_ratio_bps", result.maxSeniorJuniorRatioBps);
        if (result.maxSeniorJuniorRatioBps == 0)
            badSetting("pool", "max_senior_junior_ratio_bps", "must be positive");

        auto const window = getNumber<std::int64_t>(
            pool, "epoch_window_seconds", result.epochWindow.count());
        if (window <= 0)
            badSetting("pool", "epoch_window_seconds", "must be positive");
        result.epochWindow = std::chrono::seconds{window};

        result.flexWindowEpochs = getNumber<std::uint32_t>(
            pool, "flex_window_epochs", result.flexWindowEpochs);

        auto const lockout = getNumber<std::int64_t>(
            pool, "withdrawal_lockout_seconds", 0);
        if (lockout < 0)
            badSetting("pool", "withdrawal_lockout_seconds", "is negative");
        result.withdrawalLockout = std::chrono::seconds{lockout};

        result.minDeposit = getAmount(pool, "min_deposit", result.minDeposit);
    }

    {
        auto const& policy = config.section("tranches_policy");
        auto const type =
            policy.get("type").value_or(to_string(result.policyType));
        if (type == to_string(TranchesPolicyType::riskAdjusted))
            result.policyType = TranchesPolicyType::riskAdjusted;
        else if (type == to_string(TranchesPolicyType::fixedSeniorYield))
            result.policyType = TranchesPolicyType::fixedSeniorYield;
        else
            badSetting("tranches_policy", "type", "unknown policy " + type);

        result.riskAdjustmentBps = getBips(policy, "risk_adjustment_bps", 0);
        result.fixedYieldBps = getNumber<std::uint32_t>(
            policy, "fixed_yield_bps", 0);
    }

    {
        std::set<std::string> seen;
        for (auto const& name : config.section("first_loss_covers").values())
        {
            if (!seen.insert(name).second)
                badSetting("first_loss_covers", name, "listed twice");
            result.covers.push_back(loadCover(config, name));
        }
        if (result.covers.size() > maxFirstLossCovers)
            badSetting(
                "first_loss_covers",
                "",
                "more than " + std::to_string(maxFirstLossCovers) + " covers");
    }

    {
        auto const& fees = config.section("fees");
        result.fees.protocolFeeBps = getBips(fees, "protocol_fee_bps", 0);
        result.fees.poolOwnerRewardBps =
            getBips(fees, "pool_owner_reward_bps", 0);
        result.fees.evaluationAgentRewardBps =
            getBips(fees, "evaluation_agent_reward_bps", 0);
        if (result.fees.protocolFeeBps + result.fees.poolOwnerRewardBps +
                result.fees.evaluationAgentRewardBps >=
            bipsPerUnity)
            badSetting("fees", "", "fee cuts must total less than 10000 bps");
    }

    return result;
}

}  // namespace strata
