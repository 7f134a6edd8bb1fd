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

#ifndef STRATA_PROTOCOL_JSONFIELDS_H_INCLUDED
#define STRATA_PROTOCOL_JSONFIELDS_H_INCLUDED

#include <json/json.h>

namespace strata {
namespace jss {

// JSON static strings

#define JSS(x) inline ::Json::StaticString const x(#x)

JSS(amount);                  // out: Replay
JSS(amount_processed);        // out: EpochInfo
JSS(available_reservation);   // out: LiquidityReserve
JSS(balance);                 // out: LiquidityReserve, ShareLedger
JSS(command);                 // out: Replay
JSS(cover_cap_per_loss);      // out: FirstLossCover
JSS(cover_rate_per_loss_bps); // out: FirstLossCover
JSS(covered_loss);            // out: FirstLossCover
JSS(covers);                  // out: Replay
JSS(current_epoch);           // out: EpochManager
JSS(disbursement);            // out: TrancheVault
JSS(enabled);                 // out: LendingPool
JSS(end_time);                // out: EpochManager
JSS(epoch);                   // out: Replay
JSS(epochs);                  // out: TrancheVault
JSS(evaluation_agent);        // out: FeeCollector
JSS(fees);                    // out: LendingPool
JSS(first_loss_covers);       // out: Pool
JSS(first_unprocessed_epoch); // out: TrancheVault
JSS(fixed_yield_bps);         // out: TranchesPolicy
JSS(held);                    // out: TrancheVault
JSS(id);                      // out: EpochManager, EpochInfo
JSS(index);                   // out: FirstLossCover
JSS(junior);                  // out: Pool
JSS(last_deposit_time);       // out: TrancheVault
JSS(last_updated_day);        // out: SeniorYieldTracker
JSS(lender);                  // out: Replay
JSS(lenders);                 // out: TrancheVault
JSS(line);                    // out: Replay
JSS(liquidity);               // out: LendingPool
JSS(losses);                  // out: Pool
JSS(max_liquidity);           // out: FirstLossCover
JSS(min_liquidity);           // out: FirstLossCover
JSS(name);                    // out: FirstLossCover
JSS(now);                     // out: Replay
JSS(partial_amount);          // out: LenderDisbursementCursor
JSS(partial_shares);          // out: LenderDisbursementCursor
JSS(policy);                  // out: Pool
JSS(pool_owner);              // out: FeeCollector
JSS(protocol);                // out: FeeCollector
JSS(requests);                // out: TrancheVault
JSS(requests_index);          // out: LenderDisbursementCursor
JSS(reservation_target);      // out: LiquidityReserve
JSS(result);                  // out: Replay
JSS(risk_adjustment_bps);     // out: TranchesPolicy
JSS(risk_yield_multiplier_bps); // out: FirstLossCover
JSS(senior);                  // out: Pool
JSS(senior_yield_tracker);    // out: Pool
JSS(share_price);             // out: TrancheVault
JSS(shares);                  // out: TrancheVault
JSS(shares_processed);        // out: EpochInfo
JSS(shares_requested);        // out: EpochInfo
JSS(state);                   // out: Replay
JSS(total_assets);            // out: Pool, FirstLossCover
JSS(total_supply);            // out: ShareLedger
JSS(tranche);                 // out: Replay
JSS(tranches);                // out: LendingPool
JSS(type);                    // out: Pool
JSS(unmet_demand);            // out: Replay
JSS(unpaid_yield);            // out: SeniorYieldTracker
JSS(withdrawn);               // out: TrancheVault

#undef JSS

// "class" is a keyword, so this one is spelled out.
inline ::Json::StaticString const result_class("class");  // out: Replay

}  // namespace jss
}  // namespace strata

#endif
