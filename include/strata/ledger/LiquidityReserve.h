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

#ifndef STRATA_LEDGER_LIQUIDITYRESERVE_H_INCLUDED
#define STRATA_LEDGER_LIQUIDITYRESERVE_H_INCLUDED

#include <strata/basics/Amount.h>
#include <strata/protocol/Tranche.h>

#include <json/json.h>

#include <string>

namespace strata {

/** Custody of the pool's cash.

    The engine only tells the reserve what moved where; the reserve moves
    the funds.
*/
class LiquidityReserve
{
public:
    virtual ~LiquidityReserve() = default;

    /** Cash an epoch close may pay out to redeeming lenders. */
    virtual Amount
    availableReservation() const = 0;

    /** Hold back `target` from lending for the next epoch close. */
    virtual void
    setReservationTarget(Amount const& target) = 0;

    virtual void
    deposit(std::string const& from, Amount const& amount) = 0;

    /** Throws std::logic_error if the reserve holds less than `amount`. */
    virtual void
    withdraw(std::string const& to, Amount const& amount) = 0;
};

/** In-memory reserve backing a single pool. */
class PoolSafe final : public LiquidityReserve
{
    Amount balance_;
    Amount reservationTarget_;

public:
    Amount const&
    totalBalance() const
    {
        return balance_;
    }

    Amount const&
    reservationTarget() const
    {
        return reservationTarget_;
    }

    Amount
    availableReservation() const override
    {
        return balance_;
    }

    /** Cash not held back for redemptions. */
    Amount
    availableForLending() const
    {
        return saturatingSub(balance_, reservationTarget_);
    }

    void
    setReservationTarget(Amount const& target) override
    {
        reservationTarget_ = target;
    }

    void
    deposit(std::string const& from, Amount const& amount) override;

    void
    withdraw(std::string const& to, Amount const& amount) override;

    Json::Value
    getJson() const;
};

}  // namespace strata

#endif
