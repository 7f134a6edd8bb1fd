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

#ifndef STRATA_BASICS_INSTRUMENTATION_H_INCLUDED
#define STRATA_BASICS_INSTRUMENTATION_H_INCLUDED

#include <strata/basics/contract.h>

#include <stdexcept>
#include <string>

namespace strata {
namespace detail {

[[noreturn]] inline void
assertionFailed(char const* condition, char const* message)
{
    Throw<std::logic_error>(
        std::string("Assertion failed: ") + message + " (" + condition + ")");
}

}  // namespace detail
}  // namespace strata

/** Check an internal invariant.

    The message names the location and the expectation, in the form
    "strata::Class::function : expectation". A failed check throws
    std::logic_error, which the lending pool reports as tefEXCEPTION after
    discarding the partially applied operation.
*/
#define STRATA_ASSERT(cond, message)                           \
    do                                                         \
    {                                                          \
        if (!(cond))                                           \
            ::strata::detail::assertionFailed(#cond, message); \
    } while (false)

#endif
