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

#ifndef STRATA_BASICS_LOG_H_INCLUDED
#define STRATA_BASICS_LOG_H_INCLUDED

#include <strata/basics/Journal.h>

#include <iosfwd>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace strata {

/** Manages partitions for logging. */
class Logs
{
private:
    class Sink : public Journal::Sink
    {
    private:
        Logs& logs_;
        std::string partition_;

    public:
        Sink(
            std::string const& partition,
            Journal::severities thresh,
            Logs& logs);

        Sink(Sink const&) = delete;
        Sink&
        operator=(Sink const&) = delete;

        void
        write(Journal::severities level, std::string const& text) override;
    };

    std::mutex mutable mutex_;
    std::map<std::string, std::unique_ptr<Journal::Sink>, std::less<>> sinks_;
    Journal::severities thresh_;
    std::ostream& out_;

public:
    /** Messages go to `out`, which must outlive this object. */
    Logs(Journal::severities level, std::ostream& out);

    Logs(Logs const&) = delete;
    Logs&
    operator=(Logs const&) = delete;

    virtual ~Logs() = default;

    Journal::Sink&
    get(std::string const& name);

    Journal::Sink&
    operator[](std::string const& name);

    Journal
    journal(std::string const& name);

    Journal::severities
    threshold() const;

    /** Change the threshold of this object and of every partition. */
    void
    threshold(Journal::severities thresh);

    void
    write(
        Journal::severities level,
        std::string const& partition,
        std::string const& text);

public:
    static std::string
    toString(Journal::severities s);

    /** Parse a severity name. Accepts the names toString produces and the
        short forms "warn" and "all". */
    static std::optional<Journal::severities>
    fromString(std::string const& s);

    static std::string
    format(
        Journal::severities level,
        std::string const& partition,
        std::string const& message);
};

// Wraps a Journal::Stream to skip evaluation of
// expensive argument lists if the stream is not active.
#ifndef JLOG
#define JLOG(x) \
    if (!x)     \
    {           \
    }           \
    else        \
        x
#endif

}  // namespace strata

#endif
