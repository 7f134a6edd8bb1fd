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

#include <strata/basics/Log.h>

#include <boost/algorithm/string/case_conv.hpp>

#include <ostream>

namespace strata {

Logs::Sink::Sink(
    std::string const& partition,
    Journal::severities thresh,
    Logs& logs)
    : Journal::Sink(thresh), logs_(logs), partition_(partition)
{
}

void
Logs::Sink::write(Journal::severities level, std::string const& text)
{
    if (level < threshold())
        return;

    logs_.write(level, partition_, text);
}

//------------------------------------------------------------------------------

Logs::Logs(Journal::severities thresh, std::ostream& out)
    : thresh_(thresh), out_(out)
{
}

Journal::Sink&
Logs::get(std::string const& name)
{
    std::lock_guard lock(mutex_);
    auto const result = sinks_.emplace(name, nullptr);
    if (result.second)
        result.first->second = std::make_unique<Sink>(name, thresh_, *this);
    return *result.first->second;
}

Journal::Sink&
Logs::operator[](std::string const& name)
{
    return get(name);
}

Journal
Logs::journal(std::string const& name)
{
    return Journal(get(name));
}

Journal::severities
Logs::threshold() const
{
    std::lock_guard lock(mutex_);
    return thresh_;
}

void
Logs::threshold(Journal::severities thresh)
{
    std::lock_guard lock(mutex_);
    thresh_ = thresh;
    for (auto& sink : sinks_)
        sink.second->threshold(thresh);
}

void
Logs::write(
    Journal::severities level,
    std::string const& partition,
    std::string const& text)
{
    std::string const s = format(level, partition, text);
    std::lock_guard lock(mutex_);
    out_ << s << std::endl;
}

std::string
Logs::toString(Journal::severities s)
{
    switch (s)
    {
        case Journal::severities::kTrace:
            return "Trace";
        case Journal::severities::kDebug:
            return "Debug";
        case Journal::severities::kInfo:
            return "Info";
        case Journal::severities::kWarning:
            return "Warning";
        case Journal::severities::kError:
            return "Error";
        case Journal::severities::kFatal:
            return "Fatal";
        default:
            break;
    }
    return "Unknown";
}

std::optional<Journal::severities>
Logs::fromString(std::string const& s)
{
    auto const name = boost::algorithm::to_lower_copy(s);

    if (name == "trace" || name == "all")
        return Journal::severities::kTrace;

    if (name == "debug")
        return Journal::severities::kDebug;

    if (name == "info" || name == "information")
        return Journal::severities::kInfo;

    if (name == "warn" || name == "warning" || name == "warnings")
        return Journal::severities::kWarning;

    if (name == "error" || name == "errors")
        return Journal::severities::kError;

    if (name == "fatal" || name == "fatals")
        return Journal::severities::kFatal;

    if (name == "none" || name == "disabled")
        return Journal::severities::kDisabled;

    return std::nullopt;
}

std::string
Logs::format(
    Journal::severities level,
    std::string const& partition,
    std::string const& message)
{
    std::string output;
    output.reserve(message.size() + partition.size() + 8);

    if (!partition.empty())
        output += partition + ":";

    switch (level)
    {
        case Journal::severities::kTrace:
            output += "TRC ";
            break;
        case Journal::severities::kDebug:
            output += "DBG ";
            break;
        case Journal::severities::kInfo:
            output += "NFO ";
            break;
        case Journal::severities::kWarning:
            output += "WRN ";
            break;
        case Journal::severities::kError:
            output += "ERR ";
            break;
        default:
            output += "FTL ";
            break;
    }

    output += message;
    return output;
}

}  // namespace strata
