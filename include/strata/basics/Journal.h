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

#ifndef STRATA_BASICS_JOURNAL_H_INCLUDED
#define STRATA_BASICS_JOURNAL_H_INCLUDED

#include <sstream>
#include <string>

namespace strata {

/** A generic endpoint for log messages.

    The Journal has a few simple goals:

     * To be light-weight and copied by value.
     * To allow logging statements to be left in source code.
     * The logging is controlled at run-time based on a logging threshold.
*/
class Journal
{
public:
    class Sink;

private:
    // Severity level / threshold of a Journal message.
    enum Severity {
        kAll = 0,

        kTrace = kAll,
        kDebug,
        kInfo,
        kWarning,
        kError,
        kFatal,

        kDisabled,
        kNone = kDisabled
    };

    // Invariant: sink_ always points to a valid Sink
    Sink* sink_;

public:
    //--------------------------------------------------------------------------

    /** Severity level of the message. */
    enum class severities {
        kTrace = Severity::kTrace,
        kDebug = Severity::kDebug,
        kInfo = Severity::kInfo,
        kWarning = Severity::kWarning,
        kError = Severity::kError,
        kFatal = Severity::kFatal,
        kDisabled = Severity::kDisabled
    };

    /** Abstraction for the underlying message destination. */
    class Sink
    {
    protected:
        Sink() = delete;
        explicit Sink(Sink const& sink) = default;
        explicit Sink(severities thresh);
        Sink&
        operator=(Sink const& lhs) = delete;

    public:
        virtual ~Sink() = 0;

        /** Returns `true` if text at the passed severity produces output. */
        virtual bool
        active(severities level) const;

        /** Returns the minimum severity level this sink will report. */
        virtual severities
        threshold() const;

        /** Set the minimum severity this sink will report. */
        virtual void
        threshold(severities thresh);

        /** Write text to the sink at the specified severity.
            A conforming implementation will not write the text if the passed
            level is below the current threshold().
        */
        virtual void
        write(severities level, std::string const& text) = 0;

    private:
        severities thresh_;
    };

    /** Returns a Sink which does nothing. */
    static Sink&
    getNullSink();

    //--------------------------------------------------------------------------

    class Stream;

    /** Scoped ostream-based container for writing messages to a Journal. */
    class ScopedStream
    {
    public:
        ScopedStream(ScopedStream const& other)
            : ScopedStream(other.m_sink, other.m_level)
        {
        }

        ScopedStream(Sink& sink, severities level);

        template <typename T>
        ScopedStream(Stream const& stream, T const& t);

        ScopedStream&
        operator=(ScopedStream const&) = delete;

        ~ScopedStream();

        std::ostringstream&
        ostream() const
        {
            return m_ostream;
        }

        template <typename T>
        std::ostream&
        operator<<(T const& t) const;

    private:
        Sink& m_sink;
        severities const m_level;
        std::ostringstream mutable m_ostream;
    };

    //--------------------------------------------------------------------------

    /** Provide a light-weight way to check active() before string formatting */
    class Stream
    {
    public:
        /** Create a stream which produces no output. */
        explicit Stream()
            : m_sink(getNullSink()), m_level(severities::kDisabled)
        {
        }

        /** Create a stream that writes at the given level. */
        Stream(Sink& sink, severities level) : m_sink(sink), m_level(level)
        {
        }

        Stream(Stream const& other) : Stream(other.m_sink, other.m_level)
        {
        }

        Stream&
        operator=(Stream const& other) = delete;

        Sink&
        sink() const
        {
            return m_sink;
        }

        severities
        level() const
        {
            return m_level;
        }

        /** Returns `true` if sink logs anything at this stream's level. */
        bool
        active() const
        {
            return m_sink.active(m_level);
        }

        explicit
        operator bool() const
        {
            return active();
        }

        template <typename T>
        ScopedStream
        operator<<(T const& t) const;

    private:
        Sink& m_sink;
        severities m_level;
    };

    //--------------------------------------------------------------------------

    /** Journal has no default constructor. */
    Journal() = delete;

    /** Create a journal that writes to the specified sink. */
    explicit Journal(Sink& sink) : sink_(&sink)
    {
    }

    Sink&
    sink() const
    {
        return *sink_;
    }

    Stream
    stream(severities level) const
    {
        return Stream(*sink_, level);
    }

    /** Returns `true` if any message would be logged at this severity. */
    bool
    active(severities level) const
    {
        return sink_->active(level);
    }

    /** Severity stream access functions. */
    /** @{ */
    Stream
    trace() const
    {
        return {*sink_, severities::kTrace};
    }

    Stream
    debug() const
    {
        return {*sink_, severities::kDebug};
    }

    Stream
    info() const
    {
        return {*sink_, severities::kInfo};
    }

    Stream
    warn() const
    {
        return {*sink_, severities::kWarning};
    }

    Stream
    error() const
    {
        return {*sink_, severities::kError};
    }

    Stream
    fatal() const
    {
        return {*sink_, severities::kFatal};
    }
    /** @} */
};

//------------------------------------------------------------------------------

template <typename T>
Journal::ScopedStream::ScopedStream(Journal::Stream const& stream, T const& t)
    : ScopedStream(stream.sink(), stream.level())
{
    m_ostream << t;
}

template <typename T>
std::ostream&
Journal::ScopedStream::operator<<(T const& t) const
{
    m_ostream << t;
    return m_ostream;
}

template <typename T>
Journal::ScopedStream
Journal::Stream::operator<<(T const& t) const
{
    return ScopedStream(*this, t);
}

}  // namespace strata

#endif
