#pragma once

#include "delay_model.hpp"
#include "event.hpp"
#include "log.hpp"
#include "stats.hpp"
#include "trace_sink.hpp"

namespace occsim
{
    // A single versioned row. Writes succeed only when they carry the version
    // the row currently holds.
    //
    // Runs are single-threaded, so version and counters are mutated in place.
    class OccServer
    {
    public:
        OccServer(const DelayModel &net, Rng &rng, RunStats &stats, ITraceSink *trace = nullptr)
            : m_net(net), m_rng(rng), m_stats(stats), m_trace(trace)
        {
        }

        Version version() const noexcept { return m_version; }

        Event read(SimTime now, const Event &request)
        {
            require_kind_(request, MessageKind::ReadRequest);

            Event rsp = make_event(MessageKind::ReadResponse, request.client, now, now + m_net.delay(m_rng));
            rsp.version = m_version;
            return rsp;
        }

        Event write(SimTime now, const Event &request)
        {
            require_kind_(request, MessageKind::WriteRequest);

            ++m_stats.calls;
            bool success = false;
            if (request.version == m_version)
            {
                ++m_version;
                success = true;
                if (m_trace)
                {
                    m_trace->record(now);
                }
                Logger::instance().logf(LogLevel::Debug, request.client, now, "write ok, version=%llu",
                                        static_cast<unsigned long long>(m_version));
            }
            else
            {
                ++m_stats.failures;
                Logger::instance().logf(LogLevel::Trace, request.client, now, "write conflict (have=%llu want=%llu)",
                                        static_cast<unsigned long long>(m_version),
                                        static_cast<unsigned long long>(request.version));
            }

            Event rsp = make_event(MessageKind::WriteResponse, request.client, now, now + m_net.delay(m_rng));
            rsp.version = request.version;
            rsp.success = success;
            return rsp;
        }

    private:
        static void require_kind_(const Event &ev, MessageKind expected)
        {
            if (ev.kind != expected)
            {
                throw InvariantViolation(std::string("OccServer: expected ") + message_kind_name(expected) + " got " +
                                         event_identity_string(ev));
            }
        }

        const DelayModel &m_net;
        Rng &m_rng;
        RunStats &m_stats;
        ITraceSink *m_trace = nullptr;
        Version m_version = 0;
    };
}
