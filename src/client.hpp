#pragma once

#include "backoff.hpp"
#include "delay_model.hpp"
#include "event.hpp"
#include "log.hpp"
#include "stats.hpp"

#include <memory>
#include <optional>

namespace occsim
{
    enum class ClientState : std::uint8_t
    {
        Start = 0,
        AwaitingReadResponse = 1,
        AwaitingWriteResponse = 2,
        // A write failed; the re-read is scheduled but has not been answered yet.
        Retrying = 3,
        Done = 4,
        GaveUp = 5,
    };

    inline const char *client_state_name(ClientState s) noexcept
    {
        switch (s)
        {
        case ClientState::Start:
            return "Start";
        case ClientState::AwaitingReadResponse:
            return "AwaitingReadResponse";
        case ClientState::AwaitingWriteResponse:
            return "AwaitingWriteResponse";
        case ClientState::Retrying:
            return "Retrying";
        case ClientState::Done:
            return "Done";
        case ClientState::GaveUp:
            return "GaveUp";
        }
        return "Unknown";
    }

    // A client that updates the row exactly once: read the version, write it
    // back, and on conflict back off and start over.
    //
    // Retries are unbounded unless maxAttempts > 0.
    class OccClient
    {
    public:
        OccClient(ClientId id,
                  std::unique_ptr<IBackoffPolicy> backoff,
                  const DelayModel &net,
                  Rng &rng,
                  RunStats &stats,
                  std::uint32_t maxAttempts = 0)
            : m_id(id), m_backoff(std::move(backoff)), m_net(net), m_rng(rng), m_stats(stats), m_maxAttempts(maxAttempts)
        {
            if (!m_backoff)
            {
                throw std::invalid_argument("OccClient: null backoff policy");
            }
        }

        ClientId id() const noexcept { return m_id; }
        ClientState state() const noexcept { return m_state; }
        std::uint32_t attempts() const noexcept { return m_attempt; }
        const IBackoffPolicy &backoff_policy() const noexcept { return *m_backoff; }

        bool finished() const noexcept
        {
            return m_state == ClientState::Done || m_state == ClientState::GaveUp;
        }

        Event start(SimTime now)
        {
            require_state_(ClientState::Start, "start");
            m_state = ClientState::AwaitingReadResponse;
            return make_event(MessageKind::ReadRequest, m_id, now, now + m_net.delay(m_rng));
        }

        Event on_read_response(SimTime now, const Event &rsp)
        {
            if (m_state != ClientState::AwaitingReadResponse && m_state != ClientState::Retrying)
            {
                throw_bad_transition_("read response");
            }
            if (rsp.kind != MessageKind::ReadResponse)
            {
                throw InvariantViolation("OccClient: expected ReadResponse got " + event_identity_string(rsp));
            }

            m_state = ClientState::AwaitingWriteResponse;
            Event req = make_event(MessageKind::WriteRequest, m_id, now, now + m_net.delay(m_rng));
            req.version = rsp.version;
            return req;
        }

        // Returns the re-read on conflict, or nothing once the client is finished.
        std::optional<Event> on_write_response(SimTime now, const Event &rsp)
        {
            require_state_(ClientState::AwaitingWriteResponse, "write response");
            if (rsp.kind != MessageKind::WriteResponse)
            {
                throw InvariantViolation("OccClient: expected WriteResponse got " + event_identity_string(rsp));
            }

            if (rsp.success)
            {
                m_state = ClientState::Done;
                Logger::instance().logf(LogLevel::Debug, m_id, now, "done after %u retries", m_attempt);
                return std::nullopt;
            }

            ++m_attempt;
            if (m_maxAttempts != 0 && m_attempt > m_maxAttempts)
            {
                m_state = ClientState::GaveUp;
                ++m_stats.abandoned;
                Logger::instance().logf(LogLevel::Warn, m_id, now, "giving up after %u attempts", m_maxAttempts);
                return std::nullopt;
            }

            // Network delay and backoff are both paid on every retry.
            const SimTime wait = m_backoff->backoff(m_attempt, m_rng);
            m_state = ClientState::Retrying;
            Logger::instance().logf(LogLevel::Trace, m_id, now, "conflict, attempt=%u backoff=%.3f", m_attempt, wait);
            return make_event(MessageKind::ReadRequest, m_id, now, now + m_net.delay(m_rng) + wait);
        }

    private:
        void require_state_(ClientState expected, const char *what) const
        {
            if (m_state != expected)
            {
                throw_bad_transition_(what);
            }
        }

        [[noreturn]] void throw_bad_transition_(const char *what) const
        {
            throw InvariantViolation(std::string("OccClient ") + std::to_string(m_id) + ": unexpected " + what +
                                     " in state " + client_state_name(m_state));
        }

        ClientId m_id = 0;
        std::unique_ptr<IBackoffPolicy> m_backoff;
        const DelayModel &m_net;
        Rng &m_rng;
        RunStats &m_stats;
        std::uint32_t m_maxAttempts = 0;
        std::uint32_t m_attempt = 0;
        ClientState m_state = ClientState::Start;
    };
}
