#pragma once

#include "common.hpp"

#include <cmath>
#include <string>

namespace occsim
{
    struct TimeStamp
    {
        SimTime time = 0.0;
        std::uint64_t sequence = 0;

        friend constexpr bool operator<(const TimeStamp &lhs, const TimeStamp &rhs)
        {
            return (lhs.time < rhs.time) || ((lhs.time == rhs.time) && (lhs.sequence < rhs.sequence));
        }
        friend constexpr bool operator==(const TimeStamp &lhs, const TimeStamp &rhs)
        {
            return (lhs.time == rhs.time) && (lhs.sequence == rhs.sequence);
        }
    };

    // The closed set of protocol messages. The kind doubles as the continuation
    // tag: it says which state-machine step consumes the message.
    //
    //   Start          -> client  (kick off)
    //   ReadRequest    -> server  (reply_to: client ReadResponse step)
    //   ReadResponse   -> client  (carries version)
    //   WriteRequest   -> server  (carries version, reply_to: client WriteResponse step)
    //   WriteResponse  -> client  (carries success, terminal when success)
    enum class MessageKind : std::uint8_t
    {
        Start = 0,
        ReadRequest = 1,
        ReadResponse = 2,
        WriteRequest = 3,
        WriteResponse = 4,
    };

    inline const char *message_kind_name(MessageKind k) noexcept
    {
        switch (k)
        {
        case MessageKind::Start:
            return "Start";
        case MessageKind::ReadRequest:
            return "ReadRequest";
        case MessageKind::ReadResponse:
            return "ReadResponse";
        case MessageKind::WriteRequest:
            return "WriteRequest";
        case MessageKind::WriteResponse:
            return "WriteResponse";
        }
        return "Unknown";
    }

    inline bool targets_server(MessageKind k) noexcept
    {
        return k == MessageKind::ReadRequest || k == MessageKind::WriteRequest;
    }

    struct Event
    {
        // Due time. The queue fills in `sequence`.
        TimeStamp ts{};
        MessageKind kind = MessageKind::Start;
        // The client that owns this exchange: the sender of a request, the
        // receiver of a response.
        ClientId client = NoClient;
        SimTime sentTime = 0.0;
        Version version = 0;
        bool success = false;
    };

    inline Event make_event(MessageKind kind, ClientId client, SimTime sentTime, SimTime due)
    {
        Event ev;
        ev.ts = TimeStamp{due, 0};
        ev.kind = kind;
        ev.client = client;
        ev.sentTime = sentTime;
        return ev;
    }

    inline std::string event_identity_string(const Event &ev)
    {
        return "t=" + std::to_string(ev.ts.time) + " seq=" + std::to_string(ev.ts.sequence) +
               " kind=" + message_kind_name(ev.kind) +
               " client=" + std::to_string(ev.client);
    }

    // Structural checks that do not need the simulation state.
    inline void validate_event(const Event &ev, std::size_t clientCount)
    {
        if (!std::isfinite(ev.ts.time) || ev.ts.time < 0.0)
        {
            throw InvariantViolation("event has negative or non-finite due time: " + event_identity_string(ev));
        }
        if (!std::isfinite(ev.sentTime) || ev.sentTime < 0.0 || ev.ts.time < ev.sentTime)
        {
            throw InvariantViolation("event has invalid send time: " + event_identity_string(ev));
        }
        if (static_cast<std::uint8_t>(ev.kind) > static_cast<std::uint8_t>(MessageKind::WriteResponse))
        {
            throw InvariantViolation("event has unknown kind: " + event_identity_string(ev));
        }
        if (ev.client == NoClient || ev.client >= clientCount)
        {
            throw InvariantViolation("event has no valid target client: " + event_identity_string(ev));
        }
    }
}
