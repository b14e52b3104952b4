#pragma once

#include "backoff.hpp"
#include "client.hpp"
#include "delay_model.hpp"
#include "determinism.hpp"
#include "event_queue.hpp"
#include "log.hpp"
#include "server.hpp"
#include "stats.hpp"
#include "trace_sink.hpp"

#include <cmath>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

namespace occsim
{
    struct SimulationConfig
    {
        std::uint32_t population = 10;

        BackoffVariant variant = BackoffVariant::None;
        double backoffBase = 5.0;
        double backoffCap = 2000.0;

        double delayMean = 10.0;
        double delayStddev = 2.0;

        // Seed for this run's Rng. Same config + same seed => identical run.
        std::uint64_t seed = 1;

        // 0 means retry until success. Otherwise a client gives up after this
        // many failed writes (counted in RunStats::abandoned).
        std::uint32_t maxAttempts = 0;

        // If set, applied to the process-wide Logger when the run is built.
        std::optional<LogLevel> logLevel;

        // Optional: receives the time of every successful write. Not owned.
        ITraceSink *traceSink = nullptr;

        // Optional: called for every event the loop processes, before it is dispatched.
        std::function<void(const Event &)> eventObserver;

        void validate() const
        {
            if (population == 0)
            {
                throw std::invalid_argument("SimulationConfig: population must be > 0");
            }
            if (!std::isfinite(backoffBase) || !std::isfinite(backoffCap) || !(backoffBase > 0.0) || !(backoffCap > 0.0))
            {
                throw std::invalid_argument("SimulationConfig: backoffBase and backoffCap must be finite and > 0");
            }
            if (!std::isfinite(delayMean) || !std::isfinite(delayStddev) || !(delayStddev >= 0.0))
            {
                throw std::invalid_argument("SimulationConfig: delayMean must be finite and delayStddev finite and >= 0");
            }
        }
    };

    // One independent OCC scenario: a server, `population` clients and the
    // event loop that drives them to completion.
    class Simulation final
    {
    public:
        explicit Simulation(SimulationConfig cfg)
            : m_cfg(std::move(cfg)),
              m_net(m_cfg.delayMean, m_cfg.delayStddev),
              m_rng(m_cfg.seed),
              m_server(m_net, m_rng, m_stats, m_cfg.traceSink)
        {
            m_cfg.validate();
            if (m_cfg.logLevel)
            {
                Logger::instance().set_level(*m_cfg.logLevel);
            }

            m_clients.reserve(m_cfg.population);
            for (std::uint32_t i = 0; i < m_cfg.population; ++i)
            {
                m_clients.push_back(std::make_unique<OccClient>(static_cast<ClientId>(i),
                                                                make_backoff(m_cfg.variant, m_cfg.backoffBase, m_cfg.backoffCap),
                                                                m_net,
                                                                m_rng,
                                                                m_stats,
                                                                m_cfg.maxAttempts));
            }
        }

        Simulation(const Simulation &) = delete;
        Simulation &operator=(const Simulation &) = delete;

        // Schedule an event directly. Normally only the initial Start events.
        void schedule(Event ev)
        {
            validate_event(ev, m_clients.size());
            m_queue.push(std::move(ev));
        }

        // Runs until the queue is empty and returns the run's totals.
        RunResult run()
        {
            start_if_needed_();
            while (!m_queue.empty())
            {
                step_();
            }
            finalize_();
            return result();
        }

        // Process at most one event. Returns false when there was nothing to do.
        bool run_one()
        {
            start_if_needed_();
            if (m_queue.empty())
            {
                return false;
            }
            step_();
            return true;
        }

        RunResult result() const
        {
            RunResult out;
            out.elapsed = m_queue.now();
            out.calls = m_stats.calls;
            out.failures = m_stats.failures;
            out.abandoned = m_stats.abandoned;
            out.finalVersion = m_server.version();
            out.eventsProcessed = m_processed;
            out.digest = m_determinism.digest();
            return out;
        }

        SimTime now() const noexcept { return m_queue.now(); }
        std::size_t pending() const noexcept { return m_queue.size(); }
        const RunStats &stats() const noexcept { return m_stats; }
        const OccServer &server() const noexcept { return m_server; }
        const SimulationConfig &config() const noexcept { return m_cfg; }

        const OccClient &client(ClientId id) const
        {
            if (id >= m_clients.size())
            {
                throw std::out_of_range("Simulation::client: unknown ClientId");
            }
            return *m_clients[id];
        }

        std::size_t client_count() const noexcept { return m_clients.size(); }

    private:
        void start_if_needed_()
        {
            if (m_started)
            {
                return;
            }
            m_started = true;
            for (const auto &c : m_clients)
            {
                schedule(make_event(MessageKind::Start, c->id(), 0.0, 0.0));
            }
        }

        void step_()
        {
            Event ev = m_queue.pop();
            validate_event(ev, m_clients.size());

            ++m_processed;
            m_determinism.on_processed(ev);
            if (m_cfg.eventObserver)
            {
                m_cfg.eventObserver(ev);
            }

            std::optional<Event> next = dispatch_(ev);
            if (next)
            {
                schedule(std::move(*next));
            }
        }

        std::optional<Event> dispatch_(const Event &ev)
        {
            const SimTime now = m_queue.now();
            OccClient &c = *m_clients[ev.client];
            switch (ev.kind)
            {
            case MessageKind::Start:
                return c.start(now);
            case MessageKind::ReadRequest:
                return m_server.read(now, ev);
            case MessageKind::ReadResponse:
                return c.on_read_response(now, ev);
            case MessageKind::WriteRequest:
                return m_server.write(now, ev);
            case MessageKind::WriteResponse:
                return c.on_write_response(now, ev);
            }
            throw InvariantViolation("dispatch: unknown kind " + event_identity_string(ev));
        }

        void finalize_()
        {
            if (m_finalized)
            {
                return;
            }
            m_finalized = true;

            if (m_stats.successes() != m_server.version())
            {
                throw InvariantViolation("run ended with successful writes != server version");
            }
            for (const auto &c : m_clients)
            {
                if (!c->finished())
                {
                    throw InvariantViolation("run ended with client " + std::to_string(c->id()) + " in state " +
                                             client_state_name(c->state()));
                }
            }

            Logger::instance().logf(LogLevel::Info, NoClient, m_queue.now(),
                                    "run done: variant=%s clients=%u calls=%llu failures=%llu",
                                    backoff_variant_name(m_cfg.variant),
                                    static_cast<unsigned>(m_cfg.population),
                                    static_cast<unsigned long long>(m_stats.calls),
                                    static_cast<unsigned long long>(m_stats.failures));
        }

        SimulationConfig m_cfg;
        DelayModel m_net;
        Rng m_rng;
        RunStats m_stats;
        OccServer m_server;
        std::vector<std::unique_ptr<OccClient>> m_clients;
        EventQueue m_queue;
        DeterminismAccumulator m_determinism;
        std::uint64_t m_processed = 0;
        bool m_started = false;
        bool m_finalized = false;
    };

    inline RunResult run_simulation(SimulationConfig cfg)
    {
        Simulation sim(std::move(cfg));
        return sim.run();
    }
}
