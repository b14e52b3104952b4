#pragma once

#include "event.hpp"

#include <cmath>
#include <queue>
#include <vector>

namespace occsim
{
    struct EventTimeOrder
    {
        // std::priority_queue is a max-heap; invert for earliest-first.
        bool operator()(const Event &a, const Event &b) const noexcept
        {
            return b.ts < a.ts;
        }
    };

    // Time-ordered event queue plus the simulated clock.
    //
    // Events with equal due times pop in push order: the queue stamps each
    // event with a monotonically increasing sequence number.
    class EventQueue
    {
    public:
        void push(Event ev)
        {
            if (!std::isfinite(ev.ts.time) || ev.ts.time < 0.0)
            {
                throw InvariantViolation("EventQueue::push: negative or non-finite time: " + event_identity_string(ev));
            }
            ev.ts.sequence = ++m_nextSeq;
            m_heap.push(std::move(ev));
        }

        // Removes the earliest event and advances the clock to its due time.
        Event pop()
        {
            if (m_heap.empty())
            {
                throw InvariantViolation("EventQueue::pop: queue is empty");
            }
            Event ev = m_heap.top();
            m_heap.pop();
            if (ev.ts.time < m_now)
            {
                throw InvariantViolation("EventQueue::pop: clock would move backwards (now=" + std::to_string(m_now) +
                                         ") " + event_identity_string(ev));
            }
            m_now = ev.ts.time;
            return ev;
        }

        const Event &top() const { return m_heap.top(); }

        SimTime now() const noexcept { return m_now; }
        bool empty() const noexcept { return m_heap.empty(); }
        std::size_t size() const noexcept { return m_heap.size(); }

    private:
        std::priority_queue<Event, std::vector<Event>, EventTimeOrder> m_heap;
        SimTime m_now = 0.0;
        std::uint64_t m_nextSeq = 0;
    };
}
