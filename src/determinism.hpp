#pragma once

#include "event.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <type_traits>
#include <vector>

namespace occsim
{
    namespace detail
    {
        inline std::uint64_t fnv1a64(std::span<const std::byte> bytes, std::uint64_t h = 1469598103934665603ULL) noexcept
        {
            for (const std::byte b : bytes)
            {
                h ^= static_cast<std::uint64_t>(static_cast<unsigned char>(b));
                h *= 1099511628211ULL;
            }
            return h;
        }

        template <class T>
        inline void append_trivial(std::vector<std::byte> &out, const T &v)
        {
            static_assert(std::is_trivially_copyable_v<T>);
            const std::size_t off = out.size();
            out.resize(off + sizeof(T));
            std::memcpy(out.data() + off, &v, sizeof(T));
        }

        inline std::uint64_t hash_processed_event(const Event &ev)
        {
            std::vector<std::byte> buf;
            buf.reserve(48);
            append_trivial(buf, ev.ts.time);
            append_trivial(buf, ev.ts.sequence);
            append_trivial(buf, static_cast<std::uint8_t>(ev.kind));
            append_trivial(buf, ev.client);
            append_trivial(buf, ev.version);
            const std::uint8_t ok = ev.success ? 1u : 0u;
            append_trivial(buf, ok);
            return fnv1a64(std::span<const std::byte>(buf.data(), buf.size()));
        }
    }

    // Order-sensitive digest over the events a run processed. Two runs with the
    // same configuration and seed must produce the same value.
    class DeterminismAccumulator
    {
    public:
        void on_processed(const Event &ev)
        {
            const std::uint64_t h = detail::hash_processed_event(ev);
            std::byte raw[sizeof(h)];
            std::memcpy(raw, &h, sizeof(h));
            m_digest = detail::fnv1a64(std::span<const std::byte>(raw, sizeof(raw)), m_digest);
        }

        std::uint64_t digest() const noexcept { return m_digest; }

    private:
        std::uint64_t m_digest = 1469598103934665603ULL;
    };
}
