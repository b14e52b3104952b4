#pragma once

#include "common.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace occsim
{
    // Receives the simulated time of every successful write.
    class ITraceSink
    {
    public:
        virtual ~ITraceSink() = default;
        virtual void record(SimTime t) = 0;
    };

    class MemoryTraceSink final : public ITraceSink
    {
    public:
        void record(SimTime t) override { m_times.push_back(t); }

        const std::vector<SimTime> &times() const noexcept { return m_times; }
        void clear() { m_times.clear(); }

    private:
        std::vector<SimTime> m_times;
    };

    // One integer-truncated timestamp per line. Any I/O error throws, since a
    // partial trace would misrepresent the run.
    class FileTraceSink final : public ITraceSink
    {
    public:
        explicit FileTraceSink(const std::string &path, bool append = false) : m_path(path)
        {
            m_file = std::fopen(path.c_str(), append ? "a" : "w");
            if (!m_file)
            {
                throw std::runtime_error("FileTraceSink: cannot open '" + path + "': " + std::strerror(errno));
            }
        }

        ~FileTraceSink() override
        {
            if (m_file)
            {
                std::fclose(m_file);
            }
        }

        FileTraceSink(const FileTraceSink &) = delete;
        FileTraceSink &operator=(const FileTraceSink &) = delete;

        void record(SimTime t) override
        {
            if (std::fprintf(m_file, "%lld\n", static_cast<long long>(t)) < 0)
            {
                throw std::runtime_error("FileTraceSink: write failed for '" + m_path + "'");
            }
        }

        void flush()
        {
            if (std::fflush(m_file) != 0)
            {
                throw std::runtime_error("FileTraceSink: flush failed for '" + m_path + "'");
            }
        }

        const std::string &path() const noexcept { return m_path; }

    private:
        std::string m_path;
        FILE *m_file = nullptr;
    };
}
