#pragma once

#include "backoff.hpp"
#include "experiment.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace occsim
{
    namespace detail
    {
        class CsvFile
        {
        public:
            explicit CsvFile(const std::string &path) : m_path(path)
            {
                m_file = std::fopen(path.c_str(), "w");
                if (!m_file)
                {
                    throw std::runtime_error("report: cannot open '" + path + "': " + std::strerror(errno));
                }
            }

            ~CsvFile()
            {
                if (m_file)
                {
                    std::fclose(m_file);
                }
            }

            CsvFile(const CsvFile &) = delete;
            CsvFile &operator=(const CsvFile &) = delete;

            void writef(const char *fmt, ...)
            {
                va_list args;
                va_start(args, fmt);
                const int rc = std::vfprintf(m_file, fmt, args);
                va_end(args);
                if (rc < 0)
                {
                    throw std::runtime_error("report: write failed for '" + m_path + "'");
                }
            }

            void close()
            {
                FILE *f = m_file;
                m_file = nullptr;
                if (std::fclose(f) != 0)
                {
                    throw std::runtime_error("report: close failed for '" + m_path + "'");
                }
            }

        private:
            std::string m_path;
            FILE *m_file = nullptr;
        };
    }

    // clients,time,calls,Algorithm
    inline void write_report_csv(const std::string &path, const std::vector<ReportRow> &rows)
    {
        detail::CsvFile out(path);
        out.writef("clients,time,calls,Algorithm\n");
        for (const auto &row : rows)
        {
            out.writef("%u,%.3f,%.3f,%s\n", static_cast<unsigned>(row.clients), row.avgElapsed, row.avgCalls,
                       row.variant_name());
        }
        out.close();
    }

    enum class PivotField : std::uint8_t
    {
        AvgElapsed = 0,
        AvgCalls = 1,
    };

    // Chart data: one row per client count, one column per variant, in the
    // order the variants first appear in `rows`. Missing cells are left empty.
    inline void write_pivot_csv(const std::string &path, const std::vector<ReportRow> &rows, PivotField field)
    {
        std::vector<BackoffVariant> columns;
        std::map<std::uint32_t, std::map<BackoffVariant, double>> table;
        for (const auto &row : rows)
        {
            if (std::find(columns.begin(), columns.end(), row.variant) == columns.end())
            {
                columns.push_back(row.variant);
            }
            table[row.clients][row.variant] = (field == PivotField::AvgElapsed) ? row.avgElapsed : row.avgCalls;
        }

        detail::CsvFile out(path);
        out.writef("clients");
        for (const auto v : columns)
        {
            out.writef(",%s", backoff_variant_name(v));
        }
        out.writef("\n");

        for (const auto &[clients, cells] : table)
        {
            out.writef("%u", static_cast<unsigned>(clients));
            for (const auto v : columns)
            {
                auto it = cells.find(v);
                if (it == cells.end())
                {
                    out.writef(",");
                }
                else
                {
                    out.writef(",%.3f", it->second);
                }
            }
            out.writef("\n");
        }
        out.close();
    }
}
