#include "report.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
    std::vector<std::string> read_lines(const std::filesystem::path &p)
    {
        std::ifstream in(p);
        std::vector<std::string> out;
        std::string line;
        while (std::getline(in, line))
        {
            out.push_back(line);
        }
        return out;
    }

    occsim::ReportRow row(std::uint32_t clients, occsim::BackoffVariant v, double t, double calls)
    {
        occsim::ReportRow r;
        r.clients = clients;
        r.variant = v;
        r.avgElapsed = t;
        r.avgCalls = calls;
        r.completedRuns = 1;
        return r;
    }
}

int main()
{
    const auto dir = std::filesystem::temp_directory_path() / "occsim_report_writer_test";
    std::filesystem::create_directories(dir);

    const std::vector<occsim::ReportRow> rows = {
        row(10, occsim::BackoffVariant::Exponential, 3400.5, 50.25),
        row(10, occsim::BackoffVariant::None, 376.0, 50.5),
        row(20, occsim::BackoffVariant::Exponential, 14714.0, 151.0),
        row(20, occsim::BackoffVariant::None, 601.125, 151.125),
    };

    {
        const auto path = dir / "results.csv";
        occsim::write_report_csv(path.string(), rows);
        const auto lines = read_lines(path);
        assert((lines == std::vector<std::string>{
                             "clients,time,calls,Algorithm",
                             "10,3400.500,50.250,Exponential",
                             "10,376.000,50.500,None",
                             "20,14714.000,151.000,Exponential",
                             "20,601.125,151.125,None",
                         }));
    }

    // Chart data: variants become columns in first-seen order, client counts rows.
    {
        const auto path = dir / "pivot_time.csv";
        occsim::write_pivot_csv(path.string(), rows, occsim::PivotField::AvgElapsed);
        const auto lines = read_lines(path);
        assert((lines == std::vector<std::string>{
                             "clients,Exponential,None",
                             "10,3400.500,376.000",
                             "20,14714.000,601.125",
                         }));

        const auto callsPath = dir / "pivot_calls.csv";
        std::vector<occsim::ReportRow> partial(rows.begin(), rows.begin() + 3);
        occsim::write_pivot_csv(callsPath.string(), partial, occsim::PivotField::AvgCalls);
        const auto callLines = read_lines(callsPath);
        assert((callLines == std::vector<std::string>{
                                 "clients,Exponential,None",
                                 "10,50.250,50.500",
                                 "20,151.000,",
                             }));
    }

    {
        bool threw = false;
        try
        {
            occsim::write_report_csv((dir / "missing" / "x.csv").string(), rows);
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);
    }

    std::filesystem::remove_all(dir);
    return 0;
}
