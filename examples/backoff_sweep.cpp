#include "experiment.hpp"
#include "log.hpp"
#include "parse.hpp"
#include "report.hpp"

#if defined(OCCSIM_HAS_MPI)
#include "mpi_collectives.hpp"
#include <mpi.h>
#endif

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace
{
    struct Params
    {
        occsim::ExperimentConfig experiment;
        std::string reportPath = "backoff_results.csv";
        // Empty disables the pivot (chart data) files.
        std::string pivotPrefix = "backoff";
    };

    [[noreturn]] void usage_and_exit(int rank)
    {
        if (rank == 0)
        {
            std::cerr << "Backoff/jitter sweep over a remote OCC system\n"
                      << "  --clients N[,N...]     client counts (default 10,20,30,40)\n"
                      << "  --variants V[,V...]    None,Exponential,EqualJitter,FullJitter,Decorr or all\n"
                      << "  --reps R               repetitions per cell (default 100)\n"
                      << "  --base B               backoff base (default 5)\n"
                      << "  --cap C                backoff cap (default 2000)\n"
                      << "  --delay-mean M         network delay mean (default 10)\n"
                      << "  --delay-sd S           network delay stddev (default 2)\n"
                      << "  --seed S\n"
                      << "  --max-attempts K       give up after K failed writes (default 0 = never)\n"
                      << "  --out FILE             report csv (default backoff_results.csv)\n"
                      << "  --pivot-prefix P       writes P_time.csv and P_calls.csv; empty to disable\n"
                      << "  --trace-dir DIR        successful-write traces (default .)\n"
                      << "  --no-trace\n"
                      << "  --log LEVEL            error|warn|info|debug|trace|off\n";
        }

#if defined(OCCSIM_HAS_MPI)
        MPI_Abort(MPI_COMM_WORLD, 2);
#endif
        std::exit(2);
    }

    Params parse_args(int argc, char **argv, int rank)
    {
        Params p;
        auto &e = p.experiment;
        for (int i = 1; i < argc; ++i)
        {
            std::string_view a(argv[i]);
            auto need = [&]() -> std::string_view
            {
                if (i + 1 >= argc)
                {
                    usage_and_exit(rank);
                }
                return std::string_view(argv[++i]);
            };

            if (a == "--clients")
            {
                if (!occsim::parse_u32_list(need(), e.populations))
                    usage_and_exit(rank);
            }
            else if (a == "--variants")
            {
                if (!occsim::parse_variant_list(need(), e.variants))
                    usage_and_exit(rank);
            }
            else if (a == "--reps")
            {
                if (!occsim::parse_u32(need(), e.repetitions))
                    usage_and_exit(rank);
            }
            else if (a == "--base")
            {
                if (!occsim::parse_double(need(), e.backoffBase))
                    usage_and_exit(rank);
            }
            else if (a == "--cap")
            {
                if (!occsim::parse_double(need(), e.backoffCap))
                    usage_and_exit(rank);
            }
            else if (a == "--delay-mean")
            {
                if (!occsim::parse_double(need(), e.delayMean))
                    usage_and_exit(rank);
            }
            else if (a == "--delay-sd")
            {
                if (!occsim::parse_double(need(), e.delayStddev))
                    usage_and_exit(rank);
            }
            else if (a == "--seed")
            {
                if (!occsim::parse_u64(need(), e.seed))
                    usage_and_exit(rank);
            }
            else if (a == "--max-attempts")
            {
                if (!occsim::parse_u32(need(), e.maxAttempts))
                    usage_and_exit(rank);
            }
            else if (a == "--out")
            {
                p.reportPath = std::string(need());
            }
            else if (a == "--pivot-prefix")
            {
                p.pivotPrefix = std::string(need());
            }
            else if (a == "--trace-dir")
            {
                e.traceDir = std::string(need());
            }
            else if (a == "--no-trace")
            {
                e.traceDir.clear();
            }
            else if (a == "--log")
            {
                occsim::LogLevel lvl = occsim::LogLevel::Off;
                if (!occsim::parse_log_level(need(), lvl))
                    usage_and_exit(rank);
                e.logLevel = lvl;
            }
            else
            {
                usage_and_exit(rank);
            }
        }

        if (p.reportPath.empty())
        {
            usage_and_exit(rank);
        }
        try
        {
            e.validate();
        }
        catch (const std::invalid_argument &ex)
        {
            if (rank == 0)
            {
                std::cerr << "backoff_sweep: " << ex.what() << "\n";
            }
            usage_and_exit(rank);
        }
        return p;
    }
}

int main(int argc, char **argv)
{
#if defined(OCCSIM_HAS_MPI)
    int provided = 0;
    MPI_Init_thread(&argc, &argv, MPI_THREAD_SINGLE, &provided);
    int rank = 0;
    int size = 1;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);
#else
    const int rank = 0;
    const int size = 1;
#endif

    Params p = parse_args(argc, argv, rank);
    p.experiment.rank = rank;
    p.experiment.size = size;

#if defined(OCCSIM_HAS_MPI)
    if (size > 1)
    {
        p.experiment.reduceSumF64 = [](double local)
        { return occsim::mpi_allreduce_sum_f64(MPI_COMM_WORLD, local); };
        p.experiment.reduceSumU64 = [](std::uint64_t local)
        { return occsim::mpi_allreduce_sum_u64(MPI_COMM_WORLD, local); };
    }
#endif

    if (rank == 0)
    {
        p.experiment.onRow = [](const occsim::ReportRow &row)
        {
            std::cout << "clients=" << row.clients << " " << row.variant_name() << " time=" << row.avgElapsed
                      << " calls=" << row.avgCalls;
            if (row.failedRuns != 0)
            {
                std::cout << " failedRuns=" << row.failedRuns;
            }
            std::cout << "\n";
        };
    }

    int exitCode = 0;
    try
    {
        const auto rows = occsim::run_experiment(p.experiment);
        if (rank == 0)
        {
            occsim::write_report_csv(p.reportPath, rows);
            if (!p.pivotPrefix.empty())
            {
                occsim::write_pivot_csv(p.pivotPrefix + "_time.csv", rows, occsim::PivotField::AvgElapsed);
                occsim::write_pivot_csv(p.pivotPrefix + "_calls.csv", rows, occsim::PivotField::AvgCalls);
            }
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << "backoff_sweep: " << ex.what() << "\n";
#if defined(OCCSIM_HAS_MPI)
        MPI_Abort(MPI_COMM_WORLD, 1);
#endif
        exitCode = 1;
    }

#if defined(OCCSIM_HAS_MPI)
    MPI_Finalize();
#endif
    return exitCode;
}
