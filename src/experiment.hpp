#pragma once

#include "backoff.hpp"
#include "log.hpp"
#include "random.hpp"
#include "simulation.hpp"
#include "trace_sink.hpp"

#include <cmath>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace occsim
{
    // One line of the sweep report: averages over the completed repetitions
    // for one (client count, backoff variant) pair.
    struct ReportRow
    {
        std::uint32_t clients = 0;
        BackoffVariant variant = BackoffVariant::None;
        double avgElapsed = 0.0;
        double avgCalls = 0.0;
        double avgFailures = 0.0;
        std::uint64_t completedRuns = 0;
        std::uint64_t failedRuns = 0;

        const char *variant_name() const noexcept { return backoff_variant_name(variant); }
    };

    struct ExperimentConfig
    {
        std::vector<std::uint32_t> populations{10, 20, 30, 40};
        std::vector<BackoffVariant> variants = std::vector<BackoffVariant>(AllBackoffVariants.begin(), AllBackoffVariants.end());
        std::uint32_t repetitions = 100;

        double backoffBase = 5.0;
        double backoffCap = 2000.0;
        double delayMean = 10.0;
        double delayStddev = 2.0;

        std::uint64_t seed = 1;
        std::uint32_t maxAttempts = 0;

        // Successful-write traces go to <traceDir>/ts_<Variant>, rewritten for
        // every client count. Empty disables tracing.
        std::string traceDir = ".";

        // If set, applied to the process-wide Logger before the sweep starts.
        std::optional<LogLevel> logLevel;

        // Run partitioning. Repetition r runs on rank (r % size); the seed of a run
        // does not depend on the partitioning, so totals are the same for any size.
        int rank = 0;
        int size = 1;

        // Optional global reductions (e.g., MPI_Allreduce with MPI_SUM). Required when size > 1.
        std::function<double(double)> reduceSumF64;
        std::function<std::uint64_t(std::uint64_t)> reduceSumU64;

        // Optional progress callback, invoked once per finished row.
        std::function<void(const ReportRow &)> onRow;

        void validate() const
        {
            if (populations.empty() || variants.empty())
            {
                throw std::invalid_argument("ExperimentConfig: populations and variants must not be empty");
            }
            for (const auto p : populations)
            {
                if (p == 0)
                {
                    throw std::invalid_argument("ExperimentConfig: population must be > 0");
                }
            }
            if (repetitions == 0)
            {
                throw std::invalid_argument("ExperimentConfig: repetitions must be > 0");
            }
            if (!std::isfinite(backoffBase) || !std::isfinite(backoffCap) || !(backoffBase > 0.0) || !(backoffCap > 0.0))
            {
                throw std::invalid_argument("ExperimentConfig: backoffBase and backoffCap must be finite and > 0");
            }
            if (!std::isfinite(delayMean) || !std::isfinite(delayStddev) || !(delayStddev >= 0.0))
            {
                throw std::invalid_argument("ExperimentConfig: delayMean must be finite and delayStddev finite and >= 0");
            }
            if (size <= 0 || rank < 0 || rank >= size)
            {
                throw std::invalid_argument("ExperimentConfig: invalid rank/size");
            }
            if (size > 1 && (!reduceSumF64 || !reduceSumU64))
            {
                throw std::invalid_argument("ExperimentConfig: size > 1 requires reduceSumF64 and reduceSumU64");
            }
        }
    };

    inline std::string trace_path(const ExperimentConfig &cfg, BackoffVariant variant)
    {
        std::string path = cfg.traceDir;
        if (!path.empty() && path.back() != '/')
        {
            path += '/';
        }
        path += "ts_";
        path += backoff_variant_name(variant);
        if (cfg.size > 1)
        {
            path += ".rank" + std::to_string(cfg.rank);
        }
        return path;
    }

    inline ReportRow run_experiment_cell(const ExperimentConfig &cfg, std::uint32_t clients, BackoffVariant variant)
    {
        std::unique_ptr<FileTraceSink> trace;
        if (!cfg.traceDir.empty())
        {
            trace = std::make_unique<FileTraceSink>(trace_path(cfg, variant));
        }

        double sumElapsed = 0.0;
        std::uint64_t sumCalls = 0;
        std::uint64_t sumFailures = 0;
        std::uint64_t completed = 0;
        std::uint64_t failed = 0;

        for (std::uint32_t rep = 0; rep < cfg.repetitions; ++rep)
        {
            if (static_cast<int>(rep % static_cast<std::uint32_t>(cfg.size)) != cfg.rank)
            {
                continue;
            }

            SimulationConfig sc;
            sc.population = clients;
            sc.variant = variant;
            sc.backoffBase = cfg.backoffBase;
            sc.backoffCap = cfg.backoffCap;
            sc.delayMean = cfg.delayMean;
            sc.delayStddev = cfg.delayStddev;
            sc.seed = derive_seed(cfg.seed, clients, static_cast<std::uint32_t>(variant), rep);
            sc.maxAttempts = cfg.maxAttempts;
            // Buffered per run; appended to the file only after the run finishes.
            MemoryTraceSink runTrace;
            sc.traceSink = trace ? &runTrace : nullptr;

            // A failed run is dropped from the averages; later runs are independent.
            try
            {
                const RunResult r = run_simulation(std::move(sc));
                if (trace)
                {
                    for (const SimTime t : runTrace.times())
                    {
                        trace->record(t);
                    }
                    trace->flush();
                }
                sumElapsed += r.elapsed;
                sumCalls += r.calls;
                sumFailures += r.failures;
                ++completed;
            }
            catch (const std::exception &e)
            {
                ++failed;
                Logger::instance().logf(LogLevel::Error, NoClient, 0.0, "run failed: clients=%u variant=%s rep=%u: %s",
                                        static_cast<unsigned>(clients), backoff_variant_name(variant),
                                        static_cast<unsigned>(rep), e.what());
            }
        }

        if (cfg.size > 1)
        {
            sumElapsed = cfg.reduceSumF64(sumElapsed);
            sumCalls = cfg.reduceSumU64(sumCalls);
            sumFailures = cfg.reduceSumU64(sumFailures);
            completed = cfg.reduceSumU64(completed);
            failed = cfg.reduceSumU64(failed);
        }

        ReportRow row;
        row.clients = clients;
        row.variant = variant;
        row.completedRuns = completed;
        row.failedRuns = failed;
        if (completed > 0)
        {
            const double n = static_cast<double>(completed);
            row.avgElapsed = sumElapsed / n;
            row.avgCalls = static_cast<double>(sumCalls) / n;
            row.avgFailures = static_cast<double>(sumFailures) / n;
        }
        return row;
    }

    // Runs every (population, variant) pair `repetitions` times and returns one
    // row per pair, in population-major order.
    inline std::vector<ReportRow> run_experiment(const ExperimentConfig &cfg)
    {
        cfg.validate();
        if (cfg.logLevel)
        {
            Logger::instance().set_level(*cfg.logLevel);
        }

        std::vector<ReportRow> rows;
        rows.reserve(cfg.populations.size() * cfg.variants.size());
        for (const std::uint32_t clients : cfg.populations)
        {
            for (const BackoffVariant variant : cfg.variants)
            {
                rows.push_back(run_experiment_cell(cfg, clients, variant));
                Logger::instance().logf(LogLevel::Info, NoClient, 0.0, "clients=%u variant=%s avgTime=%.1f avgCalls=%.1f",
                                        static_cast<unsigned>(clients), backoff_variant_name(variant),
                                        rows.back().avgElapsed, rows.back().avgCalls);
                if (cfg.onRow)
                {
                    cfg.onRow(rows.back());
                }
            }
        }
        return rows;
    }
}
