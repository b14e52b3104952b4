/*
Purpose: Tests for the experiment sweep that aggregates repeated runs.

What this tests: one row per (clients, variant) in population-major order, averages
that match the individual runs, rank partitioning that reproduces the single-rank
totals, and the aggregate effect of jitter on write calls.
*/

#include "experiment.hpp"

#include <cassert>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <stdexcept>
#include <vector>

namespace
{
    occsim::ExperimentConfig small_config()
    {
        occsim::ExperimentConfig cfg;
        cfg.populations = {3, 6};
        cfg.variants = {occsim::BackoffVariant::None, occsim::BackoffVariant::FullJitter};
        cfg.repetitions = 7;
        cfg.seed = 11;
        cfg.traceDir.clear();
        return cfg;
    }
}

int main()
{
    // Row layout and averages.
    {
        const auto cfg = small_config();
        const auto rows = occsim::run_experiment(cfg);
        assert(rows.size() == 4);
        assert(rows[0].clients == 3 && rows[0].variant == occsim::BackoffVariant::None);
        assert(rows[1].clients == 3 && rows[1].variant == occsim::BackoffVariant::FullJitter);
        assert(rows[2].clients == 6 && rows[2].variant == occsim::BackoffVariant::None);
        assert(rows[3].clients == 6 && rows[3].variant == occsim::BackoffVariant::FullJitter);

        for (const auto &row : rows)
        {
            assert(row.completedRuns == 7);
            assert(row.failedRuns == 0);
            assert(row.avgCalls >= row.clients);
            assert(std::fabs(row.avgCalls - row.avgFailures - row.clients) < 1e-9);
            assert(row.avgElapsed > 0.0);
        }

        // Recompute one cell by hand.
        double sumElapsed = 0.0;
        std::uint64_t sumCalls = 0;
        for (std::uint32_t rep = 0; rep < 7; ++rep)
        {
            occsim::SimulationConfig sc;
            sc.population = 6;
            sc.variant = occsim::BackoffVariant::FullJitter;
            sc.seed = occsim::derive_seed(11, 6, static_cast<std::uint32_t>(occsim::BackoffVariant::FullJitter), rep);
            const auto r = occsim::run_simulation(sc);
            sumElapsed += r.elapsed;
            sumCalls += r.calls;
        }
        assert(std::fabs(rows[3].avgElapsed - sumElapsed / 7.0) < 1e-9);
        assert(std::fabs(rows[3].avgCalls - static_cast<double>(sumCalls) / 7.0) < 1e-9);
    }

    // Splitting repetitions over two "ranks" and summing the partial results gives
    // the single-rank totals. The reductions record their inputs instead of communicating.
    {
        const auto whole = occsim::run_experiment(small_config());

        std::vector<double> f64[2];
        std::vector<std::uint64_t> u64[2];
        for (int rank = 0; rank < 2; ++rank)
        {
            auto cfg = small_config();
            cfg.rank = rank;
            cfg.size = 2;
            cfg.reduceSumF64 = [&, rank](double v)
            {
                f64[rank].push_back(v);
                return v;
            };
            cfg.reduceSumU64 = [&, rank](std::uint64_t v)
            {
                u64[rank].push_back(v);
                return v;
            };
            (void)occsim::run_experiment(cfg);
        }

        // Per cell: one f64 (elapsed) and four u64 (calls, failures, completed, failed).
        assert(f64[0].size() == whole.size() && f64[1].size() == whole.size());
        assert(u64[0].size() == 4 * whole.size() && u64[1].size() == 4 * whole.size());
        for (std::size_t i = 0; i < whole.size(); ++i)
        {
            const std::uint64_t completed = u64[0][4 * i + 2] + u64[1][4 * i + 2];
            assert(completed == whole[i].completedRuns);
            // Repetitions 0,2,4,6 on rank 0 and 1,3,5 on rank 1.
            assert(u64[0][4 * i + 2] == 4 && u64[1][4 * i + 2] == 3);

            const std::uint64_t calls = u64[0][4 * i] + u64[1][4 * i];
            assert(calls == static_cast<std::uint64_t>(std::llround(whole[i].avgCalls * 7.0)));

            const double elapsed = f64[0][i] + f64[1][i];
            assert(std::fabs(elapsed / 7.0 - whole[i].avgElapsed) < 1e-6);
        }
    }

    // Jitter cuts the work done under contention: with 20 clients, every jittered
    // variant averages fewer write calls than retrying immediately, and plain
    // exponential backoff takes far longer to finish than full jitter.
    {
        occsim::ExperimentConfig cfg;
        cfg.populations = {20};
        cfg.repetitions = 40;
        cfg.seed = 2015;
        cfg.traceDir.clear();
        const auto rows = occsim::run_experiment(cfg);
        assert(rows.size() == occsim::AllBackoffVariants.size());

        auto row_for = [&](occsim::BackoffVariant v) -> const occsim::ReportRow &
        {
            for (const auto &r : rows)
            {
                if (r.variant == v)
                {
                    return r;
                }
            }
            throw std::logic_error("missing row");
        };

        const auto &none = row_for(occsim::BackoffVariant::None);
        assert(none.avgCalls > row_for(occsim::BackoffVariant::FullJitter).avgCalls);
        assert(none.avgCalls > row_for(occsim::BackoffVariant::EqualJitter).avgCalls);
        assert(none.avgCalls > row_for(occsim::BackoffVariant::Decorrelated).avgCalls);
        assert(row_for(occsim::BackoffVariant::Exponential).avgElapsed >
               row_for(occsim::BackoffVariant::FullJitter).avgElapsed);
        assert(none.avgElapsed < row_for(occsim::BackoffVariant::Exponential).avgElapsed);
    }

    // Trace files land in traceDir, one per variant.
    {
        const auto dir = std::filesystem::temp_directory_path() / "occsim_experiment_sweep_test";
        std::filesystem::create_directories(dir);

        auto cfg = small_config();
        cfg.traceDir = dir.string();
        (void)occsim::run_experiment(cfg);
        assert(std::filesystem::exists(dir / "ts_None"));
        assert(std::filesystem::exists(dir / "ts_FullJitter"));

        // Each cell rewrites its file: the last client count (6) times 7 repetitions.
        std::ifstream in(dir / "ts_None");
        std::size_t lines = 0;
        std::string line;
        while (std::getline(in, line))
        {
            ++lines;
        }
        assert(lines == 6 * 7);
        std::filesystem::remove_all(dir);
    }

    // A trace target that rejects writes fails each run it affects, not the sweep.
    {
        const auto dir = std::filesystem::temp_directory_path() / "occsim_experiment_sweep_full_test";
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        std::filesystem::create_symlink("/dev/full", dir / "ts_None");

        auto cfg = small_config();
        cfg.populations = {3};
        cfg.variants = {occsim::BackoffVariant::None};
        cfg.repetitions = 4;
        cfg.traceDir = dir.string();

        const auto rows = occsim::run_experiment(cfg);
        assert(rows.size() == 1);
        assert(rows[0].completedRuns == 0);
        assert(rows[0].failedRuns == 4);
        assert(rows[0].avgElapsed == 0.0);
        std::filesystem::remove_all(dir);
    }

    // Non-finite or out-of-range numeric settings are rejected before any run.
    {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        const double inf = std::numeric_limits<double>::infinity();
        std::vector<occsim::ExperimentConfig> bad(8, small_config());
        bad[0].delayMean = nan;
        bad[1].delayMean = inf;
        bad[2].delayStddev = nan;
        bad[3].delayStddev = -1.0;
        bad[4].backoffCap = -1.0;
        bad[5].backoffCap = inf;
        bad[6].backoffBase = nan;
        bad[7].backoffBase = 0.0;
        for (const auto &cfg : bad)
        {
            bool threw = false;
            try
            {
                (void)occsim::run_experiment(cfg);
            }
            catch (const std::invalid_argument &)
            {
                threw = true;
            }
            assert(threw);
        }
    }

    // Configuration errors.
    {
        auto cfg = small_config();
        cfg.repetitions = 0;
        bool threw = false;
        try
        {
            (void)occsim::run_experiment(cfg);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);

        cfg = small_config();
        cfg.size = 2;
        threw = false;
        try
        {
            (void)occsim::run_experiment(cfg);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);
    }

    return 0;
}
