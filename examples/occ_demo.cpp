#include "log.hpp"
#include "parse.hpp"
#include "simulation.hpp"
#include "trace_sink.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace
{
    [[noreturn]] void usage_and_exit()
    {
        std::cerr << "Single OCC contention run\n"
                  << "  --clients N\n"
                  << "  --variant None|Exponential|EqualJitter|FullJitter|Decorr\n"
                  << "  --base B\n"
                  << "  --cap C\n"
                  << "  --delay-mean M\n"
                  << "  --delay-sd S\n"
                  << "  --seed S\n"
                  << "  --max-attempts K\n"
                  << "  --trace FILE\n"
                  << "  --log LEVEL\n";
        std::exit(2);
    }
}

int main(int argc, char **argv)
{
    occsim::SimulationConfig cfg;
    std::string tracePath;

    for (int i = 1; i < argc; ++i)
    {
        std::string_view a(argv[i]);
        auto need = [&]() -> std::string_view
        {
            if (i + 1 >= argc)
            {
                usage_and_exit();
            }
            return std::string_view(argv[++i]);
        };

        bool ok = true;
        if (a == "--clients")
        {
            ok = occsim::parse_u32(need(), cfg.population);
        }
        else if (a == "--variant")
        {
            const auto v = occsim::parse_backoff_variant(need());
            ok = v.has_value();
            if (ok)
            {
                cfg.variant = *v;
            }
        }
        else if (a == "--base")
        {
            ok = occsim::parse_double(need(), cfg.backoffBase);
        }
        else if (a == "--cap")
        {
            ok = occsim::parse_double(need(), cfg.backoffCap);
        }
        else if (a == "--delay-mean")
        {
            ok = occsim::parse_double(need(), cfg.delayMean);
        }
        else if (a == "--delay-sd")
        {
            ok = occsim::parse_double(need(), cfg.delayStddev);
        }
        else if (a == "--seed")
        {
            ok = occsim::parse_u64(need(), cfg.seed);
        }
        else if (a == "--max-attempts")
        {
            ok = occsim::parse_u32(need(), cfg.maxAttempts);
        }
        else if (a == "--trace")
        {
            tracePath = std::string(need());
        }
        else if (a == "--log")
        {
            occsim::LogLevel lvl = occsim::LogLevel::Off;
            ok = occsim::parse_log_level(need(), lvl);
            cfg.logLevel = lvl;
        }
        else
        {
            ok = false;
        }
        if (!ok)
        {
            usage_and_exit();
        }
    }

    try
    {
        std::unique_ptr<occsim::FileTraceSink> trace;
        if (!tracePath.empty())
        {
            trace = std::make_unique<occsim::FileTraceSink>(tracePath);
            cfg.traceSink = trace.get();
        }

        const char *variantName = occsim::backoff_variant_name(cfg.variant);
        const auto clients = cfg.population;
        const occsim::RunResult r = occsim::run_simulation(cfg);
        if (trace)
        {
            trace->flush();
        }

        std::cout << "variant=" << variantName << " clients=" << clients << "\n";
        std::cout << "elapsed=" << r.elapsed << "\n";
        std::cout << "calls=" << r.calls << " failures=" << r.failures << " abandoned=" << r.abandoned << "\n";
        std::cout << "version=" << r.finalVersion << " events=" << r.eventsProcessed << "\n";
        std::cout << "digest=" << r.digest << "\n";
    }
    catch (const std::exception &e)
    {
        std::cerr << "occ_demo: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
