#include "log.hpp"
#include "simulation.hpp"

#include <cassert>
#include <cstdio>
#include <string>

namespace
{
    std::string slurp(FILE *f)
    {
        std::rewind(f);
        std::string out;
        char buf[256];
        std::size_t n = 0;
        while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0)
        {
            out.append(buf, n);
        }
        return out;
    }
}

int main()
{
    auto &log = occsim::Logger::instance();

    FILE *f = std::tmpfile();
    assert(f != nullptr);
    log.set_sink(f);

    // Off by default; level filtering is inclusive.
    assert(log.level() == occsim::LogLevel::Off);
    log.logf(occsim::LogLevel::Error, 1, 0.0, "hidden");
    log.set_level(occsim::LogLevel::Info);
    log.logf(occsim::LogLevel::Debug, 1, 0.0, "hidden too");
    log.logf(occsim::LogLevel::Warn, 3, 12.5, "retry %d", 7);
    log.logf(occsim::LogLevel::Info, occsim::NoClient, 1.0, "sweep");

    std::string text = slurp(f);
    assert(text == "[WARN][client=3][t=12.500] retry 7\n[INFO][t=1.000] sweep\n");

    // A run that does not ask for a level leaves the caller's level alone.
    {
        occsim::SimulationConfig cfg;
        cfg.population = 2;
        occsim::Simulation sim(cfg);
        assert(log.level() == occsim::LogLevel::Info);
    }

    // A run configured with Debug logs client completions.
    {
        occsim::SimulationConfig cfg;
        cfg.population = 2;
        cfg.logLevel = occsim::LogLevel::Debug;
        (void)occsim::run_simulation(cfg);
    }
    text = slurp(f);
    assert(text.find("[DEBUG][client=0]") != std::string::npos);
    assert(text.find("done after") != std::string::npos);
    assert(text.find("[INFO][t=") != std::string::npos);

    log.set_level(occsim::LogLevel::Off);
    log.set_sink(stderr);
    std::fclose(f);
    return 0;
}
