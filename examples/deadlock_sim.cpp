#include "simulation.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>

namespace
{
    struct Params
    {
        std::uint32_t processes = 5;
        std::uint32_t resources = 3;
        std::uint64_t runTimeMs = 60000;
        std::uint64_t requestTimeoutMs = 5000;
        std::uint64_t usageTimeMs = 10000;
        std::uint64_t sleepMs = 5000;
        std::uint64_t seed = 1;
        cmhsim::LogLevel logLevel = cmhsim::LogLevel::Debug;
        cmhsim::LogLevel echoLevel = cmhsim::LogLevel::Info;
        std::string logFile = "simulation.log";
    };

    bool parse_u32(std::string_view s, std::uint32_t &out)
    {
        unsigned long v = 0;
        auto r = std::from_chars(s.data(), s.data() + s.size(), v);
        if (r.ec != std::errc() || r.ptr != s.data() + s.size() || v > std::numeric_limits<std::uint32_t>::max())
        {
            return false;
        }
        out = static_cast<std::uint32_t>(v);
        return true;
    }

    bool parse_u64(std::string_view s, std::uint64_t &out)
    {
        unsigned long long v = 0;
        auto r = std::from_chars(s.data(), s.data() + s.size(), v);
        if (r.ec != std::errc() || r.ptr != s.data() + s.size())
        {
            return false;
        }
        out = static_cast<std::uint64_t>(v);
        return true;
    }

    [[noreturn]] void usage_and_exit()
    {
        std::cerr << "Chandy-Misra-Haas deadlock detection simulation\n"
                  << "  -n, --num_processes N   number of processes (default 5)\n"
                  << "  -m, --num_resources M   number of resources (default 3)\n"
                  << "  --run-time MS           run budget per process (default 60000)\n"
                  << "  --request-timeout MS    wait before suspecting deadlock (default 5000)\n"
                  << "  --usage-time MS         hold time before voluntary release (default 10000)\n"
                  << "  --sleep MS              pause between passes (default 5000)\n"
                  << "  --seed S                random seed (default 1)\n"
                  << "  --log-level L           error|warn|info|debug|trace|off (default debug)\n"
                  << "  --log-file PATH         narration log (default simulation.log)\n"
                  << "  --echo-level L          narration echoed to stdout (default info)\n";
        std::exit(2);
    }

    Params parse_args(int argc, char **argv)
    {
        Params p;
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

            if (a == "-n" || a == "--num_processes")
            {
                if (!parse_u32(need(), p.processes))
                    usage_and_exit();
            }
            else if (a == "-m" || a == "--num_resources")
            {
                if (!parse_u32(need(), p.resources))
                    usage_and_exit();
            }
            else if (a == "--run-time")
            {
                if (!parse_u64(need(), p.runTimeMs))
                    usage_and_exit();
            }
            else if (a == "--request-timeout")
            {
                if (!parse_u64(need(), p.requestTimeoutMs))
                    usage_and_exit();
            }
            else if (a == "--usage-time")
            {
                if (!parse_u64(need(), p.usageTimeMs))
                    usage_and_exit();
            }
            else if (a == "--sleep")
            {
                if (!parse_u64(need(), p.sleepMs))
                    usage_and_exit();
            }
            else if (a == "--seed")
            {
                if (!parse_u64(need(), p.seed))
                    usage_and_exit();
            }
            else if (a == "--log-level")
            {
                auto lvl = cmhsim::parse_log_level(need());
                if (!lvl)
                    usage_and_exit();
                p.logLevel = *lvl;
            }
            else if (a == "--echo-level")
            {
                auto lvl = cmhsim::parse_log_level(need());
                if (!lvl)
                    usage_and_exit();
                p.echoLevel = *lvl;
            }
            else if (a == "--log-file")
            {
                p.logFile = std::string(need());
            }
            else
            {
                usage_and_exit();
            }
        }
        return p;
    }

    cmhsim::Duration ms(std::uint64_t v)
    {
        return cmhsim::Duration(static_cast<cmhsim::Duration::rep>(v));
    }
}

int main(int argc, char **argv)
{
    const Params p = parse_args(argc, argv);

    cmhsim::SimulationConfig cfg;
    cfg.numActors = p.processes;
    cfg.numResources = p.resources;
    cfg.actor.runTime = ms(p.runTimeMs);
    cfg.actor.requestTimeout = ms(p.requestTimeoutMs);
    cfg.actor.usageTime = ms(p.usageTimeMs);
    cfg.actor.sleepInterval = ms(p.sleepMs);
    cfg.seed = p.seed;
    cfg.logLevel = p.logLevel;

    if (p.logLevel != cmhsim::LogLevel::Off && !cmhsim::Logger::instance().open_file(p.logFile.c_str()))
    {
        std::cerr << "cannot open log file " << p.logFile << ", logging to stderr\n";
    }
    cmhsim::Logger::instance().set_echo(stdout, p.echoLevel);

    try
    {
        cmhsim::Simulation sim(cfg);

        std::cout << "created " << sim.num_resources() << " resources:";
        for (std::size_t r = 1; r <= sim.num_resources(); ++r)
        {
            std::cout << " (Resource " << sim.resource(static_cast<cmhsim::ResourceId>(r)).id() << ")";
        }
        std::cout << "\ncreated " << sim.num_actors() << " processes:";
        for (std::size_t a = 1; a <= sim.num_actors(); ++a)
        {
            std::cout << " (Process " << sim.actor(static_cast<cmhsim::ActorId>(a)).id() << ")";
        }
        std::cout << "\n";

        const cmhsim::SimulationReport report = sim.run();

        for (const cmhsim::ActorReport &a : report.actors)
        {
            std::cout << "process " << a.id << ": " << cmhsim::actor_outcome_name(a.outcome)
                      << " requests=" << a.stats.requestsCreated
                      << " acquired=" << a.stats.acquisitions
                      << " released=" << a.stats.releases
                      << " probes_sent=" << a.stats.probesSent
                      << " probes_received=" << a.stats.probesReceived
                      << " rounds=" << a.stats.roundsInitiated;
            if (!a.error.empty())
            {
                std::cout << " error=\"" << a.error << "\"";
            }
            std::cout << "\n";
        }
        std::cout << "detection rounds started=" << report.roundsStarted
                  << " closed=" << report.roundsClosed
                  << " harakiri=" << report.count(cmhsim::ActorOutcome::Harakiri) << "\n";

        return report.count(cmhsim::ActorOutcome::Failed) == 0 ? 0 : 1;
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << e.what() << "\n";
        usage_and_exit();
    }
}
