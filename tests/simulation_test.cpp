/*
Purpose: End-to-end tests of the threaded harness.

What this tests:
- Configuration validation rejects empty worlds and a zero run budget.
- Three actors on five resources with no overlapping demand never start a
  detection round and all run out their budget (no harakiri).
- An actor whose thread throws is reported as failed while the others finish,
  and it leaves neither the detection gate nor a resource claimed.
- A randomized contended run completes without failures, at most one round is
  ever counted as open, and every resource is free afterwards.
*/

#include "simulation.hpp"
#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

using namespace std::chrono_literals;
using cmhsim_test::ScriptedRandom;
using cmhsim_test::expect_throw;

namespace
{
    class ThrowingRandom final : public cmhsim::IRandomSource
    {
    public:
        std::uint64_t uniform(std::uint64_t, std::uint64_t) override
        {
            throw std::runtime_error("random source exhausted");
        }
    };

    cmhsim::ActorConfig fast_config()
    {
        cmhsim::ActorConfig cfg;
        cfg.runTime = 150ms;
        cfg.requestTimeout = 20ms;
        cfg.usageTime = 40ms;
        cfg.sleepInterval = 2ms;
        return cfg;
    }
}

int main()
{
    // Validation.
    {
        cmhsim::SimulationConfig cfg;
        cfg.numActors = 0;
        expect_throw([&]
                     { cmhsim::Simulation sim(cfg); });

        cfg = {};
        cfg.numResources = 0;
        expect_throw([&]
                     { cmhsim::Simulation sim(cfg); });

        cfg = {};
        cfg.actor.runTime = 0ms;
        expect_throw([&]
                     { cfg.validate(); });

        cfg = {};
        cfg.validate();
        cmhsim::Simulation sim(cfg);
        assert(sim.num_actors() == 5);
        assert(sim.num_resources() == 3);
        assert(sim.actor(5).id() == 5);
        assert(sim.resource(3).id() == 3);
        expect_throw([&]
                     { (void)sim.actor(6); });
        expect_throw([&]
                     { (void)sim.resource(0); });
    }

    // No contention: each actor only ever asks for its own resource.
    {
        cmhsim::SimulationConfig cfg;
        cfg.numActors = 3;
        cfg.numResources = 5;
        cfg.actor = fast_config();
        cfg.randomFactory = [](cmhsim::ActorId id) -> std::unique_ptr<cmhsim::IRandomSource>
        {
            // count = 1, offset = id - 1, then idle.
            return std::make_unique<ScriptedRandom>(std::vector<std::uint64_t>{1, id - 1});
        };

        cmhsim::Simulation sim(cfg);
        const cmhsim::SimulationReport report = sim.run();

        assert(report.actors.size() == 3);
        assert(report.count(cmhsim::ActorOutcome::BudgetExhausted) == 3);
        assert(report.count(cmhsim::ActorOutcome::Harakiri) == 0);
        assert(report.roundsStarted == 0);
        for (const cmhsim::ActorReport &a : report.actors)
        {
            assert(a.error.empty());
            assert(a.stats.requestsCreated == 1);
            assert(a.stats.acquisitions == 1);
            assert(a.stats.releases == 1);
            assert(a.stats.probesSent == 0);
            assert(a.stats.probesReceived == 0);
        }
        for (cmhsim::ResourceId r = 1; r <= 5; ++r)
        {
            assert(!sim.resource(r).current_owner().has_value());
        }

        expect_throw([&]
                     { (void)sim.run(); });
    }

    // A failing actor is recorded, not fatal.
    {
        cmhsim::SimulationConfig cfg;
        cfg.numActors = 3;
        cfg.numResources = 2;
        cfg.actor = fast_config();
        cfg.actor.runTime = 40ms;
        cfg.randomFactory = [](cmhsim::ActorId id) -> std::unique_ptr<cmhsim::IRandomSource>
        {
            if (id == 2)
            {
                return std::make_unique<ThrowingRandom>();
            }
            return std::make_unique<ScriptedRandom>(std::vector<std::uint64_t>{});
        };

        cmhsim::Simulation sim(cfg);
        const cmhsim::SimulationReport report = sim.run();

        assert(report.actors[1].id == 2);
        assert(report.actors[1].outcome == cmhsim::ActorOutcome::Failed);
        assert(report.actors[1].error == "random source exhausted");
        assert(report.actors[0].outcome == cmhsim::ActorOutcome::BudgetExhausted);
        assert(report.actors[2].outcome == cmhsim::ActorOutcome::BudgetExhausted);
        assert(!sim.coordinator().is_running());
        assert(!sim.resource(1).current_owner().has_value());
        assert(!sim.resource(2).current_owner().has_value());
    }

    // Randomized contention.
    {
        cmhsim::SimulationConfig cfg;
        cfg.numActors = 5;
        cfg.numResources = 3;
        cfg.seed = 7;
        cfg.actor.runTime = 300ms;
        cfg.actor.requestTimeout = 10ms;
        cfg.actor.usageTime = 30ms;
        cfg.actor.sleepInterval = 2ms;

        cmhsim::Simulation sim(cfg);
        const cmhsim::SimulationReport report = sim.run();

        assert(report.count(cmhsim::ActorOutcome::Failed) == 0);
        assert(report.count(cmhsim::ActorOutcome::Harakiri) <= report.roundsStarted);
        assert(report.roundsClosed <= report.roundsStarted);
        assert(report.roundsStarted - report.roundsClosed <= 1);

        std::uint64_t acquired = 0;
        std::uint64_t released = 0;
        for (const cmhsim::ActorReport &a : report.actors)
        {
            acquired += a.stats.acquisitions;
            released += a.stats.releases;
        }
        assert(acquired == released);
        for (cmhsim::ResourceId r = 1; r <= 3; ++r)
        {
            assert(!sim.resource(r).current_owner().has_value());
        }
    }

    return 0;
}
