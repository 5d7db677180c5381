#pragma once

#include "actor.hpp"

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace cmhsim
{
    struct SimulationConfig
    {
        std::uint32_t numActors = 5;
        std::uint32_t numResources = 3;

        ActorConfig actor{};

        // Seed of the default per-actor random streams.
        std::uint64_t seed = 1;

        // Logging (disabled by default).
        LogLevel logLevel = LogLevel::Off;

        // Optional: random source for each actor. If not set, actor `id` gets
        // SplitMixRandom(seed, id).
        std::function<std::unique_ptr<IRandomSource>(ActorId)> randomFactory;

        void validate() const
        {
            if (numActors == 0)
            {
                throw std::invalid_argument("SimulationConfig: numActors must be at least 1");
            }
            if (numResources == 0)
            {
                throw std::invalid_argument("SimulationConfig: numResources must be at least 1");
            }
            if (actor.runTime.count() <= 0)
            {
                throw std::invalid_argument("SimulationConfig: runTime must be positive");
            }
            if (actor.requestTimeout.count() < 0 || actor.usageTime.count() < 0 || actor.sleepInterval.count() < 0)
            {
                throw std::invalid_argument("SimulationConfig: durations must not be negative");
            }
        }
    };

    struct ActorReport
    {
        ActorId id = NoActor;
        ActorOutcome outcome = ActorOutcome::BudgetExhausted;
        ActorStats stats{};
        std::string error;
    };

    struct SimulationReport
    {
        std::vector<ActorReport> actors;
        std::uint64_t roundsStarted = 0;
        std::uint64_t roundsClosed = 0;

        std::size_t count(ActorOutcome o) const
        {
            std::size_t n = 0;
            for (const ActorReport &a : actors)
            {
                if (a.outcome == o)
                {
                    ++n;
                }
            }
            return n;
        }
    };

    // Builds the resource pool and the actors, wires the shared directory and
    // runs every actor on its own thread until all of them have finished.
    class Simulation
    {
    public:
        explicit Simulation(SimulationConfig cfg, const IClock &clock = SteadyClock::instance())
            : m_cfg(std::move(cfg))
        {
            m_cfg.validate();
            Logger::instance().set_level(m_cfg.logLevel);

            m_resources.reserve(m_cfg.numResources);
            std::vector<Resource *> pool;
            pool.reserve(m_cfg.numResources);
            for (std::uint32_t i = 0; i < m_cfg.numResources; ++i)
            {
                m_resources.push_back(std::make_unique<Resource>(static_cast<ResourceId>(i + 1)));
                pool.push_back(m_resources.back().get());
            }

            m_actors.reserve(m_cfg.numActors);
            std::vector<IProbeReceiver *> receivers;
            receivers.reserve(m_cfg.numActors);
            for (std::uint32_t i = 0; i < m_cfg.numActors; ++i)
            {
                const ActorId id = static_cast<ActorId>(i + 1);
                std::unique_ptr<IRandomSource> rng;
                if (m_cfg.randomFactory)
                {
                    rng = m_cfg.randomFactory(id);
                }
                else
                {
                    rng = std::make_unique<SplitMixRandom>(m_cfg.seed, id);
                }
                m_actors.push_back(std::make_unique<Actor>(id, pool, m_coordinator, std::move(rng), m_cfg.actor, clock));
                receivers.push_back(m_actors.back().get());
            }

            m_directory = std::make_unique<ActorDirectory>(receivers);
            for (auto &a : m_actors)
            {
                a->attach_directory(*m_directory);
            }
        }

        Simulation(const Simulation &) = delete;
        Simulation &operator=(const Simulation &) = delete;

        // Blocks until every actor has exhausted its budget, self-terminated or failed.
        SimulationReport run()
        {
            if (m_ran)
            {
                throw std::runtime_error("Simulation::run: already ran");
            }
            m_ran = true;

            SimulationReport report;
            report.actors.resize(m_actors.size());

            std::vector<std::thread> threads;
            threads.reserve(m_actors.size());
            for (std::size_t i = 0; i < m_actors.size(); ++i)
            {
                threads.emplace_back([this, i, &report]
                                     { run_actor_(*m_actors[i], report.actors[i]); });
            }
            for (auto &t : threads)
            {
                t.join();
            }

            for (std::size_t i = 0; i < m_actors.size(); ++i)
            {
                report.actors[i].stats = m_actors[i]->stats();
            }
            report.roundsStarted = m_coordinator.rounds_started();
            report.roundsClosed = m_coordinator.rounds_closed();
            return report;
        }

        const SimulationConfig &config() const noexcept { return m_cfg; }
        const DetectionCoordinator &coordinator() const noexcept { return m_coordinator; }

        std::size_t num_actors() const noexcept { return m_actors.size(); }

        const Actor &actor(ActorId id) const
        {
            if (id == NoActor || id > m_actors.size())
            {
                throw std::out_of_range("Simulation: unknown ActorId=" + std::to_string(id));
            }
            return *m_actors[id - 1];
        }

        std::size_t num_resources() const noexcept { return m_resources.size(); }

        const Resource &resource(ResourceId id) const
        {
            if (id == 0 || id > m_resources.size())
            {
                throw std::out_of_range("Simulation: unknown ResourceId=" + std::to_string(id));
            }
            return *m_resources[id - 1];
        }

    private:
        static void run_actor_(Actor &actor, ActorReport &out)
        {
            out.id = actor.id();
            try
            {
                out.outcome = actor.run();
            }
            catch (const std::exception &e)
            {
                out.outcome = ActorOutcome::Failed;
                out.error = e.what();
                Logger::instance().logf(LogLevel::Error, actor.id(), "process %u failed: %s",
                                        static_cast<unsigned>(actor.id()), e.what());
            }
        }

        SimulationConfig m_cfg;
        DetectionCoordinator m_coordinator;
        std::vector<std::unique_ptr<Resource>> m_resources;
        std::vector<std::unique_ptr<Actor>> m_actors;
        std::unique_ptr<ActorDirectory> m_directory;
        bool m_ran = false;
    };
}
