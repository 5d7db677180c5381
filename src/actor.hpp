#pragma once

#include "clock.hpp"
#include "coordinator.hpp"
#include "directory.hpp"
#include "log.hpp"
#include "mailbox.hpp"
#include "random.hpp"
#include "resource_request.hpp"

#include <exception>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace cmhsim
{
    struct ActorConfig
    {
        // Wall-clock budget of Actor::run().
        Duration runTime{60000};

        // A pending request older than this is suspected to be stuck.
        Duration requestTimeout{5000};

        // A granted request older than this is given back voluntarily.
        Duration usageTime{10000};

        // Pause between passes of the run loop.
        Duration sleepInterval{5000};
    };

    struct ActorStats
    {
        std::uint64_t requestsCreated = 0;
        std::uint64_t acquisitions = 0;
        std::uint64_t releases = 0;
        std::uint64_t probesSent = 0;
        std::uint64_t probesReceived = 0;
        std::uint64_t roundsInitiated = 0;
        std::uint64_t initiationsSkipped = 0;
    };

    enum class StepResult : std::uint8_t
    {
        Continue = 0,
        Harakiri = 1,
    };

    enum class ActorOutcome : std::uint8_t
    {
        BudgetExhausted = 0,
        Harakiri = 1,
        Failed = 2,
    };

    inline const char *actor_outcome_name(ActorOutcome o) noexcept
    {
        switch (o)
        {
        case ActorOutcome::BudgetExhausted:
            return "budget-exhausted";
        case ActorOutcome::Harakiri:
            return "harakiri";
        case ActorOutcome::Failed:
            return "failed";
        }
        return "unknown";
    }

    // One process of the simulated distributed system.
    //
    // The actor owns its request list and mailbox. Other actors only ever touch
    // it through deliver(); resources are shared and guarded by their own mutexes.
    class Actor final : public IProbeReceiver
    {
    public:
        Actor(ActorId id,
              std::vector<Resource *> pool,
              DetectionCoordinator &coordinator,
              std::unique_ptr<IRandomSource> rng,
              ActorConfig cfg = {},
              const IClock &clock = SteadyClock::instance())
            : m_id(id), m_pool(std::move(pool)), m_coordinator(coordinator), m_rng(std::move(rng)), m_cfg(cfg), m_clock(clock)
        {
            if (m_id == NoActor)
            {
                throw std::runtime_error("Actor: id 0 is reserved");
            }
            if (!m_rng)
            {
                throw std::runtime_error("Actor requires a random source");
            }
            for (Resource *r : m_pool)
            {
                if (!r)
                {
                    throw std::runtime_error("Actor: null resource in pool");
                }
            }
        }

        ActorId id() const noexcept override { return m_id; }

        void deliver(const ProbeMessage &msg) override { m_mailbox.post(msg); }

        void attach_directory(const ActorDirectory &directory)
        {
            if (m_directory)
            {
                throw std::runtime_error("Actor: directory already attached");
            }
            m_directory = &directory;
        }

        // Runs passes until the budget elapses or the actor resolves a deadlock
        // it initiated. Resources still owned at the end of the budget are released.
        // If a pass throws, the actor gives up its resources and its open round
        // before the exception leaves run().
        ActorOutcome run()
        {
            const TimePoint start = m_clock.now();
            Logger::instance().logf(LogLevel::Info, m_id, "starting process %u", static_cast<unsigned>(m_id));

            try
            {
                while (m_clock.now() - start < m_cfg.runTime)
                {
                    if (step() == StepResult::Harakiri)
                    {
                        return ActorOutcome::Harakiri;
                    }
                    std::this_thread::sleep_for(m_cfg.sleepInterval);
                }
            }
            catch (const std::exception &)
            {
                Logger::instance().logf(LogLevel::Warn, m_id, "process %u aborting pass, holding %zu resource(s)",
                                        static_cast<unsigned>(m_id), held_count());
                withdraw_();
                throw;
            }

            Logger::instance().logf(LogLevel::Info, m_id, "process %u run budget exhausted, holding %zu resource(s)",
                                    static_cast<unsigned>(m_id), held_count());
            withdraw_();
            return ActorOutcome::BudgetExhausted;
        }

        // One pass of the run loop.
        StepResult step()
        {
            if (m_terminated)
            {
                throw std::runtime_error("Actor::step: process has terminated");
            }

            request_random_resources();

            if (handle_probe_message_())
            {
                harakiri();
                return StepResult::Harakiri;
            }

            bool shouldInitiate = false;
            const TimePoint now = m_clock.now();
            for (const ResourceRequest &req : m_requests)
            {
                Resource &res = req.resource();
                if (res.is_held_by(m_id))
                {
                    continue;
                }
                if (res.acquire_if_free(m_id))
                {
                    ++m_stats.acquisitions;
                    continue;
                }
                if (req.has_exceeded(m_cfg.requestTimeout, now))
                {
                    Logger::instance().logf(LogLevel::Debug, m_id, "(Process %u)'s request for (Resource %u) has timed out",
                                            static_cast<unsigned>(m_id), static_cast<unsigned>(res.id()));
                    shouldInitiate = true;
                    break;
                }
            }

            if (shouldInitiate)
            {
                (void)initiate_deadlock_detection();
            }
            else
            {
                release_resources(/*force=*/false);
            }
            return StepResult::Continue;
        }

        void request_resource(Resource &resource)
        {
            m_requests.emplace_back(resource, m_clock.now());
            ++m_stats.requestsCreated;
            Logger::instance().logf(LogLevel::Debug, m_id, "(Process %u) has requested for (Resource %u)",
                                    static_cast<unsigned>(m_id), static_cast<unsigned>(resource.id()));
        }

        // With no outstanding requests, claims `count` consecutive resources of the
        // pool starting at `offset` (wrapping). count == 0 leaves the actor idle.
        void request_random_resources()
        {
            if (!m_requests.empty() || m_pool.empty())
            {
                return;
            }
            const std::uint64_t n = m_pool.size();
            const std::uint64_t count = m_rng->uniform(0, n);
            const std::uint64_t offset = m_rng->uniform(0, n - 1);
            for (std::uint64_t i = 0; i < count; ++i)
            {
                request_resource(*m_pool[static_cast<std::size_t>((offset + i) % n)]);
            }
        }

        // Releases granted requests older than usageTime. With `force`, drops every
        // request and releases everything this actor owns regardless of age.
        // Resources owned by other actors are never touched.
        void release_resources(bool force)
        {
            const TimePoint now = m_clock.now();
            for (auto it = m_requests.begin(); it != m_requests.end();)
            {
                Resource &res = it->resource();
                const bool owned = res.is_held_by(m_id);
                if (owned && (force || it->has_exceeded(m_cfg.usageTime, now)))
                {
                    res.release();
                    ++m_stats.releases;
                    Logger::instance().logf(LogLevel::Debug, m_id, "(Process %u) has released (Resource %u)",
                                            static_cast<unsigned>(m_id), static_cast<unsigned>(res.id()));
                    it = m_requests.erase(it);
                }
                else if (force)
                {
                    it = m_requests.erase(it);
                }
                else
                {
                    ++it;
                }
            }
        }

        // Claims the single-flight gate and probes every holder this actor is
        // stuck behind. Returns false if another round is already in flight.
        bool initiate_deadlock_detection()
        {
            if (!m_coordinator.try_begin_round(m_id))
            {
                ++m_stats.initiationsSkipped;
                Logger::instance().logf(LogLevel::Debug, m_id, "process %u skipped detection, a round is in flight",
                                        static_cast<unsigned>(m_id));
                return false;
            }

            ++m_stats.roundsInitiated;
            Logger::instance().logf(LogLevel::Info, m_id, "process %u initiating deadlock detection", static_cast<unsigned>(m_id));
            if (send_probes_to_neighbours_(m_id) == 0)
            {
                // Every holder let go in the meantime; no probe can come back.
                Logger::instance().logf(LogLevel::Info, m_id, "process %u has no neighbours, closing round",
                                        static_cast<unsigned>(m_id));
                (void)m_coordinator.end_round(m_id);
            }
            return true;
        }

        // Breaks a confirmed cycle by giving up everything this actor holds or waits for.
        void harakiri()
        {
            Logger::instance().logf(LogLevel::Info, m_id, "process %u performing Harakiri to break the deadlock",
                                    static_cast<unsigned>(m_id));
            release_resources(/*force=*/true);
            m_terminated = true;
        }

        const std::vector<ResourceRequest> &requests() const noexcept { return m_requests; }

        std::size_t held_count() const
        {
            std::size_t n = 0;
            for (const ResourceRequest &req : m_requests)
            {
                if (req.resource().is_held_by(m_id))
                {
                    ++n;
                }
            }
            return n;
        }

        std::size_t pending_probes() const { return m_mailbox.size(); }
        bool terminated() const noexcept { return m_terminated; }
        const ActorStats &stats() const noexcept { return m_stats; }
        const ActorConfig &config() const noexcept { return m_cfg; }

    private:
        // Drains at most one probe. Returns true if it is this actor's own probe,
        // i.e. the wait-for graph has a cycle through this actor.
        bool handle_probe_message_()
        {
            auto msg = m_mailbox.try_receive();
            if (!msg)
            {
                return false;
            }

            ++m_stats.probesReceived;
            Logger::instance().logf(LogLevel::Debug, m_id, "(Process %u) has received probe %s",
                                    static_cast<unsigned>(m_id), to_string(*msg).c_str());

            if (msg->initiator == m_id)
            {
                Logger::instance().logf(LogLevel::Info, m_id, "Deadlock detected by process %u", static_cast<unsigned>(m_id));
                if (!m_coordinator.end_round(m_id))
                {
                    Logger::instance().logf(LogLevel::Warn, m_id, "process %u confirmed a cycle outside its own round",
                                            static_cast<unsigned>(m_id));
                }
                return true;
            }

            (void)send_probes_to_neighbours_(msg->initiator);
            return false;
        }

        // Leaves the simulation: releases what this actor owns, drops its
        // requests and closes its own detection round if one is still open.
        void withdraw_()
        {
            release_resources(/*force=*/true);
            if (m_coordinator.end_round(m_id))
            {
                Logger::instance().logf(LogLevel::Info, m_id, "process %u abandoned its unanswered detection round",
                                        static_cast<unsigned>(m_id));
            }
        }

        // A neighbour is the current holder of a resource this actor has been
        // waiting on for longer than requestTimeout.
        std::size_t send_probes_to_neighbours_(ActorId initiator)
        {
            if (!m_directory)
            {
                throw std::runtime_error("Actor: no directory attached");
            }

            std::size_t sent = 0;
            const TimePoint now = m_clock.now();
            for (const ResourceRequest &req : m_requests)
            {
                if (!req.has_exceeded(m_cfg.requestTimeout, now))
                {
                    continue;
                }
                const std::optional<ActorId> holder = req.resource().current_owner();
                if (!holder || *holder == m_id)
                {
                    continue;
                }

                const ProbeMessage probe{initiator, m_id, *holder};
                Logger::instance().logf(LogLevel::Debug, m_id, "(Process %u) sending probe %s",
                                        static_cast<unsigned>(m_id), to_string(probe).c_str());
                m_directory->at(*holder).deliver(probe);
                ++m_stats.probesSent;
                ++sent;
            }
            return sent;
        }

        const ActorId m_id;
        std::vector<Resource *> m_pool;
        DetectionCoordinator &m_coordinator;
        std::unique_ptr<IRandomSource> m_rng;
        const ActorConfig m_cfg;
        const IClock &m_clock;

        const ActorDirectory *m_directory = nullptr;
        Mailbox m_mailbox;
        std::vector<ResourceRequest> m_requests;
        ActorStats m_stats{};
        bool m_terminated = false;
    };
}
