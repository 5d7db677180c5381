#pragma once

#include "common.hpp"

#include <mutex>

namespace cmhsim
{
    // Process-wide single-flight gate for detection rounds.
    //
    // At most one round is in flight at a time. The actor that wins
    // try_begin_round() owns the round and is the only one that can close it:
    // when its own probe comes back, when it found no holder to probe, or when
    // it leaves the simulation (budget exhausted or a failed pass).
    class DetectionCoordinator
    {
    public:
        // Test-and-set. Returns false, with no side effects, if a round is already running.
        bool try_begin_round(ActorId initiator)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (m_running)
            {
                return false;
            }
            m_running = true;
            m_initiator = initiator;
            ++m_roundsStarted;
            return true;
        }

        // Closes the round owned by `initiator`. Returns false, leaving the gate
        // alone, if no round is running or it belongs to another actor.
        bool end_round(ActorId initiator)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (!m_running || m_initiator != initiator)
            {
                return false;
            }
            m_running = false;
            m_initiator = NoActor;
            ++m_roundsClosed;
            return true;
        }

        bool is_running() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_running;
        }

        ActorId current_initiator() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_initiator;
        }

        std::uint64_t rounds_started() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_roundsStarted;
        }

        std::uint64_t rounds_closed() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_roundsClosed;
        }

    private:
        mutable std::mutex m_mu;
        bool m_running = false;
        ActorId m_initiator = NoActor;
        std::uint64_t m_roundsStarted = 0;
        std::uint64_t m_roundsClosed = 0;
    };
}
