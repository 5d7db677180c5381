#pragma once

#include "probe.hpp"

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace cmhsim
{
    // What an actor exposes to its peers: an id and a mailbox slot.
    class IProbeReceiver
    {
    public:
        virtual ~IProbeReceiver() = default;

        virtual ActorId id() const noexcept = 0;

        // Must be safe to call from any thread.
        virtual void deliver(const ProbeMessage &msg) = 0;
    };

    // Read-only id -> actor mapping shared by every actor. Built once by the
    // harness before any actor runs and never mutated afterwards, so lookups
    // need no locking.
    class ActorDirectory
    {
    public:
        explicit ActorDirectory(const std::vector<IProbeReceiver *> &actors)
        {
            for (IProbeReceiver *a : actors)
            {
                if (!a)
                {
                    throw std::runtime_error("ActorDirectory: null actor");
                }
                auto [it, inserted] = m_actors.emplace(a->id(), a);
                if (!inserted)
                {
                    throw std::runtime_error("ActorDirectory: duplicate ActorId=" + std::to_string(a->id()));
                }
            }
        }

        ActorDirectory(const ActorDirectory &) = delete;
        ActorDirectory &operator=(const ActorDirectory &) = delete;

        IProbeReceiver *find(ActorId id) const noexcept
        {
            auto it = m_actors.find(id);
            return it == m_actors.end() ? nullptr : it->second;
        }

        IProbeReceiver &at(ActorId id) const
        {
            auto it = m_actors.find(id);
            if (it == m_actors.end())
            {
                throw std::out_of_range("ActorDirectory: unknown ActorId=" + std::to_string(id));
            }
            return *it->second;
        }

        std::size_t size() const noexcept { return m_actors.size(); }

    private:
        std::unordered_map<ActorId, IProbeReceiver *> m_actors;
    };
}
