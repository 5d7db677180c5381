#pragma once

#include "common.hpp"
#include "log.hpp"

#include <mutex>
#include <optional>

namespace cmhsim
{
    // Exclusive unit of contention. Owner transitions happen only under m_mu.
    class Resource
    {
    public:
        explicit Resource(ResourceId id) : m_id(id) {}

        Resource(const Resource &) = delete;
        Resource &operator=(const Resource &) = delete;

        ResourceId id() const noexcept { return m_id; }

        // Grants the resource to `actor` if nobody owns it. A busy resource is an
        // expected outcome (returns false) and leaves the current owner untouched,
        // including when `actor` is that owner.
        bool acquire_if_free(ActorId actor)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (m_owner)
            {
                return false;
            }
            m_owner = actor;
            Logger::instance().logf(LogLevel::Debug, actor, "assigning (Resource %u) to (Process %u)",
                                    static_cast<unsigned>(m_id), static_cast<unsigned>(actor));
            return true;
        }

        std::optional<ActorId> current_owner() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_owner;
        }

        bool is_held_by(ActorId actor) const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_owner && *m_owner == actor;
        }

        // Unconditional; releasing a free resource is a no-op.
        void release()
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_owner.reset();
        }

    private:
        const ResourceId m_id;
        mutable std::mutex m_mu;
        std::optional<ActorId> m_owner;
    };
}
