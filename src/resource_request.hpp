#pragma once

#include "resource.hpp"

namespace cmhsim
{
    // An actor's claim on a resource, pending or granted. The timestamp is taken
    // once and never refreshed: it measures both how long the actor has waited
    // and, once granted, how long it has been using the resource.
    class ResourceRequest
    {
    public:
        ResourceRequest(Resource &resource, TimePoint createdAt) : m_resource(&resource), m_createdAt(createdAt) {}

        Resource &resource() const noexcept { return *m_resource; }
        TimePoint created_at() const noexcept { return m_createdAt; }

        Duration age(TimePoint now) const
        {
            return std::chrono::duration_cast<Duration>(now - m_createdAt);
        }

        bool has_exceeded(Duration threshold, TimePoint now) const
        {
            return (now - m_createdAt) > threshold;
        }

    private:
        Resource *m_resource = nullptr;
        TimePoint m_createdAt{};
    };
}
