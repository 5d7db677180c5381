#pragma once

#include "common.hpp"

namespace cmhsim
{
    // Process-wide time source shared by every actor.
    class IClock
    {
    public:
        virtual ~IClock() = default;
        virtual TimePoint now() const = 0;
    };

    class SteadyClock final : public IClock
    {
    public:
        static SteadyClock &instance()
        {
            static SteadyClock g;
            return g;
        }

        TimePoint now() const override { return std::chrono::steady_clock::now(); }
    };
}
