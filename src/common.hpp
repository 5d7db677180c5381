#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace cmhsim
{
    using ActorId = std::uint32_t;
    using ResourceId = std::uint32_t;

    // Ids are assigned from 1; 0 never names a live actor.
    inline constexpr ActorId NoActor = 0;

    using Duration = std::chrono::milliseconds;
    using TimePoint = std::chrono::steady_clock::time_point;

    using ByteBuffer = std::vector<std::byte>;
}
