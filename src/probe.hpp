#pragma once

#include "common.hpp"
#include "wire.hpp"

#include <stdexcept>
#include <string>

namespace cmhsim
{
    // Chandy-Misra-Haas probe. `initiator` is fixed for the life of a round;
    // each hop rewrites only `sender` and `receiver`.
    struct ProbeMessage
    {
        ActorId initiator = NoActor;
        ActorId sender = NoActor;
        ActorId receiver = NoActor;

        bool operator==(const ProbeMessage &) const = default;
    };

    inline std::string to_string(const ProbeMessage &p)
    {
        return "ProbeMessage(initiator=" + std::to_string(p.initiator) +
               ", sender=" + std::to_string(p.sender) +
               ", receiver=" + std::to_string(p.receiver) + ")";
    }

    inline constexpr std::uint8_t ProbeWireKind = 1;
    inline constexpr std::size_t ProbeWireSize = 13;

    inline ByteBuffer encode_probe(const ProbeMessage &p)
    {
        WireWriter w;
        w.write_u8(ProbeWireKind);
        w.write_u32(p.initiator);
        w.write_u32(p.sender);
        w.write_u32(p.receiver);
        return w.take();
    }

    inline ProbeMessage decode_probe(std::span<const std::byte> bytes)
    {
        WireReader r(bytes, "ProbeMessage");
        const std::uint8_t kind = r.read_u8();
        if (kind != ProbeWireKind)
        {
            throw std::runtime_error("ProbeMessage: unexpected message kind " + std::to_string(kind));
        }
        ProbeMessage p;
        p.initiator = r.read_u32();
        p.sender = r.read_u32();
        p.receiver = r.read_u32();
        r.expect_end();
        return p;
    }
}
