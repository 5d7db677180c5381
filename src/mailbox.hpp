#pragma once

#include "probe.hpp"

#include <deque>
#include <mutex>
#include <optional>

namespace cmhsim
{
    // Inbound probe queue of one actor. Any thread may post; only the owner polls.
    // Messages are held in wire form and decoded on receipt.
    class Mailbox
    {
    public:
        void post(const ProbeMessage &msg)
        {
            ByteBuffer bytes = encode_probe(msg);
            std::lock_guard<std::mutex> lk(m_mu);
            m_queue.push_back(std::move(bytes));
        }

        // Never blocks; std::nullopt means nothing arrived yet.
        std::optional<ProbeMessage> try_receive()
        {
            ByteBuffer bytes;
            {
                std::lock_guard<std::mutex> lk(m_mu);
                if (m_queue.empty())
                {
                    return std::nullopt;
                }
                bytes = std::move(m_queue.front());
                m_queue.pop_front();
            }
            return decode_probe(std::span<const std::byte>(bytes.data(), bytes.size()));
        }

        bool has_pending() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return !m_queue.empty();
        }

        std::size_t size() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_queue.size();
        }

    private:
        mutable std::mutex m_mu;
        std::deque<ByteBuffer> m_queue;
    };
}
