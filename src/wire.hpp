#pragma once

#include "common.hpp"

#include <stdexcept>
#include <string>

namespace cmhsim
{
    class WireWriter
    {
    public:
        void write_u8(std::uint8_t v) { m_buf.push_back(static_cast<std::byte>(v)); }
        void write_u32(std::uint32_t v)
        {
            for (int i = 0; i < 4; ++i)
            {
                m_buf.push_back(static_cast<std::byte>((v >> (8 * i)) & 0xFFu));
            }
        }

        ByteBuffer take() { return std::move(m_buf); }

    private:
        ByteBuffer m_buf;
    };

    class WireReader
    {
    public:
        // `what` names the record being decoded in error messages.
        explicit WireReader(std::span<const std::byte> bytes, const char *what = "WireReader")
            : m_bytes(bytes), m_what(what)
        {
        }

        bool eof() const { return m_pos >= m_bytes.size(); }

        std::uint8_t read_u8()
        {
            require_(1);
            return static_cast<std::uint8_t>(m_bytes[m_pos++]);
        }

        std::uint32_t read_u32()
        {
            require_(4);
            std::uint32_t out = 0;
            for (int i = 0; i < 4; ++i)
            {
                out |= (static_cast<std::uint32_t>(static_cast<std::uint8_t>(m_bytes[m_pos++])) << (8 * i));
            }
            return out;
        }

        void expect_end() const
        {
            if (!eof())
            {
                throw std::runtime_error(std::string(m_what) + ": " + std::to_string(m_bytes.size() - m_pos) +
                                         " trailing byte(s) after offset " + std::to_string(m_pos));
            }
        }

    private:
        void require_(std::size_t n) const
        {
            if (m_pos + n > m_bytes.size())
            {
                throw std::runtime_error(std::string(m_what) + ": truncated buffer, need " + std::to_string(n) +
                                         " byte(s) at offset " + std::to_string(m_pos) + " of " +
                                         std::to_string(m_bytes.size()));
            }
        }

        std::span<const std::byte> m_bytes;
        const char *m_what;
        std::size_t m_pos = 0;
    };
}
