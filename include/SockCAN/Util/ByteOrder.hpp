#ifndef SOCKCAN_BYTE_ORDER_HPP
#define SOCKCAN_BYTE_ORDER_HPP

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>

namespace SockCAN::Util
{
    // Kernel ABI structures (can_frame, nlmsghdr, rtattr, ...) use host byte order.

    inline void store_u16(const std::span<uint8_t> out, const size_t offset, const uint16_t value) noexcept
    {
        if constexpr (std::endian::native == std::endian::little)
        {
            out[offset] = static_cast<uint8_t>(value);
            out[offset + 1] = static_cast<uint8_t>(value >> 8);
        }
        else
        {
            out[offset] = static_cast<uint8_t>(value >> 8);
            out[offset + 1] = static_cast<uint8_t>(value);
        }
    }

    inline void store_u32(const std::span<uint8_t> out, const size_t offset, const uint32_t value) noexcept
    {
        if constexpr (std::endian::native == std::endian::little)
        {
            for (size_t i = 0; i < 4; ++i)
            {
                out[offset + i] = static_cast<uint8_t>(value >> (8 * i));
            }
        }
        else
        {
            for (size_t i = 0; i < 4; ++i)
            {
                out[offset + i] = static_cast<uint8_t>(value >> (8 * (3 - i)));
            }
        }
    }

    inline uint16_t load_u16(const std::span<const uint8_t> in, const size_t offset) noexcept
    {
        if constexpr (std::endian::native == std::endian::little)
        {
            return static_cast<uint16_t>(in[offset] | (in[offset + 1] << 8));
        }
        else
        {
            return static_cast<uint16_t>((in[offset] << 8) | in[offset + 1]);
        }
    }

    inline uint32_t load_u32(const std::span<const uint8_t> in, const size_t offset) noexcept
    {
        uint32_t value = 0;
        for (size_t i = 0; i < 4; ++i)
        {
            const uint32_t byte = in[offset + i];
            if constexpr (std::endian::native == std::endian::little)
            {
                value |= byte << (8 * i);
            }
            else
            {
                value |= byte << (8 * (3 - i));
            }
        }
        return value;
    }
}

#endif //SOCKCAN_BYTE_ORDER_HPP
