#ifndef SOCKCAN_CODEC_HPP
#define SOCKCAN_CODEC_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include <tl/expected.hpp>
#include "SockCAN/Frame/Frame.hpp"
#include "SockCAN/Util/Error.hpp"

namespace SockCAN
{
    enum class FrameMode : uint8_t
    {
        Classic,
        Fd,
    };

    // sizeof(struct can_frame) and sizeof(struct canfd_frame)
    constexpr size_t CAN_MTU = 16;
    constexpr size_t CANFD_MTU = 72;

    /*
     * Kernel frame buffer layout, ID word in host byte order:
     *
     *   offset  classic (can_frame)     FD (canfd_frame)
     *   0..3    can_id                  can_id
     *   4       len 0..8                len, FD step
     *   5       __pad, no FDF allowed   flags BRS|ESI|FDF
     *   6       __res0                  __res0
     *   7       len8_dlc                __res1
     *   8..     data[8]                 data[64]
     */
    namespace Wire
    {
        constexpr size_t ID_OFFSET = 0;
        constexpr size_t LEN_OFFSET = 4;
        constexpr size_t FLAGS_OFFSET = 5;
        constexpr size_t RES0_OFFSET = 6;
        constexpr size_t RES1_OFFSET = 7;
        constexpr size_t DATA_OFFSET = 8;
    }

    using WireBuffer = std::array<uint8_t, CANFD_MTU>;

    constexpr size_t mtu(const FrameMode mode) noexcept
    {
        return mode == FrameMode::Fd ? CANFD_MTU : CAN_MTU;
    }

    /**
     * @brief Serializes frame into out, returning the number of bytes to hand to the kernel
     * Classic frames always take 16 bytes, FD frames 72 and only in FD mode.
     */
    tl::expected<size_t, Error> encode(const Frame& frame, FrameMode mode, std::span<uint8_t, CANFD_MTU> out);

    /**
     * @brief Parses one kernel frame buffer, the size selects the layout
     * FD mode accepts both sizes, classic mode only 16 bytes.
     */
    tl::expected<Frame, Error> decode(std::span<const uint8_t> bytes, FrameMode mode);
}

#endif //SOCKCAN_CODEC_HPP
