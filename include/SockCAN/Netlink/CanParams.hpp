#ifndef SOCKCAN_CAN_PARAMS_HPP
#define SOCKCAN_CAN_PARAMS_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <tl/expected.hpp>
#include "SockCAN/Netlink/Attribute.hpp"
#include "SockCAN/Util/Error.hpp"

namespace SockCAN::Netlink
{
    // IFLA_CAN_* (linux/can/netlink.h)
    enum class CanAttr : uint16_t
    {
        Unspec = 0,
        BitTiming = 1,
        BitTimingConst = 2,
        Clock = 3,
        State = 4,
        CtrlMode = 5,
        RestartMs = 6,
        Restart = 7,
        BerrCounter = 8,
        DataBitTiming = 9,
        DataBitTimingConst = 10,
        Termination = 11,
    };

    // CAN_CTRLMODE_* bits
    namespace CtrlMode
    {
        constexpr uint32_t LOOPBACK = 0x01;
        constexpr uint32_t LISTEN_ONLY = 0x02;
        constexpr uint32_t TRIPLE_SAMPLING = 0x04;
        constexpr uint32_t ONE_SHOT = 0x08;
        constexpr uint32_t BERR_REPORTING = 0x10;
        constexpr uint32_t FD = 0x20;
        constexpr uint32_t PRESUME_ACK = 0x40;
        constexpr uint32_t FD_NON_ISO = 0x80;
        constexpr uint32_t CC_LEN8_DLC = 0x100;
    }

    enum class CanState : uint32_t
    {
        ErrorActive = 0,
        ErrorWarning = 1,
        ErrorPassive = 2,
        BusOff = 3,
        Stopped = 4,
        Sleeping = 5,
    };

    // struct can_bittiming, sample points are in tenths of a percent
    struct BitTiming
    {
        uint32_t bitrate{};
        uint32_t sample_point{};
        uint32_t tq{};
        uint32_t prop_seg{};
        uint32_t phase_seg1{};
        uint32_t phase_seg2{};
        uint32_t sjw{};
        uint32_t brp{};

        bool operator==(const BitTiming&) const = default;
    };

    // struct can_bittiming_const
    struct BitTimingConst
    {
        std::string name;
        uint32_t tseg1_min{};
        uint32_t tseg1_max{};
        uint32_t tseg2_min{};
        uint32_t tseg2_max{};
        uint32_t sjw_max{};
        uint32_t brp_min{};
        uint32_t brp_max{};
        uint32_t brp_inc{};
    };

    // struct can_ctrlmode: bits in mask are changed to their value in flags
    struct CtrlModes
    {
        uint32_t mask{};
        uint32_t flags{};

        bool operator==(const CtrlModes&) const = default;
    };

    struct BerrCounter
    {
        uint16_t txerr{};
        uint16_t rxerr{};
    };

    /**
     * @brief CAN parameters of one interface
     * On read, absent attributes stay empty. On write, only engaged fields are
     * sent; state, clock_freq, berr_counter and the timing constants are read-only.
     */
    struct CanParams
    {
        std::optional<uint32_t> bitrate;
        std::optional<uint32_t> sample_point;
        std::optional<uint32_t> data_bitrate;
        std::optional<uint32_t> data_sample_point;
        std::optional<CtrlModes> ctrl_mode;
        std::optional<uint32_t> restart_ms;
        std::optional<CanState> state;
        std::optional<uint32_t> clock_freq;

        // full timing structures; when set for writing they take precedence over bitrate/sample_point
        std::optional<BitTiming> bit_timing;
        std::optional<BitTiming> data_bit_timing;
        std::optional<BitTimingConst> bit_timing_const;
        std::optional<BitTimingConst> data_bit_timing_const;
        std::optional<BerrCounter> berr_counter;
        std::optional<uint16_t> termination;
    };

    /**
     * @brief Parses the IFLA_INFO_DATA payload of a link whose kind is "can"
     */
    tl::expected<CanParams, Error> parse_can_info(std::span<const uint8_t> info_data);

    /**
     * @brief Writes the IFLA_CAN_* attributes for every writable engaged field
     * @return number of attributes written
     */
    tl::expected<size_t, Error> encode_can_info(const CanParams& params, AttributeWriter& writer);

    std::string_view to_string(CanState state) noexcept;
}

#endif //SOCKCAN_CAN_PARAMS_HPP
