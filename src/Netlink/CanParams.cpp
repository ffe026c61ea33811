#include "SockCAN/Netlink/CanParams.hpp"
#include "SockCAN/Util/ByteOrder.hpp"

#include <array>
#include <format>
#include <utility>

using tl::unexpected, std::format, std::span;

namespace SockCAN::Netlink
{
    namespace
    {
        constexpr size_t BITTIMING_FIELDS = 8;
        constexpr size_t BITTIMING_CONST_NAME_LEN = 16;
        constexpr uint32_t MAX_NOMINAL_BITRATE = 1000000;
        constexpr uint32_t MAX_SAMPLE_POINT = 999;

        tl::expected<BitTiming, Error> read_bit_timing(const Attribute& attr)
        {
            return attr.as_u32s(0, BITTIMING_FIELDS).map([](const std::vector<uint32_t>& v)
            {
                return BitTiming{v[0], v[1], v[2], v[3], v[4], v[5], v[6], v[7]};
            });
        }

        tl::expected<BitTimingConst, Error> read_bit_timing_const(const Attribute& attr)
        {
            return attr.as_u32s(BITTIMING_CONST_NAME_LEN, BITTIMING_FIELDS).map([&](const std::vector<uint32_t>& v)
            {
                const auto name_bytes = attr.payload.first(BITTIMING_CONST_NAME_LEN);
                std::string name(name_bytes.begin(), name_bytes.end());
                name.resize(name.find('\0') == std::string::npos ? name.size() : name.find('\0'));
                return BitTimingConst{std::move(name), v[0], v[1], v[2], v[3], v[4], v[5], v[6], v[7]};
            });
        }

        tl::expected<BerrCounter, Error> read_berr_counter(const Attribute& attr)
        {
            if (attr.payload.size() < 4)
            {
                return unexpected(Error{
                    ErrorCode::MalformedResponse, format("Bus error counter of {} bytes", attr.payload.size())
                });
            }
            return BerrCounter{Util::load_u16(attr.payload, 0), Util::load_u16(attr.payload, 2)};
        }

        void write_bit_timing(AttributeWriter& writer, const CanAttr type, const BitTiming& timing)
        {
            const std::array<uint32_t, BITTIMING_FIELDS> fields = {
                timing.bitrate, timing.sample_point, timing.tq, timing.prop_seg,
                timing.phase_seg1, timing.phase_seg2, timing.sjw, timing.brp
            };
            writer.put_u32s(static_cast<uint16_t>(type), fields);
        }

        tl::expected<void, Error> check_timing(const std::optional<uint32_t>& bitrate,
                                               const std::optional<uint32_t>& sample_point,
                                               const uint32_t max_bitrate, const std::string_view phase)
        {
            if (sample_point && !bitrate)
            {
                return unexpected(Error{
                    ErrorCode::InvalidParameter, format("{} sample point requires a bitrate", phase)
                });
            }
            if (bitrate && (*bitrate == 0 || (max_bitrate != 0 && *bitrate > max_bitrate)))
            {
                return unexpected(Error{
                    ErrorCode::InvalidParameter, format("{} bitrate {} out of range", phase, *bitrate)
                });
            }
            if (sample_point && *sample_point > MAX_SAMPLE_POINT)
            {
                return unexpected(Error{
                    ErrorCode::InvalidParameter,
                    format("{} sample point {} exceeds 999 tenths of a percent", phase, *sample_point)
                });
            }
            return {};
        }
    }

    tl::expected<CanParams, Error> parse_can_info(const span<const uint8_t> info_data)
    {
        auto attributes = parse_attributes(info_data);
        if (!attributes)
        {
            return unexpected(attributes.error());
        }

        CanParams params;
        for (const Attribute& attr : *attributes)
        {
            tl::expected<void, Error> parsed{};
            switch (static_cast<CanAttr>(attr.type))
            {
            case CanAttr::BitTiming:
                parsed = read_bit_timing(attr).map([&](const BitTiming& timing)
                {
                    params.bit_timing = timing;
                    params.bitrate = timing.bitrate;
                    params.sample_point = timing.sample_point;
                });
                break;
            case CanAttr::BitTimingConst:
                parsed = read_bit_timing_const(attr).map([&](BitTimingConst limits)
                {
                    params.bit_timing_const = std::move(limits);
                });
                break;
            case CanAttr::Clock:
                parsed = attr.as_u32().map([&](const uint32_t freq) { params.clock_freq = freq; });
                break;
            case CanAttr::State:
                parsed = attr.as_u32().map([&](const uint32_t state)
                {
                    // states added by newer kernels stay absent
                    if (state <= static_cast<uint32_t>(CanState::Sleeping))
                    {
                        params.state = static_cast<CanState>(state);
                    }
                });
                break;
            case CanAttr::CtrlMode:
                parsed = attr.as_u32s(0, 2).map([&](const std::vector<uint32_t>& v)
                {
                    params.ctrl_mode = CtrlModes{v[0], v[1]};
                });
                break;
            case CanAttr::RestartMs:
                parsed = attr.as_u32().map([&](const uint32_t ms) { params.restart_ms = ms; });
                break;
            case CanAttr::BerrCounter:
                parsed = read_berr_counter(attr).map([&](const BerrCounter counter)
                {
                    params.berr_counter = counter;
                });
                break;
            case CanAttr::DataBitTiming:
                parsed = read_bit_timing(attr).map([&](const BitTiming& timing)
                {
                    params.data_bit_timing = timing;
                    params.data_bitrate = timing.bitrate;
                    params.data_sample_point = timing.sample_point;
                });
                break;
            case CanAttr::DataBitTimingConst:
                parsed = read_bit_timing_const(attr).map([&](BitTimingConst limits)
                {
                    params.data_bit_timing_const = std::move(limits);
                });
                break;
            case CanAttr::Termination:
                parsed = attr.as_u16().map([&](const uint16_t ohms) { params.termination = ohms; });
                break;
            default:
                break;
            }
            if (!parsed)
            {
                return unexpected(parsed.error());
            }
        }
        return params;
    }

    tl::expected<size_t, Error> encode_can_info(const CanParams& params, AttributeWriter& writer)
    {
        if (params.state || params.clock_freq || params.berr_counter || params.bit_timing_const ||
            params.data_bit_timing_const)
        {
            return unexpected(Error{
                ErrorCode::InvalidParameter, "State, clock, error counters and timing constants are read-only"
            });
        }
        if (!params.bit_timing)
        {
            if (auto valid = check_timing(params.bitrate, params.sample_point, MAX_NOMINAL_BITRATE, "Nominal");
                !valid)
            {
                return unexpected(valid.error());
            }
        }
        if (!params.data_bit_timing)
        {
            if (auto valid = check_timing(params.data_bitrate, params.data_sample_point, 0, "Data"); !valid)
            {
                return unexpected(valid.error());
            }
        }

        size_t written = 0;
        if (params.bit_timing)
        {
            write_bit_timing(writer, CanAttr::BitTiming, *params.bit_timing);
            ++written;
        }
        else if (params.bitrate)
        {
            write_bit_timing(writer, CanAttr::BitTiming, BitTiming{
                                 .bitrate = *params.bitrate, .sample_point = params.sample_point.value_or(0)
                             });
            ++written;
        }
        if (params.data_bit_timing)
        {
            write_bit_timing(writer, CanAttr::DataBitTiming, *params.data_bit_timing);
            ++written;
        }
        else if (params.data_bitrate)
        {
            write_bit_timing(writer, CanAttr::DataBitTiming, BitTiming{
                                 .bitrate = *params.data_bitrate,
                                 .sample_point = params.data_sample_point.value_or(0)
                             });
            ++written;
        }
        if (params.ctrl_mode)
        {
            const std::array<uint32_t, 2> fields = {params.ctrl_mode->mask, params.ctrl_mode->flags};
            writer.put_u32s(static_cast<uint16_t>(CanAttr::CtrlMode), fields);
            ++written;
        }
        if (params.restart_ms)
        {
            writer.put_u32(static_cast<uint16_t>(CanAttr::RestartMs), *params.restart_ms);
            ++written;
        }
        if (params.termination)
        {
            writer.put_u16(static_cast<uint16_t>(CanAttr::Termination), *params.termination);
            ++written;
        }
        return written;
    }

    std::string_view to_string(const CanState state) noexcept
    {
        switch (state)
        {
        case CanState::ErrorActive: return "ERROR-ACTIVE";
        case CanState::ErrorWarning: return "ERROR-WARNING";
        case CanState::ErrorPassive: return "ERROR-PASSIVE";
        case CanState::BusOff: return "BUS-OFF";
        case CanState::Stopped: return "STOPPED";
        case CanState::Sleeping: return "SLEEPING";
        }
        return "UNKNOWN";
    }
}
