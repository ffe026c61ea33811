#include "SockCAN/Netlink/NetlinkClient.hpp"
#include "SockCAN/Netlink/RouteSocket.hpp"
#include "SockCAN/Config.hpp"
#include "SockCAN/Frame/Codec.hpp"
#include "SockCAN/Util/Logger.hpp"

#include <format>
#include <system_error>
#include <utility>
#include <net/if.h>
#include <sys/socket.h>
#include <linux/netlink.h>
#include <linux/rtnetlink.h>

using tl::unexpected, std::format, std::span;

namespace SockCAN::Netlink
{
    namespace
    {
        IfInfo link_info(const unsigned index, const uint32_t flags = 0, const uint32_t change = 0)
        {
            return IfInfo{
                .family = AF_UNSPEC,
                .type = 0,
                .index = static_cast<int32_t>(index),
                .flags = flags,
                .change = change,
            };
        }

        tl::expected<void, Error> parse_link_info(const span<const uint8_t> payload, InterfaceDetails& details)
        {
            auto nested = parse_attributes(payload);
            if (!nested)
            {
                return unexpected(nested.error());
            }
            const Attribute* kind = find_attribute(*nested, IFLA_INFO_KIND);
            const Attribute* data = find_attribute(*nested, IFLA_INFO_DATA);
            if (!kind || kind->as_string() != "can" || !data)
            {
                return {};
            }
            return parse_can_info(data->payload).map([&](CanParams params) { details.can = std::move(params); });
        }
    }

    NetlinkClient::NetlinkClient(std::unique_ptr<ControlChannel> channel, const unsigned max_attempts) :
        channel(std::move(channel)), max_attempts(max_attempts), s(make_sink("SockCAN Netlink"))
    {
    }

    tl::expected<std::unique_ptr<NetlinkClient>, Error> NetlinkClient::open()
    {
        return RouteSocket::connect(Config::get_netlink_timeout())
            .map([](std::unique_ptr<RouteSocket> sock)
            {
                return std::make_unique<NetlinkClient>(std::move(sock), Config::get_netlink_max_attempts());
            });
    }

    tl::expected<std::vector<NetlinkClient::Reply>, Error> NetlinkClient::transact(
        Request& request, const std::string& done)
    {
        std::lock_guard lock(session_mutex);
        auto replies = exchange(request, ++sequence);
        if (replies && !done.empty())
        {
            XTR_LOGL(info, s, "{}", done);
        }
        return replies;
    }

    tl::expected<std::vector<NetlinkClient::Reply>, Error> NetlinkClient::exchange(Request& request,
                                                                                    const uint32_t seq)
    {
        const bool wants_ack = request.flags() & NLM_F_ACK;

        if (auto sent = channel->send(request.finish(seq)); !sent)
        {
            XTR_LOGL(error, s, "Netlink request {} not sent: {}", seq, sent.error().message);
            return unexpected(sent.error());
        }

        std::vector<Reply> replies;
        for (unsigned attempt = 0; attempt < max_attempts; ++attempt)
        {
            auto datagram = channel->receive();
            if (!datagram)
            {
                if (datagram.error().code == ErrorCode::WouldBlock)
                {
                    continue;
                }
                XTR_LOGL(error, s, "Netlink receive failed: {}", datagram.error().message);
                return unexpected(datagram.error());
            }

            auto messages = split_messages(*datagram);
            if (!messages)
            {
                XTR_LOGL(error, s, "Malformed netlink datagram: {}", messages.error().message);
                return unexpected(messages.error());
            }

            for (const Message& message : *messages)
            {
                if (message.header.seq != seq)
                {
                    XTR_LOGL(debug, s, "Discarding netlink message with sequence {} while waiting for {}",
                             message.header.seq, seq);
                    continue;
                }
                if (message.header.type == NLMSG_NOOP)
                {
                    continue;
                }
                if (message.header.type == NLMSG_ERROR)
                {
                    auto code = parse_error_code(message.payload);
                    if (!code)
                    {
                        return unexpected(code.error());
                    }
                    if (*code == 0)
                    {
                        return replies;
                    }
                    const int errnum = -*code;
                    Error err{
                        ErrorCode::NetlinkError,
                        format("Kernel rejected netlink request: {}", std::generic_category().message(errnum)), errnum
                    };
                    XTR_LOGL(error, s, "{}", err.message);
                    return unexpected(err);
                }
                if (message.header.type == NLMSG_DONE)
                {
                    return replies;
                }

                replies.push_back(Reply{
                    message.header, std::vector<uint8_t>(message.payload.begin(), message.payload.end())
                });
                if (!(message.header.flags & NLM_F_MULTI) && !wants_ack)
                {
                    return replies;
                }
            }
        }

        XTR_LOGL(error, s, "Netlink request {} unanswered after {} reads", seq, max_attempts);
        return unexpected(Error{
            ErrorCode::NetlinkTimeout, format("No reply to netlink request {} after {} reads", seq, max_attempts)
        });
    }

    tl::expected<void, Error> NetlinkClient::acknowledged(Request& request, const std::string& done)
    {
        return transact(request, done).map([](const std::vector<Reply>&)
        {
        });
    }

    tl::expected<InterfaceDetails, Error> NetlinkClient::get_interface_details(const unsigned index)
    {
        Request request{RTM_GETLINK, NLM_F_REQUEST, link_info(index)};
        request.attributes().put_u32(IFLA_EXT_MASK, RTEXT_FILTER_VF);

        return transact(request).and_then([&](const std::vector<Reply>& replies)
            -> tl::expected<InterfaceDetails, Error>
            {
                for (const Reply& reply : replies)
                {
                    if (reply.header.type != RTM_NEWLINK)
                    {
                        continue;
                    }
                    const span<const uint8_t> payload{reply.payload};
                    auto info = parse_ifinfo(payload);
                    if (!info)
                    {
                        return unexpected(info.error());
                    }
                    if (info->index != static_cast<int32_t>(index))
                    {
                        continue;
                    }

                    auto attributes = parse_attributes(payload.subspan(IFINFO_LEN));
                    if (!attributes)
                    {
                        return unexpected(attributes.error());
                    }

                    InterfaceDetails details{.index = index, .is_up = (info->flags & IFF_UP) != 0};
                    for (const Attribute& attr : *attributes)
                    {
                        tl::expected<void, Error> parsed{};
                        switch (attr.type)
                        {
                        case IFLA_IFNAME:
                            details.name = attr.as_string();
                            break;
                        case IFLA_MTU:
                            parsed = attr.as_u32().map([&](const uint32_t mtu) { details.mtu = mtu; });
                            break;
                        case IFLA_LINKINFO:
                            parsed = parse_link_info(attr.payload, details);
                            break;
                        default:
                            break;
                        }
                        if (!parsed)
                        {
                            return unexpected(parsed.error());
                        }
                    }
                    return details;
                }
                return unexpected(Error{
                    ErrorCode::MalformedResponse, format("No link message for interface {} in reply", index)
                });
            });
    }

    tl::expected<CanParams, Error> NetlinkClient::get_interface_params(const unsigned index)
    {
        return get_interface_details(index).map([](InterfaceDetails details) { return std::move(details.can); });
    }

    tl::expected<void, Error> NetlinkClient::change_can_info(
        const unsigned index, const std::function<tl::expected<size_t, Error>(AttributeWriter&)>& fill)
    {
        Request request{RTM_NEWLINK, NLM_F_REQUEST | NLM_F_ACK, link_info(index)};
        auto writer = request.attributes();
        const size_t linkinfo = writer.begin_nested(IFLA_LINKINFO);
        writer.put_string(IFLA_INFO_KIND, "can");
        const size_t data = writer.begin_nested(IFLA_INFO_DATA);

        auto written = fill(writer);
        if (!written)
        {
            return unexpected(written.error());
        }
        if (*written == 0)
        {
            return unexpected(Error{ErrorCode::InvalidParameter, "No CAN parameter to change"});
        }
        writer.end_nested(data);
        writer.end_nested(linkinfo);

        return acknowledged(request, format("Changed {} CAN parameters of interface {}", *written, index));
    }

    tl::expected<void, Error> NetlinkClient::set_interface_params(const unsigned index, const CanParams& params)
    {
        return change_can_info(index, [&](AttributeWriter& writer) { return encode_can_info(params, writer); });
    }

    tl::expected<void, Error> NetlinkClient::restart_interface(const unsigned index)
    {
        return change_can_info(index, [](AttributeWriter& writer) -> tl::expected<size_t, Error>
        {
            writer.put_u32(static_cast<uint16_t>(CanAttr::Restart), 1);
            return 1;
        });
    }

    tl::expected<void, Error> NetlinkClient::set_bitrate(const unsigned index, const uint32_t bitrate,
                                                         const std::optional<uint32_t> sample_point)
    {
        CanParams params;
        params.bitrate = bitrate;
        params.sample_point = sample_point;
        return set_interface_params(index, params);
    }

    tl::expected<void, Error> NetlinkClient::set_data_bitrate(const unsigned index, const uint32_t bitrate,
                                                              const std::optional<uint32_t> sample_point)
    {
        CanParams params;
        params.data_bitrate = bitrate;
        params.data_sample_point = sample_point;
        return set_interface_params(index, params);
    }

    tl::expected<void, Error> NetlinkClient::set_ctrlmode(const unsigned index, const uint32_t mode, const bool on)
    {
        return set_ctrlmodes(index, CtrlModes{.mask = mode, .flags = on ? mode : 0});
    }

    tl::expected<void, Error> NetlinkClient::set_ctrlmodes(const unsigned index, const CtrlModes modes)
    {
        CanParams params;
        params.ctrl_mode = modes;
        return set_interface_params(index, params);
    }

    tl::expected<void, Error> NetlinkClient::set_restart_ms(const unsigned index, const uint32_t restart_ms)
    {
        CanParams params;
        params.restart_ms = restart_ms;
        return set_interface_params(index, params);
    }

    tl::expected<void, Error> NetlinkClient::set_mtu(const unsigned index, const uint32_t mtu)
    {
        if (mtu != CAN_MTU && mtu != CANFD_MTU)
        {
            return unexpected(Error{ErrorCode::InvalidParameter, format("CAN MTU must be 16 or 72, not {}", mtu)});
        }
        Request request{RTM_NEWLINK, NLM_F_REQUEST | NLM_F_ACK, link_info(index)};
        request.attributes().put_u32(IFLA_MTU, mtu);
        return acknowledged(request);
    }

    tl::expected<void, Error> NetlinkClient::bring_up(const unsigned index)
    {
        Request request{RTM_NEWLINK, NLM_F_REQUEST | NLM_F_ACK, link_info(index, IFF_UP, IFF_UP)};
        return acknowledged(request, format("Interface {} is up", index));
    }

    tl::expected<void, Error> NetlinkClient::bring_down(const unsigned index)
    {
        Request request{RTM_NEWLINK, NLM_F_REQUEST | NLM_F_ACK, link_info(index, 0, IFF_UP)};
        return acknowledged(request, format("Interface {} is down", index));
    }
}
