#include <array>
#include <atomic>
#include <cerrno>
#include <iostream>
#include <limits>
#include <memory>
#include <thread>
#include <net/if.h>
#include <linux/netlink.h>
#include <linux/rtnetlink.h>

#include "SockCAN/Netlink/NetlinkClient.hpp"
#include "MockControlChannel.hpp"
#include "TestUtil.hpp"

using namespace SockCAN;
using namespace SockCAN::Netlink;
using Test::check, Test::fails_with, Test::MockControlChannel;

namespace
{
    constexpr unsigned MAX_ATTEMPTS = 4;
    constexpr int32_t CAN0 = 5;

    void can0_attributes(AttributeWriter& writer)
    {
        writer.put_string(IFLA_IFNAME, "can0");
        writer.put_u32(IFLA_MTU, 72);
        const size_t linkinfo = writer.begin_nested(IFLA_LINKINFO);
        writer.put_string(IFLA_INFO_KIND, "can");
        const size_t data = writer.begin_nested(IFLA_INFO_DATA);
        const std::array<uint32_t, 8> timing{500000, 875, 125, 6, 7, 2, 1, 10};
        writer.put_u32s(static_cast<uint16_t>(CanAttr::BitTiming), timing);
        const std::array<uint32_t, 2> ctrl{CtrlMode::FD | CtrlMode::BERR_REPORTING, CtrlMode::FD};
        writer.put_u32s(static_cast<uint16_t>(CanAttr::CtrlMode), ctrl);
        writer.put_u32(static_cast<uint16_t>(CanAttr::State), 1);
        writer.put_u32(static_cast<uint16_t>(CanAttr::Clock), 80000000);
        writer.put_u32(static_cast<uint16_t>(CanAttr::RestartMs), 100);
        // attribute type from a newer kernel
        writer.put_u32(250, 0xFFFFFFFF);
        writer.end_nested(data);
        writer.end_nested(linkinfo);
    }

    std::vector<uint8_t> can0_reply(const uint32_t seq, const uint16_t flags = 0)
    {
        return Test::netlink_message(RTM_NEWLINK, flags, seq, Test::link_payload(CAN0, IFF_UP, can0_attributes));
    }

    std::vector<uint8_t> ack(const uint32_t seq, const int32_t code = 0)
    {
        return Test::netlink_message(NLMSG_ERROR, 0, seq, Test::error_payload(code));
    }
}

int main()
{
    std::cout << "--- SockCAN Netlink Client Test ---" << std::endl;

    auto owned = std::make_unique<MockControlChannel>();
    MockControlChannel& channel = *owned;
    NetlinkClient client{std::move(owned), MAX_ATTEMPTS};

    std::cout << "\nTEST 1: get_interface_params parses nested CAN info" << std::endl;
    channel.script.push_back(can0_reply(1));
    const auto params = client.get_interface_params(CAN0);
    check(params.has_value(), "params read");
    if (params)
    {
        check(params->bitrate == 500000u && params->sample_point == 875u, "bitrate and sample point");
        check(params->ctrl_mode && params->ctrl_mode->flags == CtrlMode::FD, "control modes");
        check(params->state == CanState::ErrorWarning && params->clock_freq == 80000000u &&
              params->restart_ms == 100u, "state, clock and restart delay");
        check(!params->data_bitrate && !params->data_sample_point && !params->termination,
              "missing attributes stay absent");
    }
    const auto request = split_messages(channel.sent.back());
    check(request && (*request)[0].header.type == RTM_GETLINK && (*request)[0].header.seq == 1 &&
          parse_ifinfo((*request)[0].payload).map([](const IfInfo& i) { return i.index; }).value_or(0) == CAN0,
          "GETLINK request carries sequence 1 and the interface index");

    std::cout << "\nTEST 2: Replies with another sequence number are discarded" << std::endl;
    channel.receives = 0;
    channel.script.push_back(can0_reply(client.last_sequence() + 2));
    const auto stale = client.get_interface_params(CAN0);
    check(fails_with(stale, ErrorCode::NetlinkTimeout), "stale reply ends in NetlinkTimeout");
    check(channel.receives == MAX_ATTEMPTS, "read attempts are bounded");

    std::cout << "\nTEST 3: Kernel errors surface as NetlinkError" << std::endl;
    channel.script.push_back(ack(client.last_sequence() + 1, -EOPNOTSUPP));
    const auto rejected = client.set_bitrate(CAN0, 500000);
    check(fails_with(rejected, ErrorCode::NetlinkError) && rejected.error().os_error == EOPNOTSUPP,
          "error reply carries the positive errno");
    const auto set_request = split_messages(channel.sent.back());
    bool nested_ok = false;
    if (set_request)
    {
        const Message& message = (*set_request)[0];
        const auto top = parse_attributes(message.payload.subspan(IFINFO_LEN));
        const Attribute* linkinfo = top ? find_attribute(*top, IFLA_LINKINFO) : nullptr;
        const auto info = linkinfo ? parse_attributes(linkinfo->payload) : tl::expected<std::vector<Attribute>, Error>{};
        const Attribute* kind = info ? find_attribute(*info, IFLA_INFO_KIND) : nullptr;
        const Attribute* data = info ? find_attribute(*info, IFLA_INFO_DATA) : nullptr;
        const auto sent = data ? parse_can_info(data->payload) : tl::expected<CanParams, Error>{};
        nested_ok = message.header.type == RTM_NEWLINK && (message.header.flags & NLM_F_ACK) && kind &&
            kind->as_string() == "can" && sent && sent->bitrate == 500000u && !sent->restart_ms;
    }
    check(nested_ok, "NEWLINK request nests the bitrate under LINKINFO/INFO_DATA");

    std::cout << "\nTEST 4: Acknowledged changes" << std::endl;
    channel.script.push_back(ack(client.last_sequence() + 1));
    check(client.set_restart_ms(CAN0, 200).has_value(), "restart_ms acknowledged");
    channel.script.push_back(ack(client.last_sequence() + 1));
    check(client.restart_interface(CAN0).has_value(), "restart acknowledged");
    channel.script.push_back(ack(client.last_sequence() + 1));
    check(client.bring_up(CAN0).has_value(), "link up acknowledged");

    std::cout << "\nTEST 5: Multi-part replies complete on NLMSG_DONE" << std::endl;
    {
        const uint32_t seq = client.last_sequence() + 1;
        const auto other = Test::netlink_message(RTM_NEWLINK, NLM_F_MULTI, seq,
                                                 Test::link_payload(CAN0 + 1, 0, [](AttributeWriter& w)
                                                 {
                                                     w.put_string(IFLA_IFNAME, "can1");
                                                 }));
        channel.script.push_back(Test::concat({other, can0_reply(seq, NLM_F_MULTI)}));
        channel.script.push_back(Test::netlink_message(NLMSG_DONE, NLM_F_MULTI, seq, Test::error_payload(0)));
        channel.receives = 0;
        const auto details = client.get_interface_details(CAN0);
        check(details && details->name == "can0" && details->is_up && details->mtu == 72u &&
              details->can.bitrate == 500000u, "details of the requested interface picked from the dump");
        check(channel.receives == 2, "both datagrams read before completion");
    }
    {
        const uint32_t seq = client.last_sequence() + 1;
        channel.script.push_back(can0_reply(seq, NLM_F_MULTI));
        const auto unfinished = client.get_interface_details(CAN0);
        check(fails_with(unfinished, ErrorCode::NetlinkTimeout), "multi-part reply without DONE times out");
    }

    std::cout << "\nTEST 6: Malformed replies" << std::endl;
    {
        auto truncated = can0_reply(client.last_sequence() + 1);
        Util::store_u32(truncated, 0, static_cast<uint32_t>(truncated.size() + 16));
        channel.script.push_back(truncated);
        check(fails_with(client.get_interface_params(CAN0), ErrorCode::MalformedResponse),
              "message length past the datagram");
    }
    {
        auto bad_attribute = can0_reply(client.last_sequence() + 1);
        // first attribute (IFLA_IFNAME) claims more bytes than the message holds
        Util::store_u16(bad_attribute, HDRLEN + IFINFO_LEN, 0x0FFF);
        channel.script.push_back(bad_attribute);
        check(fails_with(client.get_interface_params(CAN0), ErrorCode::MalformedResponse),
              "attribute length past the buffer");
    }
    channel.script.push_back(ack(client.last_sequence() + 1, std::numeric_limits<int32_t>::min()));
    check(fails_with(client.set_restart_ms(CAN0, 100), ErrorCode::MalformedResponse),
          "error code that is not a negated errno");
    channel.script.push_back(ack(client.last_sequence() + 1, EINVAL));
    check(fails_with(client.set_restart_ms(CAN0, 100), ErrorCode::MalformedResponse),
          "positive error code");

    std::cout << "\nTEST 7: Local validation sends nothing" << std::endl;
    const size_t sent_before = channel.sent.size();
    check(fails_with(client.set_interface_params(CAN0, CanParams{}), ErrorCode::InvalidParameter),
          "empty parameter set rejected");
    check(fails_with(client.set_mtu(CAN0, 20), ErrorCode::InvalidParameter), "MTU other than 16 or 72 rejected");
    check(fails_with(client.set_bitrate(CAN0, 0), ErrorCode::InvalidParameter), "zero bitrate rejected");
    check(channel.sent.size() == sent_before, "no request reached the channel");

    std::cout << "\nTEST 8: Sequence numbers increase per request" << std::endl;
    const uint32_t before = client.last_sequence();
    channel.script.push_back(ack(before + 1));
    (void)client.set_ctrlmode(CAN0, CtrlMode::LOOPBACK, true);
    check(client.last_sequence() == before + 1, "one request consumes one sequence number");

    std::cout << "\nTEST 9: Sessions from several threads are serialized" << std::endl;
    {
        constexpr unsigned THREADS = 4;
        constexpr unsigned REQUESTS = 50;
        channel.responder = [](const uint32_t seq) { return ack(seq); };
        const uint32_t first = client.last_sequence();
        std::atomic<unsigned> acknowledged{0};
        std::vector<std::thread> workers;
        for (unsigned t = 0; t < THREADS; ++t)
        {
            workers.emplace_back([&, t]
            {
                for (unsigned i = 0; i < REQUESTS; ++i)
                {
                    const auto result = (i + t) % 2 == 0 ? client.bring_up(CAN0) : client.set_restart_ms(CAN0, i + 1);
                    if (result)
                    {
                        ++acknowledged;
                    }
                }
            });
        }
        for (auto& worker : workers)
        {
            worker.join();
        }
        channel.responder = nullptr;
        check(acknowledged == THREADS * REQUESTS, "every concurrent request acknowledged");
        check(client.last_sequence() == first + THREADS * REQUESTS, "each request got its own sequence number");
    }

    return Test::finish("Netlink Client");
}
