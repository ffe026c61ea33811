#include <algorithm>
#include <array>
#include <chrono>
#include <iostream>
#include <vector>
#include <unistd.h>

#include "SockCAN/SockCAN.hpp"
#include "TestUtil.hpp"

using namespace SockCAN;
using namespace std::chrono_literals;
using Test::check, Test::fails_with;

int main()
{
    constexpr std::string_view test_interface_name = "sockcan_test0";

    std::cout << "--- SockCAN VCAN End-to-End Test ---" << std::endl;
    std::cout << "INFO: This test requires CAP_NET_ADMIN or root privileges and the vcan module." << std::endl;
    if (geteuid() != 0)
    {
        std::cout << "SKIP: not running as root" << std::endl;
        return Test::SKIPPED;
    }

    auto opened = Interface::open_vcan(test_interface_name);
    if (!opened)
    {
        std::cout << "SKIP: " << opened.error().message << std::endl;
        return Test::SKIPPED;
    }
    Interface& vcan = *opened;

    std::cout << "\nTEST 1: Link management" << std::endl;
    check(vcan.name() == test_interface_name && vcan.index() > 0, "interface resolved to an index");
    const auto links = Interface::list();
    check(links && std::ranges::any_of(*links, [&](const Netlink::LinkEntry& e) { return e.index == vcan.index(); }),
          "vcan listed among CAN interfaces");
    check(interface_name(vcan.index()).value_or("") == test_interface_name, "index maps back to the name");

    std::cout << "\nTEST 2: Netlink state changes" << std::endl;
    check(vcan.up().has_value(), "link brought up");
    check(vcan.is_up().value_or(false), "link reports IFF_UP");
    const auto details = vcan.details();
    check(details && details->name == test_interface_name && details->mtu == 16u, "classic MTU read back");
    check(details && !details->can.bitrate, "virtual link carries no CAN bit timing");
    auto netlink = Netlink::NetlinkClient::open();
    if (netlink)
    {
        check((*netlink)->bring_down(vcan.index()).has_value(), "link brought down");
        check((*netlink)->set_mtu(vcan.index(), 72).has_value(), "MTU switched to CAN FD");
        check((*netlink)->bring_up(vcan.index()).has_value(), "link up again");
        check(fails_with((*netlink)->set_bitrate(vcan.index(), 500000), ErrorCode::NetlinkError),
              "kernel refuses CAN bit timing on a vcan link");
    }
    else
    {
        check(false, netlink.error().message);
    }

    std::cout << "\nTEST 3: Frames travel between sockets" << std::endl;
    auto sender = vcan.open_socket(FrameMode::Fd);
    auto receiver = vcan.open_socket(FrameMode::Fd);
    if (sender && receiver)
    {
        check(receiver->set_nonblocking(true).has_value(), "receiver non-blocking");
        check(fails_with(receiver->read_frame(), ErrorCode::WouldBlock), "no traffic yet");

        const std::array<uint8_t, 3> payload{1, 2, 3};
        const Frame classic = *DataFrame::create(*CanId::standard(0x123), payload);
        check(sender->write_frame(classic).has_value(), "classic frame sent");
        check(receiver->set_nonblocking(false).and_then([&] { return receiver->set_read_timeout(500ms); })
                      .has_value(), "receiver blocking with timeout");
        const auto got = receiver->read_frame_with_timestamp();
        check(got && got->frame == classic, "classic frame received unchanged");
        check(got && got->timestamp.time_since_epoch().count() > 0, "kernel timestamp attached");

        std::vector<uint8_t> twenty(20, 0xA5);
        const Frame fd = *FdFrame::create(*CanId::extended(0x1ABCDEF), twenty, FD_BRS);
        check(sender->write_frame(fd).has_value(), "FD frame sent");
        const auto got_fd = receiver->read_frame();
        check(got_fd && *got_fd == fd, "FD frame received with flags");

        const std::array<Filter, 1> only_0x200{Filter{0x200, SFF_MASK}};
        check(receiver->set_filters(only_0x200).has_value(), "filter installed");
        check(sender->write_frame(classic).has_value(), "filtered frame sent");
        check(fails_with(receiver->read_frame(), ErrorCode::WouldBlock), "filtered frame not delivered");
        check(receiver->set_error_mask(ERR_MASK_ALL).has_value(), "error mask accepted");
        check(receiver->close().has_value(), "receiver closed");
    }
    else
    {
        check(false, "sockets opened on the vcan interface");
    }

    std::cout << "\nTEST 4: Cleanup" << std::endl;
    check(vcan.down().has_value(), "link brought down");
    check(Netlink::delete_interface(test_interface_name).has_value(), "vcan deleted");
    check(fails_with(Interface::open(test_interface_name), ErrorCode::NoSuchInterface), "name no longer resolves");

    return Test::finish("VCAN End-to-End");
}
