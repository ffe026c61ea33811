#include "SockCAN/Interface/Interface.hpp"
#include "SockCAN/Interface/Names.hpp"

#include <utility>

using tl::unexpected, std::string_view;

namespace SockCAN
{
    tl::expected<Interface, Error> Interface::open(const string_view interface_name)
    {
        return interface_index(interface_name).map([&](const unsigned index)
        {
            return Interface{index, std::string(interface_name)};
        });
    }

    tl::expected<Interface, Error> Interface::open_vcan(const string_view interface_name)
    {
        return Netlink::create_vcan_interface_if_not_exists(interface_name).and_then([&]
        {
            return open(interface_name);
        });
    }

    tl::expected<std::vector<Netlink::LinkEntry>, Error> Interface::list()
    {
        return Netlink::enumerate_can_interfaces();
    }

    tl::expected<Socket, Error> Interface::open_socket(const FrameMode mode) const
    {
        return Socket::open(if_index, mode);
    }

    tl::expected<Netlink::NetlinkClient*, Error> Interface::netlink()
    {
        if (!client)
        {
            auto opened = Netlink::NetlinkClient::open();
            if (!opened)
            {
                return unexpected(opened.error());
            }
            client = std::move(*opened);
        }
        return client.get();
    }

    tl::expected<void, Error> Interface::up(const std::optional<uint32_t> bitrate)
    {
        return netlink().and_then([&](Netlink::NetlinkClient* nl) -> tl::expected<void, Error>
        {
            if (bitrate)
            {
                if (auto set = nl->set_bitrate(if_index, *bitrate); !set)
                {
                    return set;
                }
            }
            return nl->bring_up(if_index);
        });
    }

    tl::expected<void, Error> Interface::down()
    {
        return netlink().and_then([&](Netlink::NetlinkClient* nl) { return nl->bring_down(if_index); });
    }

    tl::expected<bool, Error> Interface::is_up()
    {
        return details().map([](const Netlink::InterfaceDetails& d) { return d.is_up; });
    }

    tl::expected<Netlink::InterfaceDetails, Error> Interface::details()
    {
        return netlink().and_then([&](Netlink::NetlinkClient* nl) { return nl->get_interface_details(if_index); });
    }

    tl::expected<Netlink::CanParams, Error> Interface::params()
    {
        return netlink().and_then([&](Netlink::NetlinkClient* nl) { return nl->get_interface_params(if_index); });
    }

    tl::expected<void, Error> Interface::set_params(const Netlink::CanParams& params)
    {
        return netlink().and_then([&](Netlink::NetlinkClient* nl)
        {
            return nl->set_interface_params(if_index, params);
        });
    }

    tl::expected<void, Error> Interface::restart()
    {
        return netlink().and_then([&](Netlink::NetlinkClient* nl) { return nl->restart_interface(if_index); });
    }
}
