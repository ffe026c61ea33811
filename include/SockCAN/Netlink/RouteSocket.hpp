#ifndef SOCKCAN_ROUTE_SOCKET_HPP
#define SOCKCAN_ROUTE_SOCKET_HPP

#include <chrono>
#include <memory>

#include <tl/expected.hpp>
#include "SockCAN/Netlink/ControlChannel.hpp"

struct nl_sock;

namespace SockCAN::Netlink
{
    /**
     * @brief NETLINK_ROUTE socket managed by libnl
     */
    class RouteSocket final : public ControlChannel
    {
    public:
        static tl::expected<std::unique_ptr<RouteSocket>, Error> connect(std::chrono::milliseconds timeout);

        RouteSocket(const RouteSocket&) = delete;
        RouteSocket& operator=(const RouteSocket&) = delete;
        ~RouteSocket() override;

        tl::expected<void, Error> send(std::span<const uint8_t> message) override;
        tl::expected<std::vector<uint8_t>, Error> receive() override;

        [[nodiscard]] uint32_t local_port() const noexcept;

    private:
        explicit RouteSocket(nl_sock* sock) : sock(sock)
        {
        }

        nl_sock* sock;
    };
}

#endif //SOCKCAN_ROUTE_SOCKET_HPP
