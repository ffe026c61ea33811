#include "SockCAN/Netlink/RouteSocket.hpp"

#include <cstdlib>
#include <format>
#include <sys/socket.h>
#include <sys/time.h>

#include <netlink/errno.h>
#include <netlink/netlink.h>
#include <netlink/socket.h>

using tl::unexpected, std::format;

namespace SockCAN::Netlink
{
    tl::expected<std::unique_ptr<RouteSocket>, Error> RouteSocket::connect(const std::chrono::milliseconds timeout)
    {
        nl_sock* sock = nl_socket_alloc();
        if (!sock)
        {
            return unexpected(Error{ErrorCode::NlSocketAllocError, "Cannot alloc nl_socket"});
        }

        if (const int result = nl_connect(sock, NETLINK_ROUTE); result < 0)
        {
            nl_socket_free(sock);
            return unexpected(Error{
                ErrorCode::NlConnectError, format("Cannot connect nl_socket: {}", nl_geterror(result))
            });
        }

        const auto count = timeout.count();
        const timeval tv{
            .tv_sec = static_cast<time_t>(count / 1000),
            .tv_usec = static_cast<suseconds_t>((count % 1000) * 1000),
        };
        if (setsockopt(nl_socket_get_fd(sock), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == -1)
        {
            auto err = os_error(ErrorCode::IoFailure, "Cannot set netlink receive timeout");
            nl_close(sock);
            nl_socket_free(sock);
            return unexpected(err);
        }

        return std::unique_ptr<RouteSocket>(new RouteSocket(sock));
    }

    RouteSocket::~RouteSocket()
    {
        nl_close(sock);
        nl_socket_free(sock);
    }

    tl::expected<void, Error> RouteSocket::send(const std::span<const uint8_t> message)
    {
        // nl_sendto does not modify the buffer
        const int result = nl_sendto(sock, const_cast<uint8_t*>(message.data()), message.size());
        if (result < 0)
        {
            return unexpected(Error{
                ErrorCode::IoFailure, format("Failed to send netlink request: {}", nl_geterror(result))
            });
        }
        return {};
    }

    tl::expected<std::vector<uint8_t>, Error> RouteSocket::receive()
    {
        sockaddr_nl peer{};
        unsigned char* buffer = nullptr;
        const int result = nl_recv(sock, &peer, &buffer, nullptr);
        if (result < 0)
        {
            free(buffer);
            if (result == -NLE_AGAIN)
            {
                return unexpected(Error{ErrorCode::WouldBlock, "No netlink reply within timeout"});
            }
            return unexpected(Error{
                ErrorCode::IoFailure, format("Failed to receive netlink reply: {}", nl_geterror(result))
            });
        }
        std::vector<uint8_t> datagram(buffer, buffer + result);
        free(buffer);
        return datagram;
    }

    uint32_t RouteSocket::local_port() const noexcept
    {
        return nl_socket_get_local_port(sock);
    }
}
