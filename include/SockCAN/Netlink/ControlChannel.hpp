#ifndef SOCKCAN_CONTROL_CHANNEL_HPP
#define SOCKCAN_CONTROL_CHANNEL_HPP

#include <cstdint>
#include <span>
#include <vector>

#include <tl/expected.hpp>
#include "SockCAN/Util/Error.hpp"

namespace SockCAN::Netlink
{
    /**
     * @brief Datagram transport carrying rtnetlink requests and replies
     */
    class ControlChannel
    {
    public:
        virtual ~ControlChannel() = default;

        virtual tl::expected<void, Error> send(std::span<const uint8_t> message) = 0;

        /**
         * @brief Receives one datagram, WouldBlock when nothing arrived within the channel timeout
         */
        virtual tl::expected<std::vector<uint8_t>, Error> receive() = 0;
    };
}

#endif //SOCKCAN_CONTROL_CHANNEL_HPP
