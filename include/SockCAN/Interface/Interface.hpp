#ifndef SOCKCAN_INTERFACE_HPP
#define SOCKCAN_INTERFACE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>
#include "SockCAN/Interface/Socket.hpp"
#include "SockCAN/Netlink/NetlinkClient.hpp"
#include "SockCAN/Netlink/Link.hpp"
#include "SockCAN/Util/Error.hpp"

namespace SockCAN
{
    /**
     * @brief A CAN network interface resolved by name
     * Opens raw sockets on it and runs its netlink operations. The netlink
     * client is connected on first use.
     */
    class Interface
    {
    public:
        static tl::expected<Interface, Error> open(std::string_view interface_name);

        /**
         * @brief Creates the vcan interface when missing, then opens it
         */
        static tl::expected<Interface, Error> open_vcan(std::string_view interface_name);

        static tl::expected<std::vector<Netlink::LinkEntry>, Error> list();

        [[nodiscard]] unsigned index() const noexcept { return if_index; }
        [[nodiscard]] const std::string& name() const noexcept { return if_name; }

        tl::expected<Socket, Error> open_socket(FrameMode mode = FrameMode::Classic) const;

        /**
         * @brief Sets the bitrate when one is given, then brings the link up
         * Virtual interfaces have no bitrate, pass nullopt for them.
         */
        tl::expected<void, Error> up(std::optional<uint32_t> bitrate = std::nullopt);
        tl::expected<void, Error> down();
        tl::expected<bool, Error> is_up();

        tl::expected<Netlink::InterfaceDetails, Error> details();
        tl::expected<Netlink::CanParams, Error> params();
        tl::expected<void, Error> set_params(const Netlink::CanParams& params);
        tl::expected<void, Error> restart();

    private:
        Interface(unsigned index, std::string name) : if_index(index), if_name(std::move(name))
        {
        }

        tl::expected<Netlink::NetlinkClient*, Error> netlink();

        unsigned if_index;
        std::string if_name;
        std::unique_ptr<Netlink::NetlinkClient> client;
    };
}

#endif //SOCKCAN_INTERFACE_HPP
