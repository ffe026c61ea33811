#ifndef SOCKCAN_LINK_HPP
#define SOCKCAN_LINK_HPP

#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>
#include "SockCAN/Util/Error.hpp"

namespace SockCAN::Netlink
{
    struct LinkEntry
    {
        unsigned index;
        std::string name;
    };

    /**
     * @brief Lists every interface whose hardware type is ARPHRD_CAN, physical and virtual
     */
    tl::expected<std::vector<LinkEntry>, Error> enumerate_can_interfaces();

    /**
     * @brief Create VCAN interface if it doesn't exist
     * @param interface_name Name of the VCAN interface to create
     * @return Success or error information
     */
    tl::expected<void, Error> create_vcan_interface_if_not_exists(std::string_view interface_name);

    tl::expected<void, Error> delete_interface(std::string_view interface_name);
}

#endif //SOCKCAN_LINK_HPP
