#include "SockCAN/Netlink/Link.hpp"
#include "SockCAN/Util/Logger.hpp"

#include <cerrno>
#include <format>
#include <memory>
#include <net/if.h>
#include <net/if_arp.h>

#include <netlink/cache.h>
#include <netlink/errno.h>
#include <netlink/netlink.h>
#include <netlink/socket.h>
#include <netlink/route/link.h>

using tl::unexpected, std::format, std::string_view;

namespace SockCAN::Netlink
{
    namespace
    {
        struct SocketDeleter
        {
            void operator()(nl_sock* sock) const noexcept
            {
                nl_close(sock);
                nl_socket_free(sock);
            }
        };

        struct LinkDeleter
        {
            void operator()(rtnl_link* link) const noexcept { rtnl_link_put(link); }
        };

        struct CacheDeleter
        {
            void operator()(nl_cache* cache) const noexcept { nl_cache_free(cache); }
        };

        using SocketPtr = std::unique_ptr<nl_sock, SocketDeleter>;
        using LinkPtr = std::unique_ptr<rtnl_link, LinkDeleter>;

        tl::expected<SocketPtr, Error> connect_route_socket()
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
            return SocketPtr{sock};
        }

        tl::expected<LinkPtr, Error> alloc_link()
        {
            rtnl_link* link = rtnl_link_alloc();
            if (!link)
            {
                return unexpected(Error{ErrorCode::RtnlLinkAllocError, "Cannot alloc rtnl_link"});
            }
            return LinkPtr{link};
        }

        xtr::sink& link_sink()
        {
            thread_local xtr::sink s = make_sink("SockCAN Link");
            return s;
        }
    }

    tl::expected<std::vector<LinkEntry>, Error> enumerate_can_interfaces()
    {
        auto sock = connect_route_socket();
        if (!sock)
        {
            return unexpected(sock.error());
        }

        nl_cache* raw_cache = nullptr;
        if (const int result = rtnl_link_alloc_cache(sock->get(), AF_UNSPEC, &raw_cache); result < 0)
        {
            return unexpected(Error{
                ErrorCode::NetlinkError, format("Failed to allocate link cache: {}", nl_geterror(result))
            });
        }
        const std::unique_ptr<nl_cache, CacheDeleter> cache{raw_cache};

        std::vector<LinkEntry> links;
        for (nl_object* object = nl_cache_get_first(cache.get()); object; object = nl_cache_get_next(object))
        {
            auto* link = reinterpret_cast<rtnl_link*>(object);
            if (rtnl_link_get_arptype(link) != ARPHRD_CAN)
            {
                continue;
            }
            const char* name = rtnl_link_get_name(link);
            links.push_back(LinkEntry{
                static_cast<unsigned>(rtnl_link_get_ifindex(link)), name ? name : ""
            });
        }
        return links;
    }

    tl::expected<void, Error> create_vcan_interface_if_not_exists(const string_view interface_name)
    {
        const std::string name{interface_name};
        if (if_nametoindex(name.c_str()) != 0)
        {
            return {};
        }
        if (errno != ENODEV)
        {
            return unexpected(os_error(
                ErrorCode::IoFailure, format("Error checking interface '{}' before creation", interface_name)));
        }

        auto sock = connect_route_socket();
        if (!sock)
        {
            return unexpected(sock.error());
        }
        auto link = alloc_link();
        if (!link)
        {
            return unexpected(link.error());
        }

        rtnl_link_set_name(link->get(), name.c_str());
        if (const int result = rtnl_link_set_type(link->get(), "vcan"); result < 0)
        {
            return unexpected(Error{
                ErrorCode::VCANCreationError, format("vcan link type unavailable: {}", nl_geterror(result))
            });
        }

        if (const int result = rtnl_link_add(sock->get(), link->get(), NLM_F_CREATE); result < 0)
        {
            XTR_LOGL(error, link_sink(), "Failed to create VCAN interface '{}': {}", interface_name,
                     nl_geterror(result));
            return unexpected(Error{
                ErrorCode::VCANCreationError,
                format("Failed to create VCAN interface '{}': {}", interface_name, nl_geterror(result))
            });
        }
        XTR_LOGL(info, link_sink(), "Created VCAN interface '{}'", interface_name);
        return {};
    }

    tl::expected<void, Error> delete_interface(const string_view interface_name)
    {
        auto sock = connect_route_socket();
        if (!sock)
        {
            return unexpected(sock.error());
        }
        auto link = alloc_link();
        if (!link)
        {
            return unexpected(link.error());
        }

        rtnl_link_set_name(link->get(), std::string(interface_name).c_str());
        if (const int result = rtnl_link_delete(sock->get(), link->get()); result < 0)
        {
            const ErrorCode code = result == -NLE_NODEV || result == -NLE_OBJ_NOTFOUND
                                       ? ErrorCode::NoSuchInterface
                                       : ErrorCode::NetlinkError;
            return unexpected(Error{
                code, format("Failed to delete interface '{}': {}", interface_name, nl_geterror(result))
            });
        }
        XTR_LOGL(info, link_sink(), "Deleted interface '{}'", interface_name);
        return {};
    }
}
