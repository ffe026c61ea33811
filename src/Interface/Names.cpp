#include "SockCAN/Interface/Names.hpp"

#include <format>
#include <net/if.h>

using tl::unexpected, std::format, std::string_view;

namespace SockCAN
{
    tl::expected<unsigned, Error> interface_index(const string_view name)
    {
        if (name.empty() || name.size() >= IFNAMSIZ)
        {
            return unexpected(Error{ErrorCode::NoSuchInterface, format("Invalid interface name '{}'", name)});
        }
        const std::string terminated{name};
        const unsigned index = if_nametoindex(terminated.c_str());
        if (index == 0)
        {
            return unexpected(os_error(ErrorCode::NoSuchInterface, format("Interface '{}' not found", name)));
        }
        return index;
    }

    tl::expected<std::string, Error> interface_name(const unsigned index)
    {
        char buffer[IF_NAMESIZE]{};
        if (if_indextoname(index, buffer) == nullptr)
        {
            return unexpected(os_error(ErrorCode::NoSuchInterface, format("Interface index {} not found", index)));
        }
        return std::string(buffer);
    }
}
