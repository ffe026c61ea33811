#ifndef SOCKCAN_NAMES_HPP
#define SOCKCAN_NAMES_HPP

#include <string>
#include <string_view>

#include <tl/expected.hpp>
#include "SockCAN/Util/Error.hpp"

namespace SockCAN
{
    // NoSuchInterface when the kernel does not know the name or index
    tl::expected<unsigned, Error> interface_index(std::string_view name);
    tl::expected<std::string, Error> interface_name(unsigned index);
}

#endif //SOCKCAN_NAMES_HPP
