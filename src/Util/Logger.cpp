#include "SockCAN/Util/Logger.hpp"
#include "SockCAN/Config.hpp"

#include <string_view>

namespace SockCAN
{
    xtr::logger& library_logger()
    {
        static xtr::logger logger;
        return logger;
    }

    xtr::log_level_t parse_log_level(const std::string_view level) noexcept
    {
        if (level == "none") return xtr::log_level_t::none;
        if (level == "fatal") return xtr::log_level_t::fatal;
        if (level == "error") return xtr::log_level_t::error;
        if (level == "warning") return xtr::log_level_t::warning;
        if (level == "debug") return xtr::log_level_t::debug;
        return xtr::log_level_t::info;
    }

    xtr::sink make_sink(std::string name)
    {
        xtr::sink s = library_logger().get_sink(std::move(name));
        s.set_level(parse_log_level(Config::get_log_level()));
        return s;
    }
}
