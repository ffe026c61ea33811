#ifndef SOCKCAN_LOGGER_HPP
#define SOCKCAN_LOGGER_HPP

#include <string>
#include <string_view>

#include <xtr/logger.hpp>

namespace SockCAN
{
    /**
     * @brief Process-wide logger shared by every SockCAN component
     */
    xtr::logger& library_logger();

    /**
     * @brief Creates a named sink with the level taken from SOCKCAN_LOG_LEVEL
     * Sinks are not thread safe, each component instance owns its own.
     */
    xtr::sink make_sink(std::string name);

    xtr::log_level_t parse_log_level(std::string_view level) noexcept;
}

#endif //SOCKCAN_LOGGER_HPP
