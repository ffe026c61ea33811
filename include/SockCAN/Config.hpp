#ifndef SOCKCAN_CONFIG_HPP
#define SOCKCAN_CONFIG_HPP

#include <chrono>
#include <cstdlib>
#include <string>
#include <charconv>
#include <string_view>

namespace SockCAN
{
    namespace Config
    {
        // Per-read timeout on the netlink control socket
        constexpr int DEFAULT_NETLINK_TIMEOUT_MS = 500;

        // Reads attempted per netlink exchange before NetlinkTimeout
        constexpr unsigned DEFAULT_NETLINK_MAX_ATTEMPTS = 8;

        // EINTR retries for a single blocking read/write
        constexpr unsigned INTERRUPT_RETRY_LIMIT = 3;

        constexpr const char* DEFAULT_LOG_LEVEL = "info";

        inline unsigned env_unsigned(const char* name, const unsigned fallback)
        {
            const char* value = getenv(name);
            if (!value)
            {
                return fallback;
            }
            unsigned parsed{};
            const std::string_view text{value};
            if (const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
                ec != std::errc{} || ptr != text.data() + text.size() || parsed == 0)
            {
                return fallback;
            }
            return parsed;
        }

        inline std::chrono::milliseconds get_netlink_timeout()
        {
            return std::chrono::milliseconds(env_unsigned("SOCKCAN_NETLINK_TIMEOUT_MS", DEFAULT_NETLINK_TIMEOUT_MS));
        }

        inline unsigned get_netlink_max_attempts()
        {
            return env_unsigned("SOCKCAN_NETLINK_MAX_ATTEMPTS", DEFAULT_NETLINK_MAX_ATTEMPTS);
        }

        inline std::string get_log_level()
        {
            if (const char* env_level = getenv("SOCKCAN_LOG_LEVEL"))
            {
                return std::string(env_level);
            }
            return std::string(DEFAULT_LOG_LEVEL);
        }
    }
}

#endif //SOCKCAN_CONFIG_HPP
