#ifndef SOCKCAN_SOCKET_HPP
#define SOCKCAN_SOCKET_HPP

#include <chrono>
#include <cstdint>
#include <span>
#include <string_view>

#include <tl/expected.hpp>
#include <xtr/logger.hpp>
#include "SockCAN/Frame/Codec.hpp"
#include "SockCAN/Frame/Frame.hpp"
#include "SockCAN/Frame/FrameConvertible.hpp"
#include "SockCAN/Util/Error.hpp"

namespace SockCAN
{
    // struct can_filter: a frame passes when (received_id & mask) == (id & mask)
    struct Filter
    {
        uint32_t id;
        uint32_t mask;
    };

    struct TimestampedFrame
    {
        Frame frame;
        std::chrono::system_clock::time_point timestamp;
    };

    /**
     * @brief Raw CAN socket bound to one interface
     * Owns its descriptor exclusively. close() is strict: a second close and
     * any operation after close fail with AlreadyClosed.
     */
    class Socket
    {
    public:
        static tl::expected<Socket, Error> open(std::string_view interface_name, FrameMode mode = FrameMode::Classic);
        static tl::expected<Socket, Error> open(unsigned interface_index, FrameMode mode = FrameMode::Classic);

        /**
         * @brief Adopts an already open datagram descriptor, e.g. one end of a socketpair
         */
        static tl::expected<Socket, Error> from_fd(int fd, FrameMode mode);

        Socket(const Socket&) = delete;
        Socket& operator=(const Socket&) = delete;
        Socket(Socket&& other) noexcept;
        Socket& operator=(Socket&& other) noexcept;
        ~Socket();

        tl::expected<void, Error> set_filters(std::span<const Filter> filters);
        tl::expected<void, Error> set_filter_accept_all();
        tl::expected<void, Error> set_filter_drop_all();
        tl::expected<void, Error> set_error_mask(uint32_t mask);
        tl::expected<void, Error> set_loopback(bool enabled);
        tl::expected<void, Error> set_receive_own_messages(bool enabled);
        tl::expected<void, Error> set_join_filters(bool enabled);

        tl::expected<void, Error> set_nonblocking(bool nonblocking);
        tl::expected<void, Error> set_read_timeout(std::chrono::milliseconds timeout);
        tl::expected<void, Error> set_write_timeout(std::chrono::milliseconds timeout);

        tl::expected<Frame, Error> read_frame();
        tl::expected<TimestampedFrame, Error> read_frame_with_timestamp();
        tl::expected<void, Error> write_frame(const Frame& frame);

        /**
         * @brief Writes frame, waiting for the socket while the kernel reports WouldBlock or EINTR
         */
        tl::expected<void, Error> write_frame_insist(const Frame& frame);

        /**
         * @brief Discards every frame already queued on the socket without blocking
         * @return number of frames dropped
         */
        tl::expected<size_t, Error> flush();

        tl::expected<void, Error> close();

        template <FrameConvertible T>
        tl::expected<void, Error> write(const T& value)
        {
            return write_frame(static_cast<Frame>(value));
        }

        template <FrameConvertible T>
        tl::expected<T, Error> read()
        {
            return read_frame().map([](const Frame& frame) { return static_cast<T>(frame); });
        }

        [[nodiscard]] int get_sock_fd() const noexcept { return sock_fd; }
        [[nodiscard]] FrameMode mode() const noexcept { return frame_mode; }
        [[nodiscard]] unsigned get_interface_index() const noexcept { return if_index; }
        [[nodiscard]] bool is_open() const noexcept { return sock_fd >= 0; }
        [[nodiscard]] bool is_nonblocking() const noexcept { return nonblocking; }

    private:
        Socket(int fd, FrameMode mode, unsigned index, xtr::sink sink);

        tl::expected<void, Error> ensure_open() const;
        tl::expected<void, Error> set_raw_option(int option, const void* value, unsigned size, std::string_view what);
        tl::expected<void, Error> set_bool_option(int option, bool enabled, std::string_view what);
        tl::expected<void, Error> set_timeout(int option, std::chrono::milliseconds timeout);
        tl::expected<size_t, Error> read_raw(std::span<uint8_t> buffer);

        int sock_fd{-1};
        FrameMode frame_mode{FrameMode::Classic};
        unsigned if_index{};
        bool nonblocking{};
        xtr::sink s;
    };
}

#endif //SOCKCAN_SOCKET_HPP
