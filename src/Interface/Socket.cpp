#include "SockCAN/Interface/Socket.hpp"
#include "SockCAN/Interface/Names.hpp"
#include "SockCAN/Config.hpp"
#include "SockCAN/Util/Logger.hpp"

#include <cerrno>
#include <format>
#include <utility>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <linux/can.h>
#include <linux/can/raw.h>
#include <linux/sockios.h>

using tl::unexpected, std::format, std::string_view, std::span;

namespace SockCAN
{
    namespace
    {
        Error socket_error(const string_view what)
        {
            switch (errno)
            {
            case ENODEV:
            case ENXIO:
                return os_error(ErrorCode::NoSuchInterface, what);
            case EPERM:
            case EACCES:
                return os_error(ErrorCode::PermissionDenied, what);
            case EAGAIN:
                return os_error(ErrorCode::WouldBlock, what);
            case EINTR:
                return os_error(ErrorCode::Interrupted, what);
            default:
                return os_error(ErrorCode::IoFailure, what);
            }
        }

        std::string sink_name(const unsigned index)
        {
            return interface_name(index)
                   .map([](const std::string& name) { return format("SockCAN Socket_{}", name); })
                   .value_or(format("SockCAN Socket_if{}", index));
        }
    }

    Socket::Socket(const int fd, const FrameMode mode, const unsigned index, xtr::sink sink) :
        sock_fd(fd), frame_mode(mode), if_index(index), s(std::move(sink))
    {
    }

    Socket::Socket(Socket&& other) noexcept :
        sock_fd(std::exchange(other.sock_fd, -1)), frame_mode(other.frame_mode), if_index(other.if_index),
        nonblocking(other.nonblocking), s(std::move(other.s))
    {
    }

    Socket& Socket::operator=(Socket&& other) noexcept
    {
        if (this != &other)
        {
            if (sock_fd >= 0)
            {
                ::close(sock_fd);
            }
            sock_fd = std::exchange(other.sock_fd, -1);
            frame_mode = other.frame_mode;
            if_index = other.if_index;
            nonblocking = other.nonblocking;
            s = std::move(other.s);
        }
        return *this;
    }

    Socket::~Socket()
    {
        if (sock_fd >= 0)
        {
            ::close(sock_fd);
        }
    }

    tl::expected<Socket, Error> Socket::open(const string_view interface_name, const FrameMode mode)
    {
        return interface_index(interface_name).and_then([&](const unsigned index) { return open(index, mode); });
    }

    tl::expected<Socket, Error> Socket::open(const unsigned interface_index, const FrameMode mode)
    {
        xtr::sink sink = make_sink(sink_name(interface_index));

        const int fd = socket(PF_CAN, SOCK_RAW | SOCK_CLOEXEC, CAN_RAW);
        if (fd == -1)
        {
            auto err = socket_error("Failed to create CAN socket");
            XTR_LOGL(error, sink, "{}", err.message);
            return unexpected(err);
        }

        if (mode == FrameMode::Fd)
        {
            constexpr int enable = 1;
            if (setsockopt(fd, SOL_CAN_RAW, CAN_RAW_FD_FRAMES, &enable, sizeof(enable)) == -1)
            {
                auto err = socket_error("Failed to enable CAN FD frames");
                ::close(fd);
                XTR_LOGL(error, sink, "{}", err.message);
                return unexpected(err);
            }
        }

        sockaddr_can addr = {
            .can_family = AF_CAN,
            .can_ifindex = static_cast<int>(interface_index),
        };
        if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1)
        {
            auto err = socket_error(format("Failed to bind CAN socket to interface {}", interface_index));
            ::close(fd);
            XTR_LOGL(error, sink, "{}", err.message);
            return unexpected(err);
        }

        XTR_LOGL(info, sink, "Opened {} socket on interface {}", mode == FrameMode::Fd ? "FD" : "classic",
                 interface_index);
        return Socket{fd, mode, interface_index, std::move(sink)};
    }

    tl::expected<Socket, Error> Socket::from_fd(const int fd, const FrameMode mode)
    {
        if (fd < 0)
        {
            return unexpected(Error{ErrorCode::InvalidParameter, format("Invalid descriptor {}", fd)});
        }
        const int flags = fcntl(fd, F_GETFL, 0);
        if (flags == -1)
        {
            return unexpected(os_error(ErrorCode::IoFailure, format("Descriptor {} is not open", fd)));
        }
        Socket socket{fd, mode, 0, make_sink(format("SockCAN Socket_fd{}", fd))};
        socket.nonblocking = (flags & O_NONBLOCK) != 0;
        return socket;
    }

    tl::expected<void, Error> Socket::ensure_open() const
    {
        if (sock_fd < 0)
        {
            return unexpected(Error{ErrorCode::AlreadyClosed, "Socket is closed"});
        }
        return {};
    }

    tl::expected<void, Error> Socket::set_raw_option(const int option, const void* value, const unsigned size,
                                                     const string_view what)
    {
        return ensure_open().and_then([&]() -> tl::expected<void, Error>
        {
            if (setsockopt(sock_fd, SOL_CAN_RAW, option, value, size) == -1)
            {
                auto err = os_error(ErrorCode::IoFailure, format("Failed to set {}", what));
                XTR_LOGL(error, s, "{}", err.message);
                return unexpected(err);
            }
            return {};
        });
    }

    tl::expected<void, Error> Socket::set_bool_option(const int option, const bool enabled, const string_view what)
    {
        const int value = enabled ? 1 : 0;
        return set_raw_option(option, &value, sizeof(value), what);
    }

    tl::expected<void, Error> Socket::set_filters(const span<const Filter> filters)
    {
        std::vector<can_filter> raw;
        raw.reserve(filters.size());
        for (const auto& [id, mask] : filters)
        {
            raw.push_back(can_filter{.can_id = id, .can_mask = mask});
        }
        return set_raw_option(CAN_RAW_FILTER, raw.data(), static_cast<unsigned>(raw.size() * sizeof(can_filter)),
                              "CAN_RAW_FILTER");
    }

    tl::expected<void, Error> Socket::set_filter_accept_all()
    {
        constexpr Filter accept_all{0, 0};
        return set_filters(span{&accept_all, 1});
    }

    tl::expected<void, Error> Socket::set_filter_drop_all()
    {
        return set_raw_option(CAN_RAW_FILTER, nullptr, 0, "CAN_RAW_FILTER");
    }

    tl::expected<void, Error> Socket::set_error_mask(const uint32_t mask)
    {
        const can_err_mask_t value = mask;
        return set_raw_option(CAN_RAW_ERR_FILTER, &value, sizeof(value), "CAN_RAW_ERR_FILTER");
    }

    tl::expected<void, Error> Socket::set_loopback(const bool enabled)
    {
        return set_bool_option(CAN_RAW_LOOPBACK, enabled, "CAN_RAW_LOOPBACK");
    }

    tl::expected<void, Error> Socket::set_receive_own_messages(const bool enabled)
    {
        return set_bool_option(CAN_RAW_RECV_OWN_MSGS, enabled, "CAN_RAW_RECV_OWN_MSGS");
    }

    tl::expected<void, Error> Socket::set_join_filters(const bool enabled)
    {
        return set_bool_option(CAN_RAW_JOIN_FILTERS, enabled, "CAN_RAW_JOIN_FILTERS");
    }

    tl::expected<void, Error> Socket::set_nonblocking(const bool enable)
    {
        return ensure_open().and_then([&]() -> tl::expected<void, Error>
        {
            const int flags = fcntl(sock_fd, F_GETFL, 0);
            if (flags == -1)
            {
                return unexpected(os_error(ErrorCode::IoFailure, "Failed to read descriptor flags"));
            }
            const int updated = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
            if (fcntl(sock_fd, F_SETFL, updated) == -1)
            {
                auto err = os_error(ErrorCode::IoFailure, "Failed to change blocking mode");
                XTR_LOGL(error, s, "{}", err.message);
                return unexpected(err);
            }
            nonblocking = enable;
            return {};
        });
    }

    tl::expected<void, Error> Socket::set_timeout(const int option, const std::chrono::milliseconds timeout)
    {
        return ensure_open().and_then([&]() -> tl::expected<void, Error>
        {
            const auto count = timeout.count();
            const timeval tv{
                .tv_sec = static_cast<time_t>(count / 1000),
                .tv_usec = static_cast<suseconds_t>((count % 1000) * 1000),
            };
            if (setsockopt(sock_fd, SOL_SOCKET, option, &tv, sizeof(tv)) == -1)
            {
                return unexpected(os_error(ErrorCode::IoFailure, "Failed to set socket timeout"));
            }
            return {};
        });
    }

    tl::expected<void, Error> Socket::set_read_timeout(const std::chrono::milliseconds timeout)
    {
        return set_timeout(SO_RCVTIMEO, timeout);
    }

    tl::expected<void, Error> Socket::set_write_timeout(const std::chrono::milliseconds timeout)
    {
        return set_timeout(SO_SNDTIMEO, timeout);
    }

    tl::expected<size_t, Error> Socket::read_raw(const span<uint8_t> buffer)
    {
        for (unsigned attempt = 0; attempt <= Config::INTERRUPT_RETRY_LIMIT; ++attempt)
        {
            if (const ssize_t nbytes = ::read(sock_fd, buffer.data(), buffer.size()); nbytes >= 0)
            {
                return static_cast<size_t>(nbytes);
            }
            if (errno == EINTR)
            {
                continue;
            }
            // a receive timeout on a blocking socket is reported as EAGAIN too
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                return unexpected(Error{ErrorCode::WouldBlock, "No frame pending", EAGAIN});
            }
            auto err = socket_error("Failed to read CAN frame");
            XTR_LOGL(error, s, "{}", err.message);
            return unexpected(err);
        }
        return unexpected(Error{ErrorCode::Interrupted, "Read interrupted by signals", EINTR});
    }

    tl::expected<Frame, Error> Socket::read_frame()
    {
        WireBuffer buffer{};
        return ensure_open()
               .and_then([&] { return read_raw(buffer); })
               .and_then([&](const size_t nbytes) { return decode(span{buffer.data(), nbytes}, frame_mode); })
               .map([&](Frame frame)
               {
                   XTR_LOGL(debug, s, "RX {}", to_string(frame));
                   return frame;
               });
    }

    tl::expected<TimestampedFrame, Error> Socket::read_frame_with_timestamp()
    {
        return read_frame().and_then([&](Frame frame) -> tl::expected<TimestampedFrame, Error>
        {
            timespec ts{};
            if (ioctl(sock_fd, SIOCGSTAMPNS, &ts) == -1)
            {
                return unexpected(os_error(ErrorCode::IoFailure, "Failed to read frame timestamp"));
            }
            const auto since_epoch = std::chrono::seconds{ts.tv_sec} + std::chrono::nanoseconds{ts.tv_nsec};
            return TimestampedFrame{
                std::move(frame),
                std::chrono::system_clock::time_point{
                    std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch)
                }
            };
        });
    }

    tl::expected<void, Error> Socket::write_frame(const Frame& frame)
    {
        if (auto open = ensure_open(); !open)
        {
            return open;
        }
        WireBuffer buffer{};
        const auto size = encode(frame, frame_mode, buffer);
        if (!size)
        {
            XTR_LOGL(error, s, "Refusing to write {}: {}", to_string(frame), size.error().message);
            return unexpected(size.error());
        }

        for (unsigned attempt = 0; attempt <= Config::INTERRUPT_RETRY_LIMIT; ++attempt)
        {
            const ssize_t nbytes = ::write(sock_fd, buffer.data(), *size);
            if (nbytes == static_cast<ssize_t>(*size))
            {
                XTR_LOGL(debug, s, "TX {}", to_string(frame));
                return {};
            }
            if (nbytes >= 0)
            {
                return unexpected(Error{
                    ErrorCode::IoFailure, format("Short write of {} out of {} bytes", nbytes, *size)
                });
            }
            if (errno == EINTR)
            {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                return unexpected(Error{ErrorCode::WouldBlock, "Transmit queue full", EAGAIN});
            }
            auto err = socket_error("Failed to write CAN frame");
            XTR_LOGL(error, s, "{}", err.message);
            return unexpected(err);
        }
        return unexpected(Error{ErrorCode::Interrupted, "Write interrupted by signals", EINTR});
    }

    tl::expected<void, Error> Socket::write_frame_insist(const Frame& frame)
    {
        while (true)
        {
            auto result = write_frame(frame);
            if (result || (result.error().code != ErrorCode::WouldBlock &&
                result.error().code != ErrorCode::Interrupted))
            {
                return result;
            }
            if (result.error().code == ErrorCode::WouldBlock)
            {
                pollfd pfd{.fd = sock_fd, .events = POLLOUT, .revents = 0};
                if (poll(&pfd, 1, -1) == -1 && errno != EINTR)
                {
                    return unexpected(os_error(ErrorCode::IoFailure, "Failed to wait for socket writability"));
                }
            }
        }
    }

    tl::expected<size_t, Error> Socket::flush()
    {
        if (auto open = ensure_open(); !open)
        {
            return unexpected(open.error());
        }
        WireBuffer buffer{};
        size_t dropped = 0;
        while (true)
        {
            const ssize_t nbytes = recv(sock_fd, buffer.data(), buffer.size(), MSG_DONTWAIT);
            if (nbytes > 0)
            {
                ++dropped;
            }
            // peer of an adopted descriptor hung up
            else if (nbytes == 0)
            {
                break;
            }
            else if (errno == EAGAIN || errno == EWOULDBLOCK || errno == ENETDOWN)
            {
                break;
            }
            else if (errno != EINTR)
            {
                return unexpected(os_error(ErrorCode::IoFailure, "Failed to flush socket buffer"));
            }
        }
        if (dropped > 0)
        {
            XTR_LOGL(debug, s, "Flushed {} pending frames", dropped);
        }
        return dropped;
    }

    tl::expected<void, Error> Socket::close()
    {
        if (sock_fd < 0)
        {
            return unexpected(Error{ErrorCode::AlreadyClosed, "Socket already closed"});
        }
        const int fd = std::exchange(sock_fd, -1);
        // Linux releases the descriptor even when close reports an error
        if (::close(fd) == -1)
        {
            auto err = os_error(ErrorCode::IoFailure, "Failed to close CAN socket");
            XTR_LOGL(error, s, "{}", err.message);
            return unexpected(err);
        }
        XTR_LOGL(info, s, "Closed socket on interface {}", if_index);
        return {};
    }
}
