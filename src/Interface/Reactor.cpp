#include "SockCAN/Interface/Reactor.hpp"
#include "SockCAN/Util/Logger.hpp"

#include <cerrno>
#include <format>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <unistd.h>
#include <sys/eventfd.h>

using tl::unexpected, std::format;

namespace SockCAN
{
    Reactor::Reactor() : s(make_sink("SockCAN Reactor"))
    {
        epoll_fd = epoll_create1(EPOLL_CLOEXEC);
        if (epoll_fd == -1)
        {
            throw std::runtime_error(format("Failed to create epoll file descriptor: {}",
                                            std::generic_category().message(errno)));
        }
        wake_fd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wake_fd == -1)
        {
            const int saved = errno;
            close(epoll_fd);
            throw std::runtime_error(format("Failed to create wake_fd file descriptor: {}",
                                            std::generic_category().message(saved)));
        }
        if (auto added = control(EPOLL_CTL_ADD, wake_fd, EPOLLIN); !added)
        {
            close(wake_fd);
            close(epoll_fd);
            throw std::runtime_error(added.error().message);
        }
    }

    Reactor::~Reactor()
    {
        if (wake_fd != -1)
        {
            close(wake_fd);
        }
        if (epoll_fd != -1)
        {
            close(epoll_fd);
        }
    }

    tl::expected<void, Error> Reactor::control(const int op, const int fd, const uint32_t events) const
    {
        epoll_event ev{
            .events = events,
            .data = {
                .fd = fd
            }
        };
        if (epoll_ctl(epoll_fd, op, fd, op == EPOLL_CTL_DEL ? nullptr : &ev) == -1)
        {
            return unexpected(os_error(ErrorCode::EpollError, format("epoll_ctl on fd {} failed", fd)));
        }
        return {};
    }

    tl::expected<void, Error> Reactor::add(const int fd, const uint32_t events, Handler handler)
    {
        if (!handler)
        {
            return unexpected(Error{ErrorCode::InvalidParameter, "Provided readiness handler is empty"});
        }
        if (handlers.contains(fd))
        {
            return unexpected(Error{ErrorCode::InvalidParameter, format("fd {} is already registered", fd)});
        }
        return control(EPOLL_CTL_ADD, fd, events | EPOLLONESHOT).map([&]
        {
            handlers.emplace(fd, std::move(handler));
        });
    }

    tl::expected<void, Error> Reactor::rearm(const int fd, const uint32_t events)
    {
        if (!handlers.contains(fd))
        {
            return unexpected(Error{ErrorCode::InvalidParameter, format("fd {} is not registered", fd)});
        }
        return control(EPOLL_CTL_MOD, fd, events | EPOLLONESHOT);
    }

    tl::expected<void, Error> Reactor::remove(const int fd)
    {
        if (handlers.erase(fd) == 0)
        {
            return unexpected(Error{ErrorCode::InvalidParameter, format("fd {} is not registered", fd)});
        }
        return control(EPOLL_CTL_DEL, fd, 0);
    }

    tl::expected<size_t, Error> Reactor::run_once(const std::chrono::milliseconds timeout)
    {
        epoll_event events[MAX_EPOLL_EVENT]{};
        const int nfds = epoll_wait(epoll_fd, events, MAX_EPOLL_EVENT, static_cast<int>(timeout.count()));
        if (nfds == -1)
        {
            if (errno == EINTR)
            {
                return 0;
            }
            auto err = os_error(ErrorCode::EpollError, "epoll_wait failed");
            XTR_LOGL(error, s, "{}", err.message);
            return unexpected(err);
        }

        size_t dispatched = 0;
        for (int i = 0; i < nfds; ++i)
        {
            const int fd = events[i].data.fd;
            if (fd == wake_fd)
            {
                uint64_t count;
                if (read(wake_fd, &count, sizeof(count)) == -1 && errno != EAGAIN)
                {
                    XTR_LOGL(error, s, "Failed to drain wake_fd: {}", std::generic_category().message(errno));
                }
                continue;
            }
            const auto it = handlers.find(fd);
            if (it == handlers.end())
            {
                continue;
            }
            // the handler may remove itself
            const Handler handler = it->second;
            handler(events[i].events);
            ++dispatched;
        }
        return dispatched;
    }

    tl::expected<void, Error> Reactor::wake() const
    {
        constexpr uint64_t one = 1;
        if (write(wake_fd, &one, sizeof(one)) == -1 && errno != EAGAIN)
        {
            return unexpected(os_error(ErrorCode::EpollError, "Failed to write wake_fd"));
        }
        return {};
    }
}
