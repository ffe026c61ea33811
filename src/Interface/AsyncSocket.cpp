#include "SockCAN/Interface/AsyncSocket.hpp"
#include "SockCAN/Util/Logger.hpp"

#include <format>
#include <utility>

using tl::unexpected, std::format;

namespace SockCAN
{
    AsyncSocket::AsyncSocket(Socket socket) :
        socket(std::move(socket)), s(make_sink(format("SockCAN AsyncSocket_fd{}", this->socket.get_sock_fd())))
    {
    }

    AsyncSocket::~AsyncSocket()
    {
        alive.reset();
        if (current != AsyncState::Closed)
        {
            if (auto closed = close(); !closed)
            {
                XTR_LOGL(error, s, "Failed to close adapter: {}", closed.error().message);
            }
        }
    }

    tl::expected<std::unique_ptr<AsyncSocket>, Error> AsyncSocket::create(Socket socket)
    {
        if (!socket.is_open())
        {
            return unexpected(Error{ErrorCode::AlreadyClosed, "Cannot adapt a closed socket"});
        }
        return socket.set_nonblocking(true).map([&]
        {
            return std::unique_ptr<AsyncSocket>(new AsyncSocket(std::move(socket)));
        });
    }

    uint32_t AsyncSocket::interest() const noexcept
    {
        if (current == AsyncState::Closed)
        {
            return 0;
        }
        return EPOLLIN | (outgoing.empty() ? 0u : static_cast<uint32_t>(EPOLLOUT));
    }

    tl::expected<void, Error> AsyncSocket::attach(Reactor& target, FrameHandler frame_handler)
    {
        if (current == AsyncState::Closed)
        {
            return unexpected(Error{ErrorCode::AlreadyClosed, "Adapter is closed"});
        }
        if (reactor)
        {
            return unexpected(Error{ErrorCode::InvalidParameter, "Adapter is already attached to a reactor"});
        }
        if (!frame_handler)
        {
            return unexpected(Error{ErrorCode::InvalidParameter, "Provided frame handler is empty"});
        }
        return target.add(socket.get_sock_fd(), interest(), [this](const uint32_t events) { dispatch(events); })
                     .map([&]
                     {
                         reactor = &target;
                         handler = std::move(frame_handler);
                     });
    }

    void AsyncSocket::dispatch(const uint32_t events)
    {
        // the handler may close or destroy the adapter
        const std::weak_ptr<bool> token = alive;
        const FrameHandler deliver = handler;
        const auto still_open = [&] { return !token.expired() && current != AsyncState::Closed; };

        if (events & (EPOLLIN | EPOLLERR | EPOLLHUP))
        {
            auto result = on_readable();
            if (!result)
            {
                deliver(unexpected(result.error()));
            }
            else if (*result)
            {
                deliver(std::move(**result));
            }
        }
        if (still_open() && (events & EPOLLOUT))
        {
            if (auto written = on_writable(); !written)
            {
                deliver(unexpected(written.error()));
            }
        }
        if (still_open())
        {
            if (auto armed = rearm(); !armed)
            {
                XTR_LOGL(error, s, "Failed to re-register: {}", armed.error().message);
                deliver(unexpected(armed.error()));
            }
        }
    }

    tl::expected<void, Error> AsyncSocket::rearm()
    {
        if (!reactor)
        {
            return {};
        }
        return reactor->rearm(socket.get_sock_fd(), interest());
    }

    tl::expected<std::optional<Frame>, Error> AsyncSocket::on_readable()
    {
        if (current == AsyncState::Closed)
        {
            return unexpected(Error{ErrorCode::AlreadyClosed, "Adapter is closed"});
        }
        current = AsyncState::Ready;
        auto frame = socket.read_frame();
        current = AsyncState::WaitingForReadiness;
        if (frame)
        {
            return std::optional<Frame>{std::move(*frame)};
        }
        if (frame.error().code == ErrorCode::WouldBlock)
        {
            ++spurious;
            XTR_LOGL(debug, s, "Spurious read wakeup, {} so far", spurious);
            return std::optional<Frame>{};
        }
        return unexpected(frame.error());
    }

    tl::expected<void, Error> AsyncSocket::on_writable()
    {
        if (current == AsyncState::Closed)
        {
            return unexpected(Error{ErrorCode::AlreadyClosed, "Adapter is closed"});
        }
        if (outgoing.empty())
        {
            return {};
        }
        current = AsyncState::Ready;
        auto written = socket.write_frame(outgoing.front());
        current = AsyncState::WaitingForReadiness;
        if (!written && written.error().code == ErrorCode::WouldBlock)
        {
            ++spurious;
            XTR_LOGL(debug, s, "Spurious write wakeup, {} so far", spurious);
            return {};
        }
        // a frame the kernel rejected is dropped so the queue keeps moving
        outgoing.pop_front();
        return written;
    }

    tl::expected<void, Error> AsyncSocket::send(const Frame& frame)
    {
        if (current == AsyncState::Closed)
        {
            return unexpected(Error{ErrorCode::AlreadyClosed, "Adapter is closed"});
        }
        if (is_fd(frame) && socket.mode() == FrameMode::Classic)
        {
            return unexpected(Error{
                ErrorCode::FrameTooLargeForMode, format("Cannot queue {} on a classic socket", to_string(frame))
            });
        }
        const bool was_idle = outgoing.empty();
        outgoing.push_back(frame);
        if (was_idle)
        {
            return rearm();
        }
        return {};
    }

    tl::expected<std::optional<Frame>, Error> AsyncSocket::poll_next()
    {
        if (current == AsyncState::Closed)
        {
            return unexpected(Error{ErrorCode::AlreadyClosed, "Adapter is closed"});
        }
        auto frame = socket.read_frame();
        if (frame)
        {
            return std::optional<Frame>{std::move(*frame)};
        }
        if (frame.error().code == ErrorCode::WouldBlock)
        {
            return std::optional<Frame>{};
        }
        return unexpected(frame.error());
    }

    tl::expected<void, Error> AsyncSocket::close()
    {
        if (current == AsyncState::Closed)
        {
            return unexpected(Error{ErrorCode::AlreadyClosed, "Adapter is already closed"});
        }
        current = AsyncState::Closed;
        if (!outgoing.empty())
        {
            XTR_LOGL(info, s, "Dropping {} queued frames on close", outgoing.size());
            outgoing.clear();
        }
        tl::expected<void, Error> removed{};
        if (reactor)
        {
            removed = reactor->remove(socket.get_sock_fd());
            reactor = nullptr;
        }
        auto closed = socket.close();
        if (!removed)
        {
            return removed;
        }
        return closed;
    }
}
