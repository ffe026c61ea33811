#ifndef SOCKCAN_ASYNC_SOCKET_HPP
#define SOCKCAN_ASYNC_SOCKET_HPP

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>

#include <tl/expected.hpp>
#include <xtr/logger.hpp>
#include "SockCAN/Frame/Frame.hpp"
#include "SockCAN/Interface/Reactor.hpp"
#include "SockCAN/Interface/Socket.hpp"
#include "SockCAN/Util/Error.hpp"

namespace SockCAN
{
    enum class AsyncState : uint8_t
    {
        WaitingForReadiness,
        Ready,
        Closed,
    };

    /**
     * @brief Readiness driven adapter over a non-blocking Socket
     * Each readable notification performs exactly one read and each writable
     * notification flushes one queued frame. A WouldBlock right after a
     * notification is a spurious wakeup: it is counted and the adapter waits
     * for the next notification. After close() the adapter cannot be restarted.
     */
    class AsyncSocket
    {
    public:
        using FrameHandler = std::function<void(tl::expected<Frame, Error>)>;

        static tl::expected<std::unique_ptr<AsyncSocket>, Error> create(Socket socket);

        AsyncSocket(const AsyncSocket&) = delete;
        AsyncSocket& operator=(const AsyncSocket&) = delete;
        ~AsyncSocket();

        /**
         * @brief Registers with reactor, handler receives every frame or error read
         * The reactor must outlive the adapter or the adapter must be closed first.
         */
        tl::expected<void, Error> attach(Reactor& reactor, FrameHandler handler);

        /**
         * @brief One read attempt after a readable notification
         * @return the frame, or nullopt for a spurious wakeup
         */
        tl::expected<std::optional<Frame>, Error> on_readable();

        /**
         * @brief Writes the oldest queued frame after a writable notification
         */
        tl::expected<void, Error> on_writable();

        /**
         * @brief Queues frame for the next writable notification
         */
        tl::expected<void, Error> send(const Frame& frame);

        /**
         * @brief Next element of the frame sequence, nullopt while nothing is pending
         * Fails with AlreadyClosed once the adapter is closed.
         */
        tl::expected<std::optional<Frame>, Error> poll_next();

        tl::expected<void, Error> close();

        // epoll events the adapter currently waits for
        [[nodiscard]] uint32_t interest() const noexcept;
        [[nodiscard]] AsyncState state() const noexcept { return current; }
        [[nodiscard]] uint64_t spurious_wakeups() const noexcept { return spurious; }
        [[nodiscard]] size_t pending_writes() const noexcept { return outgoing.size(); }
        [[nodiscard]] int get_sock_fd() const noexcept { return socket.get_sock_fd(); }

    private:
        explicit AsyncSocket(Socket socket);

        void dispatch(uint32_t events);
        tl::expected<void, Error> rearm();

        Socket socket;
        AsyncState current{AsyncState::WaitingForReadiness};
        std::deque<Frame> outgoing;
        Reactor* reactor{};
        FrameHandler handler;
        uint64_t spurious{};
        // expires when the adapter is destroyed
        std::shared_ptr<bool> alive{std::make_shared<bool>(true)};
        xtr::sink s;
    };
}

#endif //SOCKCAN_ASYNC_SOCKET_HPP
