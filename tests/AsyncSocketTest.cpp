#include <array>
#include <chrono>
#include <iostream>
#include <vector>
#include <unistd.h>
#include <sys/socket.h>

#include "SockCAN/Interface/AsyncSocket.hpp"
#include "SockCAN/Interface/Reactor.hpp"
#include "TestUtil.hpp"

using namespace SockCAN;
using namespace std::chrono_literals;
using Test::check, Test::fails_with;

namespace
{
    struct Adapted
    {
        std::unique_ptr<AsyncSocket> adapter;
        int peer;
    };

    tl::expected<Adapted, Error> make_adapter()
    {
        int fds[2];
        if (socketpair(AF_UNIX, SOCK_SEQPACKET, 0, fds) == -1)
        {
            return tl::unexpected(os_error(ErrorCode::IoFailure, "socketpair failed"));
        }
        return Socket::from_fd(fds[0], FrameMode::Classic)
               .and_then([](Socket socket) { return AsyncSocket::create(std::move(socket)); })
               .map([&](std::unique_ptr<AsyncSocket> adapter) { return Adapted{std::move(adapter), fds[1]}; });
    }

    Frame data_frame(const uint32_t id, const uint8_t value)
    {
        const std::array<uint8_t, 1> payload{value};
        return DataFrame::create(*CanId::standard(id), payload).value();
    }

    bool inject(const int peer, const Frame& frame)
    {
        WireBuffer buffer{};
        const auto size = encode(frame, FrameMode::Classic, buffer);
        return size && write(peer, buffer.data(), *size) == static_cast<ssize_t>(*size);
    }

    bool peer_receives(const int peer, const Frame& expected)
    {
        WireBuffer buffer{};
        const ssize_t nbytes = recv(peer, buffer.data(), buffer.size(), MSG_DONTWAIT);
        return nbytes > 0 && decode(std::span<const uint8_t>{buffer.data(), static_cast<size_t>(nbytes)},
                                    FrameMode::Classic).map([&](const Frame& f) { return f == expected; })
                                                       .value_or(false);
    }
}

int main()
{
    std::cout << "--- SockCAN Async Readiness Adapter Test ---" << std::endl;

    auto adapted = make_adapter();
    if (!adapted)
    {
        std::cerr << "FAIL: " << adapted.error().message << std::endl;
        return EXIT_FAILURE;
    }
    AsyncSocket& adapter = *adapted->adapter;
    const int peer = adapted->peer;

    std::cout << "\nTEST 1: Fresh adapter waits for read readiness" << std::endl;
    check(adapter.state() == AsyncState::WaitingForReadiness, "state is WaitingForReadiness");
    check(adapter.interest() == EPOLLIN, "only read interest without queued frames");

    std::cout << "\nTEST 2: WouldBlock after a notification is a spurious wakeup" << std::endl;
    const auto spurious = adapter.on_readable();
    check(spurious && !*spurious, "no frame and no error");
    check(adapter.spurious_wakeups() == 1 && adapter.state() == AsyncState::WaitingForReadiness,
          "wakeup counted, adapter waits again");

    std::cout << "\nTEST 3: One read per notification" << std::endl;
    (void)inject(peer, data_frame(0x10, 1));
    (void)inject(peer, data_frame(0x11, 2));
    const auto first = adapter.on_readable();
    check(first && *first && **first == data_frame(0x10, 1), "first notification yields the first frame");
    const auto second = adapter.on_readable();
    check(second && *second && **second == data_frame(0x11, 2), "second notification yields the second frame");

    std::cout << "\nTEST 4: poll_next" << std::endl;
    const auto pending = adapter.poll_next();
    check(pending && !*pending, "pending while nothing is queued");
    (void)inject(peer, data_frame(0x12, 3));
    const auto next = adapter.poll_next();
    check(next && *next && **next == data_frame(0x12, 3), "next frame of the sequence");

    std::cout << "\nTEST 5: Writes wait for write readiness" << std::endl;
    const std::vector<uint8_t> twelve(12);
    const Frame fd = *FdFrame::create(*CanId::standard(0x20), twelve);
    check(fails_with(adapter.send(fd), ErrorCode::FrameTooLargeForMode), "FD frame refused on classic adapter");
    check(adapter.send(data_frame(0x30, 4)).has_value() && adapter.pending_writes() == 1, "frame queued");
    check(adapter.interest() == (EPOLLIN | EPOLLOUT), "write interest while frames are queued");
    check(adapter.on_writable().has_value() && adapter.pending_writes() == 0, "one frame flushed");
    check(peer_receives(peer, data_frame(0x30, 4)), "peer received the queued frame");
    check(adapter.on_writable().has_value(), "writable notification with an empty queue is harmless");

    std::cout << "\nTEST 6: Closed adapters stay closed" << std::endl;
    check(adapter.close().has_value() && adapter.state() == AsyncState::Closed, "adapter closed");
    check(fails_with(adapter.on_readable(), ErrorCode::AlreadyClosed), "no reads after close");
    check(fails_with(adapter.poll_next(), ErrorCode::AlreadyClosed), "sequence ends after close");
    check(fails_with(adapter.send(data_frame(0x31, 5)), ErrorCode::AlreadyClosed), "no sends after close");
    check(fails_with(adapter.close(), ErrorCode::AlreadyClosed), "second close fails");
    close(peer);

    std::cout << "\nTEST 7: Driven by the epoll reactor" << std::endl;
    Reactor reactor;
    auto driven = make_adapter();
    if (!driven)
    {
        std::cerr << "FAIL: " << driven.error().message << std::endl;
        return EXIT_FAILURE;
    }
    std::vector<Frame> frames;
    size_t errors = 0;
    check(driven->adapter->attach(reactor, [&](tl::expected<Frame, Error> result)
    {
        if (result)
        {
            frames.push_back(std::move(*result));
        }
        else
        {
            ++errors;
        }
    }).has_value(), "adapter attached");
    check(reactor.size() == 1, "descriptor registered");

    check(reactor.run_once(20ms).value_or(1) == 0, "nothing ready times out");
    (void)inject(driven->peer, data_frame(0x40, 1));
    (void)inject(driven->peer, data_frame(0x41, 2));
    check(reactor.run_once(100ms).value_or(0) == 1 && frames.size() == 1, "one frame per readiness round");
    check(reactor.run_once(100ms).value_or(0) == 1 && frames.size() == 2 && frames[1] == data_frame(0x41, 2),
          "re-registered adapter delivers the next frame");

    check(driven->adapter->send(data_frame(0x50, 9)).has_value(), "frame queued on attached adapter");
    check(reactor.run_once(100ms).value_or(0) == 1 && driven->adapter->pending_writes() == 0,
          "write readiness flushed the queue");
    check(peer_receives(driven->peer, data_frame(0x50, 9)), "peer received the frame");
    check(errors == 0, "no errors reported to the handler");

    check(reactor.wake().has_value() && reactor.run_once(1000ms).value_or(1) == 0, "wake interrupts the wait");

    check(driven->adapter->close().has_value() && reactor.size() == 0, "close unregisters from the reactor");
    close(driven->peer);

    std::cout << "\nTEST 8: Handler may close its adapter" << std::endl;
    auto self_closing = make_adapter();
    if (self_closing)
    {
        AsyncSocket* raw = self_closing->adapter.get();
        bool closed_inside = false;
        (void)raw->attach(reactor, [&](const tl::expected<Frame, Error>&)
        {
            closed_inside = raw->close().has_value();
        });
        (void)inject(self_closing->peer, data_frame(0x60, 1));
        check(reactor.run_once(100ms).value_or(0) == 1 && closed_inside && raw->state() == AsyncState::Closed,
              "adapter closed from its own handler");
        check(reactor.size() == 0, "closed adapter left the reactor");
        close(self_closing->peer);
    }

    std::cout << "\nTEST 9: Handler may destroy its adapter" << std::endl;
    auto dropped = make_adapter();
    if (dropped)
    {
        std::unique_ptr<AsyncSocket> owner = std::move(dropped->adapter);
        size_t delivered = 0;
        (void)owner->attach(reactor, [&](const tl::expected<Frame, Error>&)
        {
            ++delivered;
            owner.reset();
        });
        (void)inject(dropped->peer, data_frame(0x61, 1));
        check(reactor.run_once(100ms).value_or(0) == 1 && delivered == 1 && !owner,
              "adapter destroyed from its own handler");
        check(reactor.size() == 0, "destroyed adapter left the reactor");
        close(dropped->peer);
    }

    std::cout << "\nTEST 10: Peer hang-up reaches the handler" << std::endl;
    auto hung = make_adapter();
    if (hung)
    {
        AsyncSocket* raw = hung->adapter.get();
        std::vector<ErrorCode> failures;
        (void)raw->attach(reactor, [&](const tl::expected<Frame, Error>& result)
        {
            if (!result)
            {
                failures.push_back(result.error().code);
                (void)raw->close();
            }
        });
        close(hung->peer);
        check(reactor.run_once(100ms).value_or(0) == 1 && failures.size() == 1, "hang-up delivered as an error");
        check(!failures.empty() && failures[0] == ErrorCode::Truncated, "zero-byte read reported as Truncated");
        check(raw->state() == AsyncState::Closed && reactor.size() == 0, "handler closed the adapter");
    }

    return Test::finish("Async Readiness Adapter");
}
