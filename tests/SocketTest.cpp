#include <array>
#include <chrono>
#include <iostream>
#include <vector>
#include <unistd.h>
#include <sys/socket.h>

#include "SockCAN/Interface/Socket.hpp"
#include "TestUtil.hpp"

using namespace SockCAN;
using Test::check, Test::fails_with;

namespace
{
    struct Heartbeat
    {
        uint8_t node{};
        uint8_t state{};

        Heartbeat() = default;

        Heartbeat(const uint8_t node, const uint8_t state) : node(node), state(state)
        {
        }

        explicit Heartbeat(const Frame& frame) : node(static_cast<uint8_t>(frame_id(frame).value() - 0x700)),
                                                  state(frame_data(frame).empty() ? 0 : frame_data(frame)[0])
        {
        }

        explicit operator Frame() const
        {
            const std::array<uint8_t, 1> payload{state};
            return DataFrame::create(*CanId::standard(0x700 + node), payload).value();
        }
    };

    bool inject(const int peer, const Frame& frame, const FrameMode mode)
    {
        WireBuffer buffer{};
        const auto size = encode(frame, mode, buffer);
        return size && write(peer, buffer.data(), *size) == static_cast<ssize_t>(*size);
    }

    // one end adopted as a Socket, the other left raw to play the kernel
    struct Pair
    {
        Socket socket;
        int peer;
    };

    tl::expected<Pair, Error> make_pair(const FrameMode mode)
    {
        int fds[2];
        if (socketpair(AF_UNIX, SOCK_SEQPACKET, 0, fds) == -1)
        {
            return tl::unexpected(os_error(ErrorCode::IoFailure, "socketpair failed"));
        }
        return Socket::from_fd(fds[0], mode).map([&](Socket socket) { return Pair{std::move(socket), fds[1]}; });
    }
}

int main()
{
    std::cout << "--- SockCAN Socket Test ---" << std::endl;

    auto classic = make_pair(FrameMode::Classic);
    if (!classic)
    {
        std::cerr << "FAIL: " << classic.error().message << std::endl;
        return EXIT_FAILURE;
    }
    Socket& socket = classic->socket;
    const int peer = classic->peer;

    std::cout << "\nTEST 1: Non-blocking read without traffic" << std::endl;
    check(socket.set_nonblocking(true).has_value() && socket.is_nonblocking(), "socket switched to non-blocking");
    check(fails_with(socket.read_frame(), ErrorCode::WouldBlock), "empty socket reports WouldBlock");

    std::cout << "\nTEST 2: Injected frame comes back unchanged" << std::endl;
    const std::array<uint8_t, 3> payload{1, 2, 3};
    const Frame sent = *DataFrame::create(*CanId::standard(0x123), payload);
    check(inject(peer, sent, FrameMode::Classic), "frame injected");
    const auto received = socket.read_frame();
    check(received && *received == sent, "read_frame returns the injected frame");

    std::cout << "\nTEST 3: write_frame produces the kernel layout" << std::endl;
    const Frame remote = *RemoteFrame::create(*CanId::extended(0x1234567), 2);
    check(socket.write_frame(remote).has_value(), "remote frame written");
    std::array<uint8_t, CANFD_MTU> raw{};
    const ssize_t nbytes = read(peer, raw.data(), raw.size());
    check(nbytes == static_cast<ssize_t>(CAN_MTU), "16 bytes reach the peer");
    check(nbytes > 0 && decode(std::span<const uint8_t>{raw.data(), static_cast<size_t>(nbytes)}, FrameMode::Classic)
                        .map([&](const Frame& f) { return f == remote; }).value_or(false),
          "peer bytes decode to the written frame");

    std::cout << "\nTEST 4: Mode and size checks" << std::endl;
    const std::vector<uint8_t> twelve(12, 0x5A);
    const Frame fd = *FdFrame::create(*CanId::standard(0x42), twelve, FD_BRS);
    check(fails_with(socket.write_frame(fd), ErrorCode::FrameTooLargeForMode), "FD frame on classic socket rejected");
    const std::array<uint8_t, 10> odd{};
    check(write(peer, odd.data(), odd.size()) == static_cast<ssize_t>(odd.size()), "10 byte datagram injected");
    check(fails_with(socket.read_frame(), ErrorCode::Truncated), "odd sized datagram is truncated");

    std::cout << "\nTEST 5: Options the transport rejects" << std::endl;
    const std::array<Filter, 1> filters{Filter{0x100, 0x700}};
    check(fails_with(socket.set_filters(filters), ErrorCode::IoFailure), "CAN filter on a non-CAN socket fails");

    std::cout << "\nTEST 6: flush drains queued frames" << std::endl;
    for (int i = 0; i < 3; ++i)
    {
        (void)inject(peer, sent, FrameMode::Classic);
    }
    check(socket.flush().value_or(0) == 3, "three frames dropped");
    check(fails_with(socket.read_frame(), ErrorCode::WouldBlock), "nothing left after flush");

    std::cout << "\nTEST 7: FrameConvertible read and write" << std::endl;
    check(socket.write(Heartbeat{5, 0x7F}).has_value(), "user type written");
    const ssize_t hb_bytes = read(peer, raw.data(), raw.size());
    check(hb_bytes == static_cast<ssize_t>(CAN_MTU) && raw[Wire::DATA_OFFSET] == 0x7F, "heartbeat on the wire");
    (void)inject(peer, static_cast<Frame>(Heartbeat{9, 0x05}), FrameMode::Classic);
    const auto heartbeat = socket.read<Heartbeat>();
    check(heartbeat && heartbeat->node == 9 && heartbeat->state == 0x05, "user type read back");

    std::cout << "\nTEST 8: Read timeout on a blocking socket" << std::endl;
    check(socket.set_nonblocking(false).has_value(), "socket back to blocking");
    check(socket.set_read_timeout(std::chrono::milliseconds(50)).has_value(), "50 ms receive timeout set");
    check(fails_with(socket.read_frame(), ErrorCode::WouldBlock), "timed out read reports WouldBlock");

    std::cout << "\nTEST 9: Strict close" << std::endl;
    check(socket.close().has_value() && !socket.is_open(), "first close releases the descriptor");
    check(fails_with(socket.close(), ErrorCode::AlreadyClosed), "second close fails");
    check(fails_with(socket.read_frame(), ErrorCode::AlreadyClosed), "read after close fails");
    check(fails_with(socket.write_frame(sent), ErrorCode::AlreadyClosed), "write after close fails");
    close(peer);

    std::cout << "\nTEST 10: FD socket carries both layouts" << std::endl;
    auto fd_pair = make_pair(FrameMode::Fd);
    if (fd_pair)
    {
        check(fd_pair->socket.write_frame(fd).has_value(), "FD frame written on FD socket");
        const ssize_t fd_bytes = read(fd_pair->peer, raw.data(), raw.size());
        check(fd_bytes == static_cast<ssize_t>(CANFD_MTU) && raw[Wire::FLAGS_OFFSET] == (FD_BRS | FD_FDF),
              "72 bytes with BRS and FDF reach the peer");
        (void)inject(fd_pair->peer, fd, FrameMode::Fd);
        (void)inject(fd_pair->peer, sent, FrameMode::Fd);
        const auto first = fd_pair->socket.read_frame();
        const auto second = fd_pair->socket.read_frame();
        check(first && *first == fd, "FD frame read back with flags");
        check(second && *second == sent, "classic frame read on FD socket");
        close(fd_pair->peer);
    }
    else
    {
        check(false, fd_pair.error().message);
    }

    std::cout << "\nTEST 11: Moved-from sockets own nothing" << std::endl;
    auto moved_pair = make_pair(FrameMode::Classic);
    if (moved_pair)
    {
        Socket moved = std::move(moved_pair->socket);
        check(moved.is_open() && !moved_pair->socket.is_open(), "descriptor follows the move");
        check(fails_with(moved_pair->socket.close(), ErrorCode::AlreadyClosed), "moved-from socket is closed");
        close(moved_pair->peer);
    }

    return Test::finish("Socket");
}
