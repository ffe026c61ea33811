#include <array>
#include <iostream>
#include <vector>

#include "SockCAN/Frame/Frame.hpp"
#include "SockCAN/Frame/FrameConvertible.hpp"
#include "TestUtil.hpp"

using namespace SockCAN;
using Test::check, Test::fails_with;

namespace
{
    struct MotorCommand
    {
        uint16_t current;

        explicit operator Frame() const
        {
            const std::array<uint8_t, 2> payload{static_cast<uint8_t>(current >> 8), static_cast<uint8_t>(current)};
            return DataFrame::create(*CanId::standard(0x200), payload).value();
        }

        MotorCommand() = default;

        explicit MotorCommand(const Frame& frame)
        {
            const auto data = frame_data(frame);
            current = data.size() >= 2 ? static_cast<uint16_t>(data[0] << 8 | data[1]) : 0;
        }
    };

    static_assert(FrameConvertible<MotorCommand>);
}

int main()
{
    std::cout << "--- SockCAN Frame Test ---" << std::endl;

    const CanId id = *CanId::standard(0x123);

    std::cout << "\nTEST 1: Classic payload lengths" << std::endl;
    const std::array<uint8_t, 9> nine{};
    check(fails_with(DataFrame::create(id, nine), ErrorCode::InvalidPayloadLength), "9 byte data frame rejected");
    const std::array<uint8_t, 3> three{1, 2, 3};
    const auto data = DataFrame::create(id, three);
    check(data && data->len() == 3 && data->data().size() == 3 && data->data()[2] == 3,
          "declared length equals payload size");

    std::cout << "\nTEST 2: FD step lengths" << std::endl;
    bool steps_ok = true;
    for (const size_t len : {0, 1, 2, 3, 4, 5, 6, 7, 8, 12, 16, 20, 24, 32, 48, 64})
    {
        const std::vector<uint8_t> payload(len, 0xAA);
        const auto frame = FdFrame::create(id, payload, FD_BRS);
        steps_ok = steps_ok && frame && frame->len() == len && frame->is_brs() && (frame->flags() & FD_FDF);
    }
    check(steps_ok, "every FD step builds a frame with FDF set");
    const std::vector<uint8_t> ten(10);
    check(fails_with(FdFrame::create(id, ten), ErrorCode::InvalidPayloadLength), "10 bytes is not an FD step");

    std::cout << "\nTEST 3: Length normalization" << std::endl;
    check(fd_normalize_length(9).value_or(0) == 12, "9 rounds up to 12");
    check(fd_normalize_length(50).value_or(0) == 64, "50 rounds up to 64");
    check(fd_normalize_length(16).value_or(0) == 16, "16 stays 16");
    check(fails_with(fd_normalize_length(65), ErrorCode::InvalidPayloadLength), "65 cannot be normalized");
    const std::vector<uint8_t> thirteen(13, 0x11);
    const auto padded = FdFrame::create_padded(id, thirteen);
    check(padded && padded->len() == 16 && padded->data()[12] == 0x11 && padded->data()[13] == 0,
          "create_padded zero-fills up to the next step");

    std::cout << "\nTEST 4: DLC helpers" << std::endl;
    check(fd_len_to_dlc(12).value_or(0) == 9 && fd_len_to_dlc(64).value_or(0) == 15, "lengths map to DLC codes");
    check(fd_dlc_to_len(13) == 32 && fd_dlc_to_len(8) == 8, "DLC codes map to lengths");

    std::cout << "\nTEST 5: Variant selection from the ID word" << std::endl;
    const auto remote = make_frame(RTR_FLAG | 0x321, std::span<const uint8_t>{three});
    check(remote && std::holds_alternative<RemoteFrame>(*remote) && frame_len(*remote) == 3 &&
          frame_data(*remote).empty(), "RTR word builds a remote frame without bytes");
    const std::array<uint8_t, 8> err_payload{0, 0x04};
    const auto error = make_frame(ERR_FLAG | 0x004, err_payload);
    check(error && std::holds_alternative<ErrorFrame>(*error) &&
          std::get<ErrorFrame>(*error).error_class() == 0x004, "ERR word builds an error frame");
    const std::vector<uint8_t> twenty(20);
    const auto fd = make_frame(EFF_FLAG | 0x1ABCDEF, twenty);
    check(fd && is_fd(*fd) && frame_id(*fd).is_extended(), "long payload builds an FD frame");
    check(fails_with(DataFrame::create(*CanId::error(0x4), three), ErrorCode::VariantMismatch),
          "data frame refuses an error identifier");
    check(fails_with(RemoteFrame::create(id, 9), ErrorCode::InvalidPayloadLength), "remote DLC above 8 rejected");

    std::cout << "\nTEST 6: Text rendering" << std::endl;
    check(to_string(Frame{*data}) == "123#010203", "classic data frame text");
    check(remote && to_string(*remote) == "321#R3", "remote frame text");
    const std::array<uint8_t, 2> two{0xAA, 0xBB};
    const auto brs = FdFrame::create(id, two, FD_BRS);
    check(brs && to_string(Frame{*brs}) == "123##1AABB", "FD frame text carries the flag nibble");

    std::cout << "\nTEST 7: FrameConvertible user types" << std::endl;
    MotorCommand command;
    command.current = 0x1234;
    const auto frame = static_cast<Frame>(command);
    check(static_cast<MotorCommand>(frame).current == 0x1234, "user type converts through Frame and back");

    return Test::finish("Frame");
}
