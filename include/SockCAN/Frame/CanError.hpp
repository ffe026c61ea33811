#ifndef SOCKCAN_CAN_ERROR_HPP
#define SOCKCAN_CAN_ERROR_HPP

#include <cstdint>
#include <string>

#include <tl/expected.hpp>
#include "SockCAN/Frame/Frame.hpp"
#include "SockCAN/Util/Error.hpp"

namespace SockCAN
{
    // Error class bits carried in the ID of an error frame (linux/can/error.h)
    enum class ErrorClass : uint32_t
    {
        TxTimeout = 0x00000001,
        LostArbitration = 0x00000002,
        Controller = 0x00000004,
        ProtocolViolation = 0x00000008,
        Transceiver = 0x00000010,
        NoAck = 0x00000020,
        BusOff = 0x00000040,
        BusError = 0x00000080,
        Restarted = 0x00000100,
        Counters = 0x00000200,
    };

    // data[1]
    enum class ControllerProblem : uint8_t
    {
        Unspecified = 0x00,
        RxOverflow = 0x01,
        TxOverflow = 0x02,
        RxWarning = 0x04,
        TxWarning = 0x08,
        RxPassive = 0x10,
        TxPassive = 0x20,
        Active = 0x40,
    };

    // data[2]
    enum class ViolationType : uint8_t
    {
        Unspecified = 0x00,
        SingleBit = 0x01,
        FrameFormat = 0x02,
        BitStuffing = 0x04,
        Bit0 = 0x08,
        Bit1 = 0x10,
        Overload = 0x20,
        Active = 0x40,
        Tx = 0x80,
    };

    // data[3]
    enum class ViolationLocation : uint8_t
    {
        Unspecified = 0x00,
        Id2821 = 0x02,
        StartOfFrame = 0x03,
        SubstituteRtr = 0x04,
        IdExtension = 0x05,
        Id2018 = 0x06,
        Id1713 = 0x07,
        CrcSequence = 0x08,
        Reserved0 = 0x09,
        DataSection = 0x0A,
        DataLength = 0x0B,
        Rtr = 0x0C,
        Reserved1 = 0x0D,
        Id0400 = 0x0E,
        Id1205 = 0x0F,
        Intermission = 0x12,
        CrcDelimiter = 0x18,
        AckSlot = 0x19,
        EndOfFrame = 0x1A,
        AckDelimiter = 0x1B,
    };

    // data[4]
    enum class TransceiverStatus : uint8_t
    {
        Unspecified = 0x00,
        CanHighNoWire = 0x04,
        CanHighShortToBat = 0x05,
        CanHighShortToVcc = 0x06,
        CanHighShortToGnd = 0x07,
        CanLowNoWire = 0x40,
        CanLowShortToBat = 0x50,
        CanLowShortToVcc = 0x60,
        CanLowShortToGnd = 0x70,
        CanLowShortToCanHigh = 0x80,
    };

    /**
     * @brief Decoded error frame
     * Only the detail fields belonging to error_class are meaningful.
     */
    struct CanError
    {
        ErrorClass error_class{};
        // bit position where arbitration was lost, 0 if unknown
        uint8_t arbitration_bit{};
        ControllerProblem controller{};
        ViolationType violation{};
        ViolationLocation location{};
        TransceiverStatus transceiver{};

        /**
         * @brief Decodes a frame reporting exactly one error class
         * Fails with ErrorFrameDecodeError on unknown classes, unknown
         * detail codes and payloads too short for the class.
         */
        static tl::expected<CanError, Error> from_frame(const ErrorFrame& frame);
    };

    struct ErrorCounters
    {
        uint8_t tx;
        uint8_t rx;
    };

    // data[6] and data[7]
    tl::expected<ErrorCounters, Error> error_counters(const ErrorFrame& frame);

    std::string to_string(const CanError& error);
}

#endif //SOCKCAN_CAN_ERROR_HPP
