#include "SockCAN/Frame/CanError.hpp"

#include <format>
#include <string_view>

using tl::unexpected, std::format, std::string_view;

namespace SockCAN
{
    namespace
    {
        tl::expected<uint8_t, Error> byte_at(const ErrorFrame& frame, const size_t index)
        {
            if (index >= frame.len())
            {
                return unexpected(Error{
                    ErrorCode::ErrorFrameDecodeError,
                    format("Error frame carries {} bytes, detail needs byte {}", frame.len(), index)
                });
            }
            return frame.data()[index];
        }

        Error invalid_detail(const string_view what, const uint8_t value)
        {
            return Error{ErrorCode::ErrorFrameDecodeError, format("Invalid {} code {:#04x}", what, value)};
        }

        tl::expected<ControllerProblem, Error> to_controller_problem(const uint8_t value)
        {
            switch (value)
            {
            case 0x00:
            case 0x01:
            case 0x02:
            case 0x04:
            case 0x08:
            case 0x10:
            case 0x20:
            case 0x40:
                return static_cast<ControllerProblem>(value);
            default:
                return unexpected(invalid_detail("controller problem", value));
            }
        }

        tl::expected<ViolationType, Error> to_violation_type(const uint8_t value)
        {
            switch (value)
            {
            case 0x00:
            case 0x01:
            case 0x02:
            case 0x04:
            case 0x08:
            case 0x10:
            case 0x20:
            case 0x40:
            case 0x80:
                return static_cast<ViolationType>(value);
            default:
                return unexpected(invalid_detail("violation type", value));
            }
        }

        tl::expected<ViolationLocation, Error> to_violation_location(const uint8_t value)
        {
            switch (value)
            {
            case 0x00:
            case 0x02:
            case 0x03:
            case 0x04:
            case 0x05:
            case 0x06:
            case 0x07:
            case 0x08:
            case 0x09:
            case 0x0A:
            case 0x0B:
            case 0x0C:
            case 0x0D:
            case 0x0E:
            case 0x0F:
            case 0x12:
            case 0x18:
            case 0x19:
            case 0x1A:
            case 0x1B:
                return static_cast<ViolationLocation>(value);
            default:
                return unexpected(invalid_detail("violation location", value));
            }
        }

        tl::expected<TransceiverStatus, Error> to_transceiver_status(const uint8_t value)
        {
            switch (value)
            {
            case 0x00:
            case 0x04:
            case 0x05:
            case 0x06:
            case 0x07:
            case 0x40:
            case 0x50:
            case 0x60:
            case 0x70:
            case 0x80:
                return static_cast<TransceiverStatus>(value);
            default:
                return unexpected(invalid_detail("transceiver status", value));
            }
        }

        string_view describe(const ControllerProblem problem)
        {
            switch (problem)
            {
            case ControllerProblem::RxOverflow: return "receive buffer overflow";
            case ControllerProblem::TxOverflow: return "transmit buffer overflow";
            case ControllerProblem::RxWarning: return "error warning (receive)";
            case ControllerProblem::TxWarning: return "error warning (transmit)";
            case ControllerProblem::RxPassive: return "error passive (receive)";
            case ControllerProblem::TxPassive: return "error passive (transmit)";
            case ControllerProblem::Active: return "error active";
            default: return "unspecified";
            }
        }

        string_view describe(const ViolationType type)
        {
            switch (type)
            {
            case ViolationType::SingleBit: return "single bit error";
            case ViolationType::FrameFormat: return "frame format error";
            case ViolationType::BitStuffing: return "bit stuffing error";
            case ViolationType::Bit0: return "unable to send dominant bit";
            case ViolationType::Bit1: return "unable to send recessive bit";
            case ViolationType::Overload: return "bus overload";
            case ViolationType::Active: return "active error announcement";
            case ViolationType::Tx: return "transmission error";
            default: return "unspecified";
            }
        }
    }

    tl::expected<CanError, Error> CanError::from_frame(const ErrorFrame& frame)
    {
        CanError error{};
        error.error_class = static_cast<ErrorClass>(frame.error_class());

        switch (frame.error_class())
        {
        case 0x001:
        case 0x020:
        case 0x040:
        case 0x080:
        case 0x100:
            return error;
        case 0x010:
            // drivers without transceiver diagnostics send no detail byte
            if (frame.len() <= 4)
            {
                return error;
            }
            return to_transceiver_status(frame.data()[4]).map([&](const TransceiverStatus status)
            {
                error.transceiver = status;
                return error;
            });
        case 0x002:
            return byte_at(frame, 0).map([&](const uint8_t bit)
            {
                error.arbitration_bit = bit;
                return error;
            });
        case 0x004:
            return byte_at(frame, 1).and_then(to_controller_problem).map([&](const ControllerProblem problem)
            {
                error.controller = problem;
                return error;
            });
        case 0x008:
            return byte_at(frame, 2).and_then(to_violation_type)
                                    .and_then([&](const ViolationType type)
                                    {
                                        error.violation = type;
                                        return byte_at(frame, 3).and_then(to_violation_location);
                                    })
                                    .map([&](const ViolationLocation location)
                                    {
                                        error.location = location;
                                        return error;
                                    });
        default:
            return unexpected(Error{
                ErrorCode::ErrorFrameDecodeError, format("Unknown error class {:#x}", frame.error_class())
            });
        }
    }

    tl::expected<ErrorCounters, Error> error_counters(const ErrorFrame& frame)
    {
        return byte_at(frame, 6).and_then([&](const uint8_t tx)
        {
            return byte_at(frame, 7).map([&](const uint8_t rx) { return ErrorCounters{tx, rx}; });
        });
    }

    std::string to_string(const CanError& error)
    {
        switch (error.error_class)
        {
        case ErrorClass::TxTimeout:
            return "transmission timeout";
        case ErrorClass::LostArbitration:
            return format("arbitration lost after {} bits", error.arbitration_bit);
        case ErrorClass::Controller:
            return format("controller problem: {}", describe(error.controller));
        case ErrorClass::ProtocolViolation:
            return format("protocol violation at location {:#04x}: {}", static_cast<uint8_t>(error.location),
                          describe(error.violation));
        case ErrorClass::Transceiver:
            return format("transceiver error {:#04x}", static_cast<uint8_t>(error.transceiver));
        case ErrorClass::NoAck:
            return "no ack";
        case ErrorClass::BusOff:
            return "bus off";
        case ErrorClass::BusError:
            return "bus error";
        case ErrorClass::Restarted:
            return "restarted";
        default:
            return format("unknown error class {:#x}", static_cast<uint32_t>(error.error_class));
        }
    }
}
