#include "SockCAN/Util/Error.hpp"

#include <cerrno>
#include <format>
#include <system_error>

namespace SockCAN
{
    ErrorCategory Error::category() const noexcept
    {
        switch (code)
        {
        case ErrorCode::IdentifierOutOfRange:
        case ErrorCode::InvalidPayloadLength:
        case ErrorCode::VariantMismatch:
        case ErrorCode::InvalidParameter:
        case ErrorCode::ErrorFrameDecodeError:
            return ErrorCategory::Validation;
        case ErrorCode::Truncated:
        case ErrorCode::FrameTooLargeForMode:
            return ErrorCategory::DataIntegrity;
        case ErrorCode::NetlinkError:
        case ErrorCode::NetlinkTimeout:
        case ErrorCode::MalformedResponse:
            return ErrorCategory::Protocol;
        default:
            return ErrorCategory::Io;
        }
    }

    std::string_view to_string(const ErrorCode code) noexcept
    {
        switch (code)
        {
        case ErrorCode::IdentifierOutOfRange: return "IdentifierOutOfRange";
        case ErrorCode::InvalidPayloadLength: return "InvalidPayloadLength";
        case ErrorCode::VariantMismatch: return "VariantMismatch";
        case ErrorCode::InvalidParameter: return "InvalidParameter";
        case ErrorCode::ErrorFrameDecodeError: return "ErrorFrameDecodeError";
        case ErrorCode::NoSuchInterface: return "NoSuchInterface";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::IoFailure: return "IoFailure";
        case ErrorCode::WouldBlock: return "WouldBlock";
        case ErrorCode::Interrupted: return "Interrupted";
        case ErrorCode::Truncated: return "Truncated";
        case ErrorCode::FrameTooLargeForMode: return "FrameTooLargeForMode";
        case ErrorCode::AlreadyClosed: return "AlreadyClosed";
        case ErrorCode::NetlinkError: return "NetlinkError";
        case ErrorCode::NetlinkTimeout: return "NetlinkTimeout";
        case ErrorCode::MalformedResponse: return "MalformedResponse";
        case ErrorCode::NlSocketAllocError: return "NlSocketAllocError";
        case ErrorCode::NlConnectError: return "NlConnectError";
        case ErrorCode::RtnlLinkAllocError: return "RtnlLinkAllocError";
        case ErrorCode::VCANCreationError: return "VCANCreationError";
        case ErrorCode::EpollError: return "EpollError";
        }
        return "Unknown";
    }

    Error os_error(const ErrorCode code, const std::string_view what)
    {
        const int err = errno;
        return Error{code, std::format("{}: {}", what, std::generic_category().message(err)), err};
    }
}
