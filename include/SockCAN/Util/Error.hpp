#ifndef SOCKCAN_ERROR_HPP
#define SOCKCAN_ERROR_HPP

#include <string>
#include <string_view>
#include <utility>

namespace SockCAN
{
    enum class ErrorCode
    {
        // Validation
        IdentifierOutOfRange,
        InvalidPayloadLength,
        VariantMismatch,
        InvalidParameter,
        ErrorFrameDecodeError,

        // Socket
        NoSuchInterface,
        PermissionDenied,
        IoFailure,
        WouldBlock,
        Interrupted,
        Truncated,
        FrameTooLargeForMode,
        AlreadyClosed,

        // Netlink
        NetlinkError,
        NetlinkTimeout,
        MalformedResponse,
        NlSocketAllocError,
        NlConnectError,
        RtnlLinkAllocError,
        VCANCreationError,

        // Reactor
        EpollError,
    };

    enum class ErrorCategory
    {
        Validation,
        Io,
        Protocol,
        DataIntegrity,
    };

    struct Error
    {
        Error(const ErrorCode c, std::string msg, const int os_err = 0) : code(c), message(std::move(msg)),
                                                                           os_error(os_err)
        {
        }

        [[nodiscard]] ErrorCategory category() const noexcept;

        ErrorCode code;
        std::string message;
        // errno of the failing syscall, or the positive errno reported by the kernel over netlink
        int os_error;
    };

    std::string_view to_string(ErrorCode code) noexcept;

    /**
     * @brief Builds an Error from the current errno
     */
    Error os_error(ErrorCode code, std::string_view what);
}
#endif //SOCKCAN_ERROR_HPP
