#include "SockCAN/Frame/Codec.hpp"
#include "SockCAN/Util/ByteOrder.hpp"

#include <algorithm>
#include <format>

using tl::unexpected, std::format, std::span;

namespace SockCAN
{
    namespace
    {
        void write_header(const span<uint8_t> out, const uint32_t word, const uint8_t len, const uint8_t flags)
        {
            Util::store_u32(out, Wire::ID_OFFSET, word);
            out[Wire::LEN_OFFSET] = len;
            out[Wire::FLAGS_OFFSET] = flags;
            out[Wire::RES0_OFFSET] = 0;
            out[Wire::RES1_OFFSET] = 0;
        }

        tl::expected<Frame, Error> decode_classic(const span<const uint8_t> bytes)
        {
            const uint32_t word = Util::load_u32(bytes, Wire::ID_OFFSET);
            const uint8_t len = bytes[Wire::LEN_OFFSET];
            if (bytes[Wire::FLAGS_OFFSET] & FD_FDF)
            {
                return unexpected(Error{ErrorCode::VariantMismatch, "FD format marker set in a classic frame"});
            }
            if (len > CAN_MAX_DLEN)
            {
                return unexpected(Error{
                    ErrorCode::InvalidPayloadLength, format("Classic frame declares {} bytes", len)
                });
            }
            return make_frame(word, bytes.subspan(Wire::DATA_OFFSET, len));
        }

        tl::expected<Frame, Error> decode_fd(const span<const uint8_t> bytes)
        {
            const uint32_t word = Util::load_u32(bytes, Wire::ID_OFFSET);
            const uint8_t len = bytes[Wire::LEN_OFFSET];
            const uint8_t flags = bytes[Wire::FLAGS_OFFSET];
            if (word & (RTR_FLAG | ERR_FLAG))
            {
                return unexpected(Error{
                    ErrorCode::VariantMismatch, format("FD frame with RTR/ERR bits in ID word {:#010x}", word)
                });
            }
            if (!is_valid_fd_length(len))
            {
                return unexpected(Error{
                    ErrorCode::InvalidPayloadLength, format("FD frame declares {} bytes", len)
                });
            }
            return FdFrame::from_raw_id(word, bytes.subspan(Wire::DATA_OFFSET, len), flags)
                .map([](FdFrame frame) { return Frame{frame}; });
        }
    }

    tl::expected<size_t, Error> encode(const Frame& frame, const FrameMode mode,
                                       const span<uint8_t, CANFD_MTU> out)
    {
        std::ranges::fill(out, 0);
        const auto data = frame_data(frame);

        if (const auto* fd = std::get_if<FdFrame>(&frame))
        {
            if (mode != FrameMode::Fd)
            {
                return unexpected(Error{
                    ErrorCode::FrameTooLargeForMode, "FD frame cannot be written to a classic socket"
                });
            }
            write_header(out, fd->id().packed(), fd->len(), fd->flags());
            std::ranges::copy(data, out.begin() + Wire::DATA_OFFSET);
            return CANFD_MTU;
        }

        write_header(out, frame_id(frame).packed(), frame_len(frame), 0);
        std::ranges::copy(data, out.begin() + Wire::DATA_OFFSET);
        return CAN_MTU;
    }

    tl::expected<Frame, Error> decode(const span<const uint8_t> bytes, const FrameMode mode)
    {
        if (bytes.size() == CAN_MTU)
        {
            return decode_classic(bytes);
        }
        if (bytes.size() == CANFD_MTU && mode == FrameMode::Fd)
        {
            return decode_fd(bytes);
        }
        return unexpected(Error{
            ErrorCode::Truncated, format("Unexpected frame size {} for {} socket", bytes.size(),
                                         mode == FrameMode::Fd ? "FD" : "classic")
        });
    }
}
