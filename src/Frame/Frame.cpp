#include "SockCAN/Frame/Frame.hpp"

#include <algorithm>
#include <format>

using tl::unexpected, std::format, std::span;

namespace SockCAN
{
    namespace
    {
        constexpr std::array<uint8_t, 16> FD_STEPS = {0, 1, 2, 3, 4, 5, 6, 7, 8, 12, 16, 20, 24, 32, 48, 64};

        tl::expected<void, Error> check_classic_length(const size_t len)
        {
            if (len > CAN_MAX_DLEN)
            {
                return unexpected(Error{
                    ErrorCode::InvalidPayloadLength, format("Classic payload of {} bytes exceeds 8", len)
                });
            }
            return {};
        }

        tl::expected<void, Error> check_data_id(const CanId id)
        {
            if (id.is_remote() || id.is_error())
            {
                return unexpected(Error{
                    ErrorCode::VariantMismatch, format("Identifier {:#x} is not a data identifier", id.packed())
                });
            }
            return {};
        }
    }

    tl::expected<DataFrame, Error> DataFrame::create(const CanId id, const span<const uint8_t> payload)
    {
        return check_data_id(id)
               .and_then([&] { return check_classic_length(payload.size()); })
               .map([&]
               {
                   DataFrame frame{id, static_cast<uint8_t>(payload.size())};
                   std::ranges::copy(payload, frame.data_.begin());
                   return frame;
               });
    }

    tl::expected<DataFrame, Error> DataFrame::from_raw_id(const uint32_t word, const span<const uint8_t> payload)
    {
        return CanId::from_packed(word).and_then([&](const CanId id) { return create(id, payload); });
    }

    tl::expected<RemoteFrame, Error> RemoteFrame::create(const CanId id, const uint8_t dlc)
    {
        if (id.is_error())
        {
            return unexpected(Error{ErrorCode::VariantMismatch, "Remote frame cannot carry an error identifier"});
        }
        if (dlc > CAN_MAX_DLEN)
        {
            return unexpected(Error{
                ErrorCode::InvalidPayloadLength, format("Remote frame DLC {} exceeds 8", dlc)
            });
        }
        return CanId::remote(id).map([&](const CanId rid) { return RemoteFrame{rid, dlc}; });
    }

    tl::expected<RemoteFrame, Error> RemoteFrame::from_raw_id(const uint32_t word, const uint8_t dlc)
    {
        return CanId::from_packed(word).and_then([&](const CanId id) { return create(id, dlc); });
    }

    tl::expected<ErrorFrame, Error> ErrorFrame::create(const CanId id, const span<const uint8_t> payload)
    {
        if (!id.is_error())
        {
            return unexpected(Error{
                ErrorCode::VariantMismatch, format("Identifier {:#x} is not an error identifier", id.packed())
            });
        }
        return check_classic_length(payload.size()).map([&]
        {
            ErrorFrame frame{id, static_cast<uint8_t>(payload.size())};
            std::ranges::copy(payload, frame.data_.begin());
            return frame;
        });
    }

    tl::expected<ErrorFrame, Error> ErrorFrame::from_raw_id(const uint32_t word, const span<const uint8_t> payload)
    {
        return CanId::from_packed(word).and_then([&](const CanId id) { return create(id, payload); });
    }

    tl::expected<FdFrame, Error> FdFrame::create(const CanId id, const span<const uint8_t> payload,
                                                 const uint8_t flags)
    {
        if (!is_valid_fd_length(payload.size()))
        {
            return unexpected(Error{
                ErrorCode::InvalidPayloadLength, format("{} is not a valid FD payload length", payload.size())
            });
        }
        return check_data_id(id).map([&]
        {
            FdFrame frame{id, static_cast<uint8_t>(payload.size()), static_cast<uint8_t>(flags | FD_FDF)};
            std::ranges::copy(payload, frame.data_.begin());
            return frame;
        });
    }

    tl::expected<FdFrame, Error> FdFrame::from_raw_id(const uint32_t word, const span<const uint8_t> payload,
                                                      const uint8_t flags)
    {
        return CanId::from_packed(word).and_then([&](const CanId id) { return create(id, payload, flags); });
    }

    tl::expected<FdFrame, Error> FdFrame::create_padded(const CanId id, const span<const uint8_t> payload,
                                                        const uint8_t flags)
    {
        return fd_normalize_length(payload.size()).and_then([&](const uint8_t len)
        {
            std::array<uint8_t, CANFD_MAX_DLEN> padded{};
            std::ranges::copy(payload, padded.begin());
            return create(id, span<const uint8_t>{padded.data(), len}, flags);
        });
    }

    tl::expected<Frame, Error> make_frame(const uint32_t word, const span<const uint8_t> payload)
    {
        return CanId::from_packed(word).and_then([&](const CanId id) -> tl::expected<Frame, Error>
        {
            if (id.is_error())
            {
                return ErrorFrame::create(id, payload);
            }
            if (id.is_remote())
            {
                if (payload.size() > CAN_MAX_DLEN)
                {
                    return unexpected(Error{
                        ErrorCode::InvalidPayloadLength, format("Remote frame DLC {} exceeds 8", payload.size())
                    });
                }
                return RemoteFrame::create(id, static_cast<uint8_t>(payload.size()));
            }
            if (payload.size() > CAN_MAX_DLEN)
            {
                return FdFrame::create(id, payload);
            }
            return DataFrame::create(id, payload);
        });
    }

    CanId frame_id(const Frame& frame) noexcept
    {
        return std::visit([](const auto& f) { return f.id(); }, frame);
    }

    uint8_t frame_len(const Frame& frame) noexcept
    {
        return std::visit([](const auto& f) { return f.len(); }, frame);
    }

    span<const uint8_t> frame_data(const Frame& frame) noexcept
    {
        return std::visit([](const auto& f) { return f.data(); }, frame);
    }

    uint8_t frame_flags(const Frame& frame) noexcept
    {
        if (const auto* fd = std::get_if<FdFrame>(&frame))
        {
            return fd->flags();
        }
        return 0;
    }

    bool is_valid_fd_length(const size_t len) noexcept
    {
        return std::ranges::find(FD_STEPS, len) != FD_STEPS.end();
    }

    tl::expected<uint8_t, Error> fd_normalize_length(const size_t len)
    {
        const auto step = std::ranges::lower_bound(FD_STEPS, len);
        if (step == FD_STEPS.end())
        {
            return unexpected(Error{
                ErrorCode::InvalidPayloadLength, format("FD payload of {} bytes exceeds 64", len)
            });
        }
        return *step;
    }

    tl::expected<uint8_t, Error> fd_len_to_dlc(const size_t len)
    {
        const auto step = std::ranges::find(FD_STEPS, len);
        if (step == FD_STEPS.end())
        {
            return unexpected(Error{
                ErrorCode::InvalidPayloadLength, format("{} is not a valid FD payload length", len)
            });
        }
        return static_cast<uint8_t>(step - FD_STEPS.begin());
    }

    uint8_t fd_dlc_to_len(const uint8_t dlc) noexcept
    {
        return FD_STEPS[dlc & 0x0F];
    }

    std::string to_string(const Frame& frame)
    {
        const CanId id = frame_id(frame);
        std::string text;
        if (id.is_error())
        {
            text = format("{:08X}#", id.packed());
        }
        else if (id.is_extended())
        {
            text = format("{:08X}#", id.value());
        }
        else
        {
            text = format("{:03X}#", id.value());
        }

        if (const auto* remote = std::get_if<RemoteFrame>(&frame))
        {
            text += 'R';
            if (remote->len() > 0)
            {
                text += format("{}", static_cast<unsigned>(remote->len()));
            }
            return text;
        }
        if (const auto* fd = std::get_if<FdFrame>(&frame))
        {
            text += format("#{:X}", fd->flags() & (FD_BRS | FD_ESI));
        }
        for (const uint8_t byte : frame_data(frame))
        {
            text += format("{:02X}", byte);
        }
        return text;
    }
}
