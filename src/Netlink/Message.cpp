#include "SockCAN/Netlink/Message.hpp"
#include "SockCAN/Util/ByteOrder.hpp"

#include <algorithm>
#include <format>
#include <limits>

using tl::unexpected, std::format, std::span;

namespace SockCAN::Netlink
{
    Request::Request(const uint16_t type, const uint16_t flags, const IfInfo& info) :
        bytes(HDRLEN + IFINFO_LEN, 0), msg_type(type), msg_flags(flags)
    {
        const span out{bytes};
        Util::store_u16(out, 4, type);
        Util::store_u16(out, 6, flags);
        out[HDRLEN] = info.family;
        Util::store_u16(out, HDRLEN + 2, info.type);
        Util::store_u32(out, HDRLEN + 4, static_cast<uint32_t>(info.index));
        Util::store_u32(out, HDRLEN + 8, info.flags);
        Util::store_u32(out, HDRLEN + 12, info.change);
    }

    span<const uint8_t> Request::finish(const uint32_t seq)
    {
        const span out{bytes};
        Util::store_u32(out, 0, static_cast<uint32_t>(bytes.size()));
        Util::store_u32(out, 8, seq);
        // port id 0 lets the kernel fill in the sender
        Util::store_u32(out, 12, 0);
        return bytes;
    }

    tl::expected<std::vector<Message>, Error> split_messages(const span<const uint8_t> datagram)
    {
        std::vector<Message> messages;
        size_t offset = 0;
        while (offset < datagram.size())
        {
            const size_t remaining = datagram.size() - offset;
            if (remaining < HDRLEN)
            {
                return unexpected(Error{
                    ErrorCode::MalformedResponse, format("{} bytes left, too short for a netlink header", remaining)
                });
            }
            const Header header{
                .length = Util::load_u32(datagram, offset),
                .type = Util::load_u16(datagram, offset + 4),
                .flags = Util::load_u16(datagram, offset + 6),
                .seq = Util::load_u32(datagram, offset + 8),
                .pid = Util::load_u32(datagram, offset + 12),
            };
            if (header.length < HDRLEN || header.length > remaining)
            {
                return unexpected(Error{
                    ErrorCode::MalformedResponse,
                    format("Netlink message length {} does not fit the {} remaining bytes", header.length, remaining)
                });
            }
            messages.push_back(Message{header, datagram.subspan(offset + HDRLEN, header.length - HDRLEN)});
            offset += std::min(align(header.length), remaining);
        }
        return messages;
    }

    tl::expected<IfInfo, Error> parse_ifinfo(const span<const uint8_t> payload)
    {
        if (payload.size() < IFINFO_LEN)
        {
            return unexpected(Error{
                ErrorCode::MalformedResponse, format("Link message payload of {} bytes lacks ifinfomsg", payload.size())
            });
        }
        return IfInfo{
            .family = payload[0],
            .type = Util::load_u16(payload, 2),
            .index = static_cast<int32_t>(Util::load_u32(payload, 4)),
            .flags = Util::load_u32(payload, 8),
            .change = Util::load_u32(payload, 12),
        };
    }

    tl::expected<int32_t, Error> parse_error_code(const span<const uint8_t> payload)
    {
        if (payload.size() < 4)
        {
            return unexpected(Error{ErrorCode::MalformedResponse, "NLMSG_ERROR without an error code"});
        }
        const auto code = static_cast<int32_t>(Util::load_u32(payload, 0));
        // the kernel reports 0 or a negated errno
        if (code > 0 || code == std::numeric_limits<int32_t>::min())
        {
            return unexpected(Error{
                ErrorCode::MalformedResponse, format("NLMSG_ERROR carries invalid error code {}", code)
            });
        }
        return code;
    }
}
