#include "SockCAN/Netlink/Attribute.hpp"
#include "SockCAN/Util/ByteOrder.hpp"

#include <algorithm>
#include <array>
#include <format>

using tl::unexpected, std::format, std::span;

namespace SockCAN::Netlink
{
    namespace
    {
        Error too_short(const uint16_t type, const size_t have, const size_t need)
        {
            return Error{
                ErrorCode::MalformedResponse,
                format("Attribute {} carries {} bytes, {} expected", type, have, need)
            };
        }
    }

    void AttributeWriter::put(const uint16_t type, const span<const uint8_t> value)
    {
        const size_t offset = buffer.size();
        const size_t length = ATTR_HDRLEN + value.size();
        buffer.resize(offset + align(length), 0);
        const span out{buffer};
        Util::store_u16(out, offset, static_cast<uint16_t>(length));
        Util::store_u16(out, offset + 2, type);
        std::ranges::copy(value, buffer.begin() + static_cast<std::ptrdiff_t>(offset + ATTR_HDRLEN));
    }

    void AttributeWriter::put_u8(const uint16_t type, const uint8_t value)
    {
        put(type, span{&value, 1});
    }

    void AttributeWriter::put_u16(const uint16_t type, const uint16_t value)
    {
        std::array<uint8_t, 2> bytes{};
        Util::store_u16(bytes, 0, value);
        put(type, bytes);
    }

    void AttributeWriter::put_u32(const uint16_t type, const uint32_t value)
    {
        std::array<uint8_t, 4> bytes{};
        Util::store_u32(bytes, 0, value);
        put(type, bytes);
    }

    void AttributeWriter::put_u32s(const uint16_t type, const span<const uint32_t> values)
    {
        std::vector<uint8_t> bytes(values.size() * 4);
        for (size_t i = 0; i < values.size(); ++i)
        {
            Util::store_u32(bytes, i * 4, values[i]);
        }
        put(type, bytes);
    }

    void AttributeWriter::put_string(const uint16_t type, const std::string_view value)
    {
        std::vector<uint8_t> bytes(value.begin(), value.end());
        bytes.push_back(0);
        put(type, bytes);
    }

    size_t AttributeWriter::begin_nested(const uint16_t type)
    {
        const size_t offset = buffer.size();
        buffer.resize(offset + ATTR_HDRLEN, 0);
        Util::store_u16(buffer, offset + 2, type);
        return offset;
    }

    void AttributeWriter::end_nested(const size_t offset)
    {
        Util::store_u16(buffer, offset, static_cast<uint16_t>(buffer.size() - offset));
    }

    tl::expected<uint8_t, Error> Attribute::as_u8() const
    {
        if (payload.empty())
        {
            return unexpected(too_short(type, payload.size(), 1));
        }
        return payload[0];
    }

    tl::expected<uint16_t, Error> Attribute::as_u16() const
    {
        if (payload.size() < 2)
        {
            return unexpected(too_short(type, payload.size(), 2));
        }
        return Util::load_u16(payload, 0);
    }

    tl::expected<uint32_t, Error> Attribute::as_u32() const
    {
        if (payload.size() < 4)
        {
            return unexpected(too_short(type, payload.size(), 4));
        }
        return Util::load_u32(payload, 0);
    }

    std::string Attribute::as_string() const
    {
        const auto end = std::ranges::find(payload, 0);
        return std::string(payload.begin(), end);
    }

    tl::expected<std::vector<uint32_t>, Error> Attribute::as_u32s(const size_t offset, const size_t count) const
    {
        if (payload.size() < offset + count * 4)
        {
            return unexpected(too_short(type, payload.size(), offset + count * 4));
        }
        std::vector<uint32_t> values(count);
        for (size_t i = 0; i < count; ++i)
        {
            values[i] = Util::load_u32(payload, offset + i * 4);
        }
        return values;
    }

    tl::expected<std::vector<Attribute>, Error> parse_attributes(const span<const uint8_t> bytes)
    {
        std::vector<Attribute> attributes;
        size_t offset = 0;
        while (offset < bytes.size())
        {
            const size_t remaining = bytes.size() - offset;
            if (remaining < ATTR_HDRLEN)
            {
                return unexpected(Error{
                    ErrorCode::MalformedResponse, format("{} stray bytes after the last attribute", remaining)
                });
            }
            const uint16_t length = Util::load_u16(bytes, offset);
            const uint16_t type = Util::load_u16(bytes, offset + 2) & ATTR_TYPE_MASK;
            if (length < ATTR_HDRLEN || length > remaining)
            {
                return unexpected(Error{
                    ErrorCode::MalformedResponse,
                    format("Attribute {} length {} does not fit the {} remaining bytes", type, length, remaining)
                });
            }
            attributes.push_back(Attribute{type, bytes.subspan(offset + ATTR_HDRLEN, length - ATTR_HDRLEN)});
            // the last attribute may omit its trailing padding
            offset += std::min(align(length), remaining);
        }
        return attributes;
    }

    const Attribute* find_attribute(const std::vector<Attribute>& attributes, const uint16_t type) noexcept
    {
        const auto it = std::ranges::find(attributes, type, &Attribute::type);
        return it == attributes.end() ? nullptr : &*it;
    }
}
