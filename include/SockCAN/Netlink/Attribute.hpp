#ifndef SOCKCAN_NETLINK_ATTRIBUTE_HPP
#define SOCKCAN_NETLINK_ATTRIBUTE_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>
#include "SockCAN/Util/Error.hpp"

namespace SockCAN::Netlink
{
    // struct nlattr / rtattr: u16 length (header included), u16 type, value, padded to 4 bytes
    constexpr size_t ALIGNTO = 4;
    constexpr size_t ATTR_HDRLEN = 4;
    constexpr uint16_t ATTR_F_NESTED = 0x8000;
    constexpr uint16_t ATTR_F_NET_BYTEORDER = 0x4000;
    constexpr uint16_t ATTR_TYPE_MASK = static_cast<uint16_t>(~(ATTR_F_NESTED | ATTR_F_NET_BYTEORDER));

    constexpr size_t align(const size_t len) noexcept
    {
        return (len + ALIGNTO - 1) & ~(ALIGNTO - 1);
    }

    /**
     * @brief Appends attributes to a message buffer
     * Nested attributes are opened with begin_nested and closed with end_nested,
     * which patches the parent length once all children are written.
     */
    class AttributeWriter
    {
    public:
        explicit AttributeWriter(std::vector<uint8_t>& buffer) : buffer(buffer)
        {
        }

        void put(uint16_t type, std::span<const uint8_t> value);
        void put_u8(uint16_t type, uint8_t value);
        void put_u16(uint16_t type, uint16_t value);
        void put_u32(uint16_t type, uint32_t value);
        void put_u32s(uint16_t type, std::span<const uint32_t> values);
        // NUL terminated, as the kernel expects for IFLA_IFNAME and IFLA_INFO_KIND
        void put_string(uint16_t type, std::string_view value);

        [[nodiscard]] size_t begin_nested(uint16_t type);
        void end_nested(size_t offset);

    private:
        std::vector<uint8_t>& buffer;
    };

    struct Attribute
    {
        uint16_t type;
        std::span<const uint8_t> payload;

        [[nodiscard]] tl::expected<uint8_t, Error> as_u8() const;
        [[nodiscard]] tl::expected<uint16_t, Error> as_u16() const;
        [[nodiscard]] tl::expected<uint32_t, Error> as_u32() const;
        [[nodiscard]] std::string as_string() const;

        /**
         * @brief Reads count consecutive u32 fields of a fixed layout struct
         */
        [[nodiscard]] tl::expected<std::vector<uint32_t>, Error> as_u32s(size_t offset, size_t count) const;
    };

    /**
     * @brief Splits an attribute chain, masking NLA_F_* bits off the type
     * Fails with MalformedResponse when a length is shorter than the header,
     * runs past the buffer, or when 1..3 stray bytes are left at the end.
     */
    tl::expected<std::vector<Attribute>, Error> parse_attributes(std::span<const uint8_t> bytes);

    const Attribute* find_attribute(const std::vector<Attribute>& attributes, uint16_t type) noexcept;
}

#endif //SOCKCAN_NETLINK_ATTRIBUTE_HPP
