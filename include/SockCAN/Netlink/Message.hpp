#ifndef SOCKCAN_NETLINK_MESSAGE_HPP
#define SOCKCAN_NETLINK_MESSAGE_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <tl/expected.hpp>
#include "SockCAN/Netlink/Attribute.hpp"
#include "SockCAN/Util/Error.hpp"

namespace SockCAN::Netlink
{
    // sizeof(struct nlmsghdr) and sizeof(struct ifinfomsg)
    constexpr size_t HDRLEN = 16;
    constexpr size_t IFINFO_LEN = 16;

    /*
     * struct nlmsghdr               struct ifinfomsg
     *   0..3   nlmsg_len              0      ifi_family
     *   4..5   nlmsg_type             1      pad
     *   6..7   nlmsg_flags            2..3   ifi_type
     *   8..11  nlmsg_seq              4..7   ifi_index
     *   12..15 nlmsg_pid              8..11  ifi_flags
     *                                 12..15 ifi_change
     */
    struct Header
    {
        uint32_t length;
        uint16_t type;
        uint16_t flags;
        uint32_t seq;
        uint32_t pid;
    };

    struct IfInfo
    {
        uint8_t family{};
        uint16_t type{};
        int32_t index{};
        uint32_t flags{};
        uint32_t change{};
    };

    struct Message
    {
        Header header;
        std::span<const uint8_t> payload;
    };

    /**
     * @brief Builds one request: header, ifinfomsg, then attributes
     */
    class Request
    {
    public:
        Request(uint16_t type, uint16_t flags, const IfInfo& info);

        AttributeWriter attributes() { return AttributeWriter{bytes}; }

        /**
         * @brief Stamps the total length and sequence number into the header
         */
        std::span<const uint8_t> finish(uint32_t seq);

        [[nodiscard]] uint16_t type() const noexcept { return msg_type; }
        [[nodiscard]] uint16_t flags() const noexcept { return msg_flags; }

    private:
        std::vector<uint8_t> bytes;
        uint16_t msg_type;
        uint16_t msg_flags;
    };

    /**
     * @brief Splits one received datagram into its netlink messages
     * Each message length must cover its header and stay inside the datagram.
     */
    tl::expected<std::vector<Message>, Error> split_messages(std::span<const uint8_t> datagram);

    tl::expected<IfInfo, Error> parse_ifinfo(std::span<const uint8_t> payload);

    /**
     * @brief Returns the errno carried by an NLMSG_ERROR payload, 0 for an ack
     */
    tl::expected<int32_t, Error> parse_error_code(std::span<const uint8_t> payload);
}

#endif //SOCKCAN_NETLINK_MESSAGE_HPP
