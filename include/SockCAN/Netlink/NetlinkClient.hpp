#ifndef SOCKCAN_NETLINK_CLIENT_HPP
#define SOCKCAN_NETLINK_CLIENT_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <tl/expected.hpp>
#include <xtr/logger.hpp>
#include "SockCAN/Netlink/CanParams.hpp"
#include "SockCAN/Netlink/ControlChannel.hpp"
#include "SockCAN/Netlink/Message.hpp"
#include "SockCAN/Util/Error.hpp"

namespace SockCAN::Netlink
{
    struct InterfaceDetails
    {
        unsigned index{};
        std::string name;
        bool is_up{};
        // 16 for classic CAN, 72 for CAN FD
        std::optional<uint32_t> mtu;
        CanParams can;
    };

    /**
     * @brief rtnetlink client for CAN interface parameters
     * Every operation is one request/response session. Sessions are serialized,
     * each one gets the next sequence number and ignores replies carrying another.
     * A session gives up with NetlinkTimeout after max_attempts reads without
     * completion; nothing is retried automatically.
     */
    class NetlinkClient
    {
    public:
        explicit NetlinkClient(std::unique_ptr<ControlChannel> channel, unsigned max_attempts);

        /**
         * @brief Connects a libnl route socket with the timeout and attempt limit from Config
         */
        static tl::expected<std::unique_ptr<NetlinkClient>, Error> open();

        tl::expected<CanParams, Error> get_interface_params(unsigned index);
        tl::expected<InterfaceDetails, Error> get_interface_details(unsigned index);

        tl::expected<void, Error> set_interface_params(unsigned index, const CanParams& params);
        tl::expected<void, Error> restart_interface(unsigned index);
        tl::expected<void, Error> set_bitrate(unsigned index, uint32_t bitrate,
                                              std::optional<uint32_t> sample_point = std::nullopt);
        tl::expected<void, Error> set_data_bitrate(unsigned index, uint32_t bitrate,
                                                   std::optional<uint32_t> sample_point = std::nullopt);
        tl::expected<void, Error> set_ctrlmode(unsigned index, uint32_t mode, bool on);
        tl::expected<void, Error> set_ctrlmodes(unsigned index, CtrlModes modes);
        tl::expected<void, Error> set_restart_ms(unsigned index, uint32_t restart_ms);
        tl::expected<void, Error> set_mtu(unsigned index, uint32_t mtu);
        tl::expected<void, Error> bring_up(unsigned index);
        tl::expected<void, Error> bring_down(unsigned index);

        [[nodiscard]] uint32_t last_sequence() const noexcept { return sequence.load(); }

    private:
        struct Reply
        {
            Header header;
            std::vector<uint8_t> payload;
        };

        /**
         * @brief Runs one session under session_mutex, logging done on success
         */
        tl::expected<std::vector<Reply>, Error> transact(Request& request, const std::string& done = {});

        /**
         * @brief Sends request and collects the replies matching seq
         * Completes on an ack, on NLMSG_DONE, or on the first reply of a non-multipart answer.
         * Caller holds session_mutex.
         */
        tl::expected<std::vector<Reply>, Error> exchange(Request& request, uint32_t seq);

        tl::expected<void, Error> acknowledged(Request& request, const std::string& done = {});

        /**
         * @brief RTM_NEWLINK carrying IFLA_LINKINFO { KIND "can", DATA { fill() } }
         */
        tl::expected<void, Error> change_can_info(
            unsigned index, const std::function<tl::expected<size_t, Error>(AttributeWriter&)>& fill);

        std::unique_ptr<ControlChannel> channel;
        unsigned max_attempts;
        std::atomic<uint32_t> sequence{};
        std::mutex session_mutex;
        xtr::sink s;
    };
}

#endif //SOCKCAN_NETLINK_CLIENT_HPP
