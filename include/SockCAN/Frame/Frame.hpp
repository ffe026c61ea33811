#ifndef SOCKCAN_FRAME_HPP
#define SOCKCAN_FRAME_HPP

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <variant>

#include <tl/expected.hpp>
#include "SockCAN/Frame/CanId.hpp"
#include "SockCAN/Util/Error.hpp"

namespace SockCAN
{
    constexpr size_t CAN_MAX_DLEN = 8;
    constexpr size_t CANFD_MAX_DLEN = 64;

    // FD flag byte (linux/can.h)
    constexpr uint8_t FD_BRS = 0x01;
    constexpr uint8_t FD_ESI = 0x02;
    constexpr uint8_t FD_FDF = 0x04;

    class DataFrame
    {
    public:
        static tl::expected<DataFrame, Error> create(CanId id, std::span<const uint8_t> payload);
        static tl::expected<DataFrame, Error> from_raw_id(uint32_t word, std::span<const uint8_t> payload);

        [[nodiscard]] CanId id() const noexcept { return id_; }
        [[nodiscard]] uint8_t len() const noexcept { return len_; }
        [[nodiscard]] std::span<const uint8_t> data() const noexcept { return {data_.data(), len_}; }

        bool operator==(const DataFrame&) const = default;

    private:
        DataFrame(const CanId id, const uint8_t len) : id_(id), len_(len)
        {
        }

        CanId id_;
        uint8_t len_;
        // bytes past len_ stay zero so equality only sees the payload
        std::array<uint8_t, CAN_MAX_DLEN> data_{};
    };

    /**
     * @brief Remote transmission request, dlc is the requested length and no bytes are carried
     */
    class RemoteFrame
    {
    public:
        static tl::expected<RemoteFrame, Error> create(CanId id, uint8_t dlc = 0);
        static tl::expected<RemoteFrame, Error> from_raw_id(uint32_t word, uint8_t dlc = 0);

        [[nodiscard]] CanId id() const noexcept { return id_; }
        [[nodiscard]] uint8_t len() const noexcept { return dlc_; }
        [[nodiscard]] std::span<const uint8_t> data() const noexcept { return {}; }

        bool operator==(const RemoteFrame&) const = default;

    private:
        RemoteFrame(const CanId id, const uint8_t dlc) : id_(id), dlc_(dlc)
        {
        }

        CanId id_;
        uint8_t dlc_;
    };

    /**
     * @brief Controller/driver error report, the id carries the error class bits
     * and the payload the class specific detail (see CanError.hpp).
     */
    class ErrorFrame
    {
    public:
        static tl::expected<ErrorFrame, Error> create(CanId id, std::span<const uint8_t> payload);
        static tl::expected<ErrorFrame, Error> from_raw_id(uint32_t word, std::span<const uint8_t> payload);

        [[nodiscard]] CanId id() const noexcept { return id_; }
        [[nodiscard]] uint8_t len() const noexcept { return len_; }
        [[nodiscard]] std::span<const uint8_t> data() const noexcept { return {data_.data(), len_}; }
        [[nodiscard]] uint32_t error_class() const noexcept { return id_.value(); }

        bool operator==(const ErrorFrame&) const = default;

    private:
        ErrorFrame(const CanId id, const uint8_t len) : id_(id), len_(len)
        {
        }

        CanId id_;
        uint8_t len_;
        std::array<uint8_t, CAN_MAX_DLEN> data_{};
    };

    class FdFrame
    {
    public:
        /**
         * @brief payload size must be one of the FD steps, FDF is always added to flags
         */
        static tl::expected<FdFrame, Error> create(CanId id, std::span<const uint8_t> payload, uint8_t flags = 0);
        static tl::expected<FdFrame, Error> from_raw_id(uint32_t word, std::span<const uint8_t> payload,
                                                         uint8_t flags = 0);

        /**
         * @brief Zero-pads payload up to the next FD step before building the frame
         */
        static tl::expected<FdFrame, Error> create_padded(CanId id, std::span<const uint8_t> payload,
                                                           uint8_t flags = 0);

        [[nodiscard]] CanId id() const noexcept { return id_; }
        [[nodiscard]] uint8_t len() const noexcept { return len_; }
        [[nodiscard]] std::span<const uint8_t> data() const noexcept { return {data_.data(), len_}; }
        [[nodiscard]] uint8_t flags() const noexcept { return flags_; }
        [[nodiscard]] bool is_brs() const noexcept { return flags_ & FD_BRS; }
        [[nodiscard]] bool is_esi() const noexcept { return flags_ & FD_ESI; }

        bool operator==(const FdFrame&) const = default;

    private:
        FdFrame(const CanId id, const uint8_t len, const uint8_t flags) : id_(id), len_(len), flags_(flags)
        {
        }

        CanId id_;
        uint8_t len_;
        uint8_t flags_;
        std::array<uint8_t, CANFD_MAX_DLEN> data_{};
    };

    using Frame = std::variant<DataFrame, RemoteFrame, ErrorFrame, FdFrame>;

    /**
     * @brief Builds the frame variant the flag bits of a kernel ID word select
     * Payloads longer than 8 bytes produce an FdFrame.
     */
    tl::expected<Frame, Error> make_frame(uint32_t word, std::span<const uint8_t> payload);

    CanId frame_id(const Frame& frame) noexcept;
    uint8_t frame_len(const Frame& frame) noexcept;
    std::span<const uint8_t> frame_data(const Frame& frame) noexcept;
    // FD flag byte, 0 for classic frames
    uint8_t frame_flags(const Frame& frame) noexcept;

    inline bool is_fd(const Frame& frame) noexcept
    {
        return std::holds_alternative<FdFrame>(frame);
    }

    bool is_valid_fd_length(size_t len) noexcept;

    /**
     * @brief Rounds len up to the next FD step (9 -> 12, 50 -> 64)
     * Only used for building frames, never when reading them.
     */
    tl::expected<uint8_t, Error> fd_normalize_length(size_t len);

    tl::expected<uint8_t, Error> fd_len_to_dlc(size_t len);
    uint8_t fd_dlc_to_len(uint8_t dlc) noexcept;

    /**
     * @brief candump style text: 123#DEADBEEF, 12345678#R, 123##1AABB
     */
    std::string to_string(const Frame& frame);
}

#endif //SOCKCAN_FRAME_HPP
