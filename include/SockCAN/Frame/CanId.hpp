#ifndef SOCKCAN_CAN_ID_HPP
#define SOCKCAN_CAN_ID_HPP

#include <cstdint>
#include <compare>

#include <tl/expected.hpp>
#include "SockCAN/Util/Error.hpp"

namespace SockCAN
{
    // Flag bits of the kernel's packed 32-bit ID word (linux/can.h)
    constexpr uint32_t EFF_FLAG = 0x80000000U;
    constexpr uint32_t RTR_FLAG = 0x40000000U;
    constexpr uint32_t ERR_FLAG = 0x20000000U;

    constexpr uint32_t SFF_MASK = 0x000007FFU;
    constexpr uint32_t EFF_MASK = 0x1FFFFFFFU;
    constexpr uint32_t ERR_MASK = 0x1FFFFFFFU;

    constexpr uint32_t ERR_MASK_ALL = ERR_MASK;
    constexpr uint32_t ERR_MASK_NONE = 0;

    enum class IdKind : uint8_t
    {
        Standard,
        Extended,
    };

    /**
     * @brief Validated CAN identifier with its remote/error role
     * Immutable once built, all factories validate the value range.
     */
    class CanId
    {
    public:
        static tl::expected<CanId, Error> standard(uint32_t value);
        static tl::expected<CanId, Error> extended(uint32_t value);

        /**
         * @brief Picks Standard when the value fits 11 bits, Extended otherwise
         */
        static tl::expected<CanId, Error> from_raw(uint32_t value);

        /**
         * @brief Decodes a kernel ID word including its EFF/RTR/ERR bits
         */
        static tl::expected<CanId, Error> from_packed(uint32_t word);

        static tl::expected<CanId, Error> remote(CanId id);

        /**
         * @brief Error-class identifier, mask is the error class bit set
         */
        static tl::expected<CanId, Error> error(uint32_t mask);

        [[nodiscard]] uint32_t packed() const noexcept;

        [[nodiscard]] uint32_t value() const noexcept { return value_; }
        [[nodiscard]] IdKind kind() const noexcept { return kind_; }
        [[nodiscard]] bool is_standard() const noexcept { return kind_ == IdKind::Standard; }
        [[nodiscard]] bool is_extended() const noexcept { return kind_ == IdKind::Extended; }
        [[nodiscard]] bool is_remote() const noexcept { return remote_; }
        [[nodiscard]] bool is_error() const noexcept { return error_; }

        /**
         * @brief Key ordering identifiers by bus arbitration priority, lower wins
         */
        [[nodiscard]] uint32_t arbitration_key() const noexcept;

        bool operator==(const CanId&) const = default;

        std::strong_ordering operator<=>(const CanId& other) const noexcept
        {
            if (const auto order = arbitration_key() <=> other.arbitration_key(); order != 0)
            {
                return order;
            }
            return error_ <=> other.error_;
        }

        /**
         * @brief Adds n to the value, wrapping inside the 11 or 29 bit width
         */
        CanId operator+(uint32_t n) const noexcept;

    private:
        CanId(const uint32_t value, const IdKind kind, const bool remote, const bool error) :
            value_(value), kind_(kind), remote_(remote), error_(error)
        {
        }

        uint32_t value_;
        IdKind kind_;
        bool remote_;
        bool error_;
    };
}

#endif //SOCKCAN_CAN_ID_HPP
