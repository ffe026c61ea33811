#include "SockCAN/Frame/CanId.hpp"

#include <format>

using tl::unexpected, std::format;

namespace SockCAN
{
    tl::expected<CanId, Error> CanId::standard(const uint32_t value)
    {
        if (value > SFF_MASK)
        {
            return unexpected(Error{
                ErrorCode::IdentifierOutOfRange, format("Standard identifier {:#x} exceeds 0x7FF", value)
            });
        }
        return CanId{value, IdKind::Standard, false, false};
    }

    tl::expected<CanId, Error> CanId::extended(const uint32_t value)
    {
        if (value > EFF_MASK)
        {
            return unexpected(Error{
                ErrorCode::IdentifierOutOfRange, format("Extended identifier {:#x} exceeds 0x1FFFFFFF", value)
            });
        }
        return CanId{value, IdKind::Extended, false, false};
    }

    tl::expected<CanId, Error> CanId::from_raw(const uint32_t value)
    {
        if (value <= SFF_MASK)
        {
            return standard(value);
        }
        return extended(value);
    }

    tl::expected<CanId, Error> CanId::from_packed(const uint32_t word)
    {
        const bool rtr = (word & RTR_FLAG) != 0;
        const bool err = (word & ERR_FLAG) != 0;
        if (rtr && err)
        {
            return unexpected(Error{
                ErrorCode::VariantMismatch, format("ID word {:#010x} has both RTR and ERR set", word)
            });
        }
        if (err)
        {
            return error(word & ERR_MASK);
        }
        auto id = (word & EFF_FLAG) ? extended(word & EFF_MASK) : standard(word & EFF_MASK);
        if (id && rtr)
        {
            return remote(*id);
        }
        return id;
    }

    tl::expected<CanId, Error> CanId::remote(const CanId id)
    {
        if (id.error_)
        {
            return unexpected(Error{ErrorCode::VariantMismatch, "Error identifier cannot be a remote request"});
        }
        return CanId{id.value_, id.kind_, true, false};
    }

    tl::expected<CanId, Error> CanId::error(const uint32_t mask)
    {
        if (mask > ERR_MASK)
        {
            return unexpected(Error{
                ErrorCode::IdentifierOutOfRange, format("Error class mask {:#x} exceeds 0x1FFFFFFF", mask)
            });
        }
        return CanId{mask, mask > SFF_MASK ? IdKind::Extended : IdKind::Standard, false, true};
    }

    uint32_t CanId::packed() const noexcept
    {
        // error frames never carry EFF, the kernel reports them with ERR only
        if (error_)
        {
            return value_ | ERR_FLAG;
        }
        uint32_t word = value_;
        if (kind_ == IdKind::Extended)
        {
            word |= EFF_FLAG;
        }
        if (remote_)
        {
            word |= RTR_FLAG;
        }
        return word;
    }

    uint32_t CanId::arbitration_key() const noexcept
    {
        // bit layout of the arbitration field: base ID, RTR/SRR, IDE, ID extension, RTR
        const uint32_t rtr = remote_ ? 1U : 0U;
        if (kind_ == IdKind::Standard)
        {
            return (value_ << 20) | (rtr << 19);
        }
        const uint32_t base = value_ >> 18;
        const uint32_t extension = value_ & 0x3FFFFU;
        return (base << 20) | (1U << 19) | (1U << 18) | (extension << 1) | rtr;
    }

    CanId CanId::operator+(const uint32_t n) const noexcept
    {
        const uint32_t mask = kind_ == IdKind::Standard ? SFF_MASK : EFF_MASK;
        return CanId{(value_ + n) & mask, kind_, remote_, error_};
    }
}
