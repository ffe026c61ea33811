#ifndef SOCKCAN_FRAME_CONVERTIBLE_HPP
#define SOCKCAN_FRAME_CONVERTIBLE_HPP

#include <concepts>

#include "SockCAN/Frame/Frame.hpp"

namespace SockCAN
{
    template <typename T>
    concept FrameConvertible = requires(T a, Frame f)
    {
        { static_cast<Frame>(a) } -> std::same_as<Frame>;
        { static_cast<T>(f) } -> std::same_as<T>;
    };
}

#endif //SOCKCAN_FRAME_CONVERTIBLE_HPP
