#ifndef SOCKCAN_HPP
#define SOCKCAN_HPP

#include "SockCAN/Config.hpp"
#include "SockCAN/Util/Error.hpp"
#include "SockCAN/Frame/CanId.hpp"
#include "SockCAN/Frame/Frame.hpp"
#include "SockCAN/Frame/Codec.hpp"
#include "SockCAN/Frame/CanError.hpp"
#include "SockCAN/Frame/FrameConvertible.hpp"
#include "SockCAN/Interface/Names.hpp"
#include "SockCAN/Interface/Socket.hpp"
#include "SockCAN/Interface/Reactor.hpp"
#include "SockCAN/Interface/AsyncSocket.hpp"
#include "SockCAN/Interface/Interface.hpp"
#include "SockCAN/Netlink/CanParams.hpp"
#include "SockCAN/Netlink/NetlinkClient.hpp"
#include "SockCAN/Netlink/Link.hpp"

#endif //SOCKCAN_HPP
