#ifndef SOCKCAN_REACTOR_HPP
#define SOCKCAN_REACTOR_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <unordered_map>

#include <sys/epoll.h>
#include <tl/expected.hpp>
#include <xtr/logger.hpp>
#include "SockCAN/Util/Error.hpp"

namespace SockCAN
{
    static constexpr size_t MAX_EPOLL_EVENT = 64;

    /**
     * @brief Single threaded epoll reactor driven by the caller through run_once()
     * Registrations are one-shot: after a handler ran, its descriptor stays silent
     * until rearm() is called. wake() interrupts a run_once() waiting in another thread.
     */
    class Reactor
    {
    public:
        using Handler = std::function<void(uint32_t events)>;

        Reactor();
        Reactor(const Reactor& other) = delete;
        Reactor(Reactor&& other) = delete;
        ~Reactor();
        Reactor& operator=(const Reactor& other) = delete;
        Reactor& operator=(Reactor&& other) = delete;

        tl::expected<void, Error> add(int fd, uint32_t events, Handler handler);
        tl::expected<void, Error> rearm(int fd, uint32_t events);
        tl::expected<void, Error> remove(int fd);

        /**
         * @brief Waits up to timeout for readiness and runs the handlers of ready descriptors
         * @return number of handlers run, 0 on timeout, wake-up or signal
         */
        tl::expected<size_t, Error> run_once(std::chrono::milliseconds timeout);

        tl::expected<void, Error> wake() const;

        [[nodiscard]] size_t size() const noexcept { return handlers.size(); }

    private:
        tl::expected<void, Error> control(int op, int fd, uint32_t events) const;

        int epoll_fd{-1};
        int wake_fd{-1};
        std::unordered_map<int, Handler> handlers;
        xtr::sink s;
    };
}

#endif //SOCKCAN_REACTOR_HPP
