/**
 * @file port_allocator.hpp
 * @brief Picks a free local TCP port for a new server
 */

#pragma once

#include <optional>

#include "devui/project_config.hpp"

namespace devui {

    /**
     * @brief Free-port source
     */
    class PortAllocator {
    public:
        virtual ~PortAllocator() = default;

        /**
         * @brief Returns a port that is free right now
         *
         * @param requested Port asked for by the user. 0 means any free
         *        port chosen by the OS; empty means the default range.
         * @return int Port to hand to the spawned server
         * @throws std::runtime_error if no port could be found
         */
        virtual int allocate(std::optional<int> requested) = 0;
    };

    /**
     * @brief PortAllocator that probes by binding a sockpp acceptor
     *
     * Without a requested port the range [range_start, range_end] is tried
     * in order; if every port is taken the OS picks one. An explicit
     * non-zero port is returned unchanged (a busy port surfaces later as
     * a failed health check).
     */
    class SocketPortAllocator : public PortAllocator {
    public:
        SocketPortAllocator(int range_start = kDefaultPortRangeStart,
                            int range_end = kDefaultPortRangeEnd);

        int allocate(std::optional<int> requested) override;

        /**
         * @brief True if 127.0.0.1:port can be bound right now
         */
        static bool is_port_free(int port);

        /**
         * @brief Binds port 0 and returns the port the OS assigned
         *
         * @throws std::runtime_error if binding fails
         */
        static int os_assigned_port();

    private:
        int range_start_;
        int range_end_;
    };

} // namespace devui
