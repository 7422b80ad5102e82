#include "devui/port_allocator.hpp"
#include <sockpp/tcp_acceptor.h>
#include <sockpp/inet_address.h>
#include <stdexcept>

namespace devui {

    SocketPortAllocator::SocketPortAllocator(int range_start, int range_end)
        : range_start_(range_start)
        , range_end_(range_end) {}

    bool SocketPortAllocator::is_port_free(int port) {
        sockpp::tcp_acceptor acceptor;
        sockpp::inet_address addr("127.0.0.1", static_cast<in_port_t>(port));
        // No REUSE flag: a port in TIME_WAIT counts as taken
        bool ok = static_cast<bool>(acceptor.open(addr, 1, false));
        acceptor.close();
        return ok;
    }

    int SocketPortAllocator::os_assigned_port() {
        sockpp::tcp_acceptor acceptor;
        sockpp::inet_address addr("127.0.0.1", 0);

        if (!acceptor.open(addr, 1, false)) {
            throw std::runtime_error("Failed to bind an ephemeral port");
        }

        sockpp::inet_address bound(acceptor.address());
        int port = bound.port();
        acceptor.close();
        return port;
    }

    int SocketPortAllocator::allocate(std::optional<int> requested) {
        if (requested) {
            if (*requested == 0) {
                return os_assigned_port();
            }
            return *requested;
        }

        for (int port = range_start_; port <= range_end_; ++port) {
            if (is_port_free(port)) {
                return port;
            }
        }

        return os_assigned_port();
    }

} // namespace devui
