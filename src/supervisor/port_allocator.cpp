#include "mcplink/supervisor/port_allocator.hpp"

#include "mcplink/exceptions.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

namespace mcplink::supervisor
{

PortAllocator::PortAllocator(int range_start, int range_end)
    : range_start_(range_start), range_end_(range_end)
{
    if (range_start_ <= 0 || range_end_ > 65535 || range_start_ > range_end_)
        throw ValidationError("Invalid port range " + std::to_string(range_start) + ".." +
                              std::to_string(range_end));
}

int PortAllocator::allocate(const std::set<int>& taken) const
{
    for (int port = range_start_; port <= range_end_; ++port)
    {
        if (taken.count(port))
            continue;
        if (is_port_free(port))
            return port;
    }
    throw PortUnavailable("No free port in range " + std::to_string(range_start_) + ".." +
                          std::to_string(range_end_));
}

bool PortAllocator::is_port_free(int port)
{
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0)
        return false;

    int yes = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    bool ok = ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    ::close(fd);
    return ok;
}

} // namespace mcplink::supervisor
