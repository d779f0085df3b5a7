#pragma once
#include <set>

namespace mcplink::supervisor
{

/// Picks ports for supervised http servers from a fixed range
class PortAllocator
{
  public:
    explicit PortAllocator(int range_start = 3001, int range_end = 3999);

    /// Lowest port in range that is not in `taken` and can be bound on 127.0.0.1
    /// @throws PortUnavailable when the range is exhausted
    int allocate(const std::set<int>& taken) const;

    /// True if a listening socket could be bound to 127.0.0.1:port right now
    static bool is_port_free(int port);

    int range_start() const
    {
        return range_start_;
    }
    int range_end() const
    {
        return range_end_;
    }

  private:
    int range_start_;
    int range_end_;
};

} // namespace mcplink::supervisor
