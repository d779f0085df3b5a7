#include "mcplink/client/pending_requests.hpp"
#include "mcplink/exceptions.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

using mcplink::Json;
using mcplink::client::PendingRequestTable;
using mcplink::protocol::Response;
using namespace std::chrono_literals;

static Response make_response(Json id, Json result)
{
    Response r;
    r.id = std::move(id);
    r.result = std::move(result);
    return r;
}

int main()
{
    auto far = PendingRequestTable::Clock::now() + 60s;

    std::cout << "Test: ids are unique and increasing...\n";
    {
        PendingRequestTable table;
        auto a = table.next_id();
        auto b = table.next_id();
        assert(a == 1);
        assert(b == 2);
        std::cout << "  [PASS] next_id\n";
    }

    std::cout << "Test: out-of-order resolution...\n";
    {
        PendingRequestTable table;
        auto f1 = table.add(1, "tools/call", far);
        auto f2 = table.add(2, "tools/call", far);
        assert(table.size() == 2);

        assert(table.resolve(make_response(2, Json{{"n", 2}})));
        // string ids are matched numerically
        assert(table.resolve(make_response("1", Json{{"n", 1}})));
        assert(f1.get().result->at("n") == 1);
        assert(f2.get().result->at("n") == 2);
        assert(table.size() == 0);
        std::cout << "  [PASS] each caller gets its own reply\n";
    }

    std::cout << "Test: unknown and late responses are ignored...\n";
    {
        PendingRequestTable table;
        auto f = table.add(5, "ping", far);
        assert(!table.resolve(make_response(99, Json::object())));
        assert(!table.resolve(make_response("abc", Json::object())));
        assert(table.resolve(make_response(5, Json::object())));
        assert(!table.resolve(make_response(5, Json::object())));
        f.get();
        std::cout << "  [PASS] completed exactly once\n";
    }

    std::cout << "Test: duplicate id rejected...\n";
    {
        PendingRequestTable table;
        auto f = table.add(1, "ping", far);
        bool threw = false;
        try
        {
            table.add(1, "ping", far);
        }
        catch (const mcplink::ValidationError&)
        {
            threw = true;
        }
        assert(threw);
        assert(table.size() == 1);
        table.erase(1);
        std::cout << "  [PASS] duplicate id\n";
    }

    std::cout << "Test: time_out completes with RequestTimeout...\n";
    {
        PendingRequestTable table;
        auto f = table.add(3, "tools/call", far);
        assert(table.time_out(3));
        assert(!table.time_out(3));
        bool threw = false;
        try
        {
            f.get();
        }
        catch (const mcplink::RequestTimeout& e)
        {
            threw = true;
            assert(std::string(e.what()).find("tools/call") != std::string::npos);
        }
        assert(threw);
        // a reply after the timeout finds nothing
        assert(!table.resolve(make_response(3, Json::object())));
        std::cout << "  [PASS] timeout\n";
    }

    std::cout << "Test: expire only drops overdue entries...\n";
    {
        PendingRequestTable table;
        auto now = PendingRequestTable::Clock::now();
        auto overdue = table.add(1, "a", now - 1ms);
        auto fresh = table.add(2, "b", now + 60s);
        assert(table.expire(now) == 1);
        assert(table.size() == 1);
        bool threw = false;
        try
        {
            overdue.get();
        }
        catch (const mcplink::RequestTimeout&)
        {
            threw = true;
        }
        assert(threw);
        assert(fresh.wait_for(0ms) == std::future_status::timeout);
        table.reject_all("done");
        std::cout << "  [PASS] expire\n";
    }

    std::cout << "Test: reject_all fails every waiter...\n";
    {
        PendingRequestTable table;
        auto f1 = table.add(1, "a", far);
        auto f2 = table.add(2, "b", far);
        std::thread waiter(
            [&]
            {
                bool threw = false;
                try
                {
                    f1.get();
                }
                catch (const mcplink::TransportError& e)
                {
                    threw = true;
                    assert(std::string(e.what()) == "Connection closed");
                }
                assert(threw);
            });
        std::this_thread::sleep_for(20ms);
        assert(table.reject_all("Connection closed") == 2);
        waiter.join();
        bool threw = false;
        try
        {
            f2.get();
        }
        catch (const mcplink::TransportError&)
        {
            threw = true;
        }
        assert(threw);
        assert(table.size() == 0);
        std::cout << "  [PASS] reject_all\n";
    }

    std::cout << "Test: reject with a custom error...\n";
    {
        PendingRequestTable table;
        auto f = table.add(4, "x", far);
        assert(table.reject(4, std::make_exception_ptr(mcplink::ProtocolError("boom", -1))));
        bool threw = false;
        try
        {
            f.get();
        }
        catch (const mcplink::ProtocolError& e)
        {
            threw = true;
            assert(e.code() == -1);
        }
        assert(threw);
        std::cout << "  [PASS] reject\n";
    }

    std::cout << "\n=== All pending request tests passed ===\n";
    return 0;
}
