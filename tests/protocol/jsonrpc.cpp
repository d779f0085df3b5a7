#include "mcplink/exceptions.hpp"
#include "mcplink/protocol/jsonrpc.hpp"

#include <cassert>
#include <iostream>
#include <string>

int main()
{
    using mcplink::Json;
    namespace rpc = mcplink::protocol;

    std::cout << "Test: request and notification envelopes...\n";
    {
        auto req = rpc::make_request(7, "tools/list", Json::object());
        assert(req["jsonrpc"] == "2.0");
        assert(req["id"] == 7);
        assert(req["method"] == "tools/list");
        assert(req["params"].is_object());

        auto note = rpc::make_notification("initialized", Json::object());
        assert(!note.contains("id"));
        assert(note["method"] == "initialized");
        std::cout << "  [PASS] envelopes\n";
    }

    std::cout << "Test: classify messages...\n";
    {
        auto m = rpc::parse_message(std::string(R"({"jsonrpc":"2.0","id":1,"result":{"ok":true}})"));
        assert(m && std::holds_alternative<rpc::Response>(*m));
        auto& r = std::get<rpc::Response>(*m);
        assert(!r.is_error());
        assert((*r.result)["ok"] == true);

        m = rpc::parse_message(std::string(R"({"jsonrpc":"2.0","method":"notifications/progress"})"));
        assert(m && std::holds_alternative<rpc::Notification>(*m));

        m = rpc::parse_message(std::string(R"({"jsonrpc":"2.0","id":"abc","method":"ping"})"));
        assert(m && std::holds_alternative<rpc::Request>(*m));
        assert(std::get<rpc::Request>(*m).params.is_object());

        // Error replies may carry a null id
        m = rpc::parse_message(
            std::string(R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"Parse error"}})"));
        assert(m && std::holds_alternative<rpc::Response>(*m));
        assert(std::get<rpc::Response>(*m).error->code == rpc::PARSE_ERROR);
        std::cout << "  [PASS] request/notification/response\n";
    }

    std::cout << "Test: reject malformed envelopes...\n";
    {
        assert(!rpc::parse_message(std::string("not json")));
        assert(!rpc::parse_message(std::string("[1,2,3]")));
        assert(!rpc::parse_message(std::string(R"({"id":1,"result":{}})")));
        assert(!rpc::parse_message(std::string(R"({"jsonrpc":"1.0","id":1,"result":{}})")));
        // both or neither of result/error
        assert(!rpc::parse_message(std::string(R"({"jsonrpc":"2.0","id":1})")));
        assert(!rpc::parse_message(
            std::string(R"({"jsonrpc":"2.0","id":1,"result":{},"error":{"code":1,"message":"x"}})")));
        // success without id
        assert(!rpc::parse_message(std::string(R"({"jsonrpc":"2.0","result":{}})")));
        // bad id type
        assert(!rpc::parse_message(std::string(R"({"jsonrpc":"2.0","id":{"a":1},"result":{}})")));
        assert(!rpc::parse_message(std::string(R"({"jsonrpc":"2.0","id":1,"method":42})")));
        std::cout << "  [PASS] malformed input rejected\n";
    }

    std::cout << "Test: numeric ids...\n";
    {
        assert(rpc::numeric_id(Json(42)) == 42);
        assert(rpc::numeric_id(Json("17")) == 17);
        assert(!rpc::numeric_id(Json("17a")));
        assert(!rpc::numeric_id(Json("abc")));
        assert(!rpc::numeric_id(Json()));
        std::cout << "  [PASS] numeric_id\n";
    }

    std::cout << "Test: unwrap...\n";
    {
        rpc::Response ok;
        ok.id = 1;
        ok.result = Json{{"tools", Json::array()}};
        assert(rpc::unwrap(ok)["tools"].is_array());

        rpc::Response empty;
        empty.id = 2;
        empty.result = Json();
        assert(rpc::unwrap(empty).is_null());

        rpc::Response err;
        err.id = 3;
        err.error = rpc::RpcError{rpc::METHOD_NOT_FOUND, "Method not found", std::nullopt};
        bool threw = false;
        try
        {
            rpc::unwrap(err);
        }
        catch (const mcplink::ProtocolError& e)
        {
            threw = true;
            assert(std::string(e.what()) == "Method not found");
            assert(e.code() == rpc::METHOD_NOT_FOUND);
        }
        assert(threw);

        err.error->message.clear();
        threw = false;
        try
        {
            rpc::unwrap(err);
        }
        catch (const mcplink::ProtocolError& e)
        {
            threw = true;
            assert(std::string(e.what()) == "MCP error");
        }
        assert(threw);
        std::cout << "  [PASS] unwrap\n";
    }

    std::cout << "Test: to_json keeps the envelope...\n";
    {
        auto text = std::string(R"({"jsonrpc":"2.0","id":5,"error":{"code":-32602,"message":"bad","data":{"x":1}}})");
        auto m = rpc::parse_message(text);
        assert(m);
        Json back = rpc::to_json(*m);
        assert(back == Json::parse(text));
        std::cout << "  [PASS] to_json\n";
    }

    std::cout << "\n=== All JSON-RPC tests passed ===\n";
    return 0;
}
