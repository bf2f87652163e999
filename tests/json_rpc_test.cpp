#include <catch2/catch_test_macros.hpp>
#include "mcpx/protocol/json_rpc.hpp"

using namespace mcpx;

TEST_CASE("ProtocolMessage parses a request", "[json_rpc]") {
    auto message = ProtocolMessage::parse(R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"x"}})");

    REQUIRE(message.has_value());
    REQUIRE(message->kind() == MessageKind::Request);
    REQUIRE(message->id() == JsonRpcId::integer(7));
    REQUIRE(message->method() == "tools/call");
    REQUIRE(message->payload()["params"]["name"] == "x");
}

TEST_CASE("ProtocolMessage distinguishes notifications, responses and errors", "[json_rpc]") {
    auto notification = ProtocolMessage::parse(R"({"jsonrpc":"2.0","method":"notifications/progress"})");
    REQUIRE(notification.has_value());
    REQUIRE(notification->is_notification());
    REQUIRE(notification->id().has_value() == false);

    auto response = ProtocolMessage::parse(R"({"jsonrpc":"2.0","id":"abc","result":{}})");
    REQUIRE(response.has_value());
    REQUIRE(response->kind() == MessageKind::Response);
    REQUIRE(response->is_reply());
    REQUIRE(response->answers(JsonRpcId::string("abc")));
    REQUIRE(response->answers(JsonRpcId::integer(1)) == false);

    auto error = ProtocolMessage::parse(R"({"jsonrpc":"2.0","id":null,"error":{"code":-32600,"message":"bad"}})");
    REQUIRE(error.has_value());
    REQUIRE(error->kind() == MessageKind::Error);
    REQUIRE(error->id().has_value() == false);
}

TEST_CASE("ProtocolMessage rejects invalid input", "[json_rpc]") {
    REQUIRE(ProtocolMessage::parse("{not json").error().code == JsonError::Code::ParseError);
    REQUIRE(ProtocolMessage::parse("[]").error().code == JsonError::Code::NotAnObject);
    REQUIRE(ProtocolMessage::parse(R"({"id":1,"method":"x"})").error().code == JsonError::Code::MissingField);
    REQUIRE(ProtocolMessage::parse(R"({"jsonrpc":"1.0","id":1,"method":"x"})").error().code
            == JsonError::Code::InvalidVersion);
    REQUIRE(ProtocolMessage::parse(R"({"jsonrpc":"2.0","id":1.5,"method":"x"})").error().code
            == JsonError::Code::InvalidId);
    REQUIRE(ProtocolMessage::parse(R"({"jsonrpc":"2.0","id":1,"method":"x","params":3})").error().code
            == JsonError::Code::InvalidParams);
    REQUIRE(ProtocolMessage::parse(R"({"jsonrpc":"2.0","result":{}})").error().code
            == JsonError::Code::InvalidId);
    REQUIRE(ProtocolMessage::parse(R"({"jsonrpc":"2.0","id":1,"error":{"message":"m"}})").error().code
            == JsonError::Code::MissingField);
    REQUIRE(ProtocolMessage::parse(R"({"jsonrpc":"2.0","id":1})").has_value() == false);
}

TEST_CASE("ProtocolMessage keeps unknown fields verbatim", "[json_rpc]") {
    auto message = ProtocolMessage::parse(R"({"jsonrpc":"2.0","id":1,"method":"m","_meta":{"trace":"t"}})");

    REQUIRE(message.has_value());
    auto reparsed = Json::parse(message->serialize());
    REQUIRE(reparsed["_meta"]["trace"] == "t");
}

TEST_CASE("error_response carries code, message and data", "[json_rpc]") {
    auto message = ProtocolMessage::error_response(
        JsonRpcId::integer(3),
        JsonRpcError{rpc_error::kBlockedByPolicy, "blocked", Json{{"reason", "deny"}}});

    const auto& payload = message.payload();
    REQUIRE(payload["id"] == 3);
    REQUIRE(payload["error"]["code"] == -32001);
    REQUIRE(payload["error"]["message"] == "blocked");
    REQUIRE(payload["error"]["data"]["reason"] == "deny");
}

TEST_CASE("error_response without id serializes a null id", "[json_rpc]") {
    auto message = ProtocolMessage::error_response(std::nullopt, JsonRpcError{rpc_error::kParseError, "parse"});

    REQUIRE(message.payload()["id"].is_null());
    REQUIRE(message.payload()["error"].contains("data") == false);
}

TEST_CASE("JsonRpcId renders integers and strings", "[json_rpc]") {
    REQUIRE(JsonRpcId::integer(42).to_string() == "42");
    REQUIRE(JsonRpcId::string("req-1").to_string() == "req-1");
    REQUIRE(JsonRpcId::integer(1) != JsonRpcId::string("1"));
}
