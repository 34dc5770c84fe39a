// Request/response/control line codec

#include <catch2/catch_test_macros.hpp>

#include <mcpcmd/daemon/ipc/rpc_protocol.h>

using namespace mcpcmd;
using namespace mcpcmd::daemon::ipc;

TEST_CASE("parse_request accepts listTools without params", "[daemon][protocol]") {
    auto req = parse_request(R"({"id":"abc123","method":"listTools"})");
    REQUIRE(req);
    CHECK(req.value().id == "abc123");
    CHECK(req.value().method == "listTools");
    CHECK_FALSE(req.value().params.has_value());
}

TEST_CASE("parse_request keeps callTool params in order", "[daemon][protocol]") {
    auto req = parse_request(
        R"({"id":"x","method":"callTool","params":{"name":"echo","arguments":{"z":1,"a":2}}})");
    REQUIRE(req);
    REQUIRE(req.value().params.has_value());
    const auto& args = (*req.value().params)["arguments"];
    CHECK(args.begin().key() == "z");
    CHECK(args.dump() == R"({"z":1,"a":2})");
}

TEST_CASE("parse_request rejects malformed lines", "[daemon][protocol]") {
    CHECK(parse_request("not json").error().code == ErrorCode::MalformedMessage);
    CHECK(parse_request("[1,2]").error().code == ErrorCode::MalformedMessage);
    CHECK(parse_request(R"({"method":"listTools"})").error().code ==
          ErrorCode::MalformedMessage);
    CHECK(parse_request(R"({"id":"1","method":7})").error().code ==
          ErrorCode::MalformedMessage);
    CHECK(parse_request(R"({"id":{"x":1},"method":"listTools"})").error().code ==
          ErrorCode::MalformedMessage);
}

TEST_CASE("encode_response writes one line with only the populated field",
          "[daemon][protocol]") {
    auto ok = encode_response(RpcResponse::success("1", json{{"tools", json::array()}}));
    CHECK(ok == "{\"id\":\"1\",\"result\":{\"tools\":[]}}\n");

    auto failed = encode_response(RpcResponse::failure("2", "Unknown method: nope"));
    CHECK(failed == "{\"id\":\"2\",\"error\":\"Unknown method: nope\"}\n");
}

TEST_CASE("try_parse_response waits for a complete document", "[daemon][protocol]") {
    CHECK_FALSE(try_parse_response(R"({"id":"1","res)").has_value());

    auto done = try_parse_response("{\"id\":\"1\",\"result\":{\"big\":9007199254740993}}\n");
    REQUIRE(done.has_value());
    REQUIRE(*done);
    CHECK(done->value().id == "1");
    REQUIRE(done->value().result.has_value());
    CHECK((*done->value().result)["big"].get<std::int64_t>() == 9007199254740993LL);
    CHECK_FALSE(done->value().error.has_value());
}

TEST_CASE("try_parse_response surfaces error strings and objects", "[daemon][protocol]") {
    auto asString = try_parse_response(R"({"id":"1","error":"Error: boom"})");
    REQUIRE(asString.has_value());
    REQUIRE(*asString);
    CHECK(asString->value().error == std::optional<std::string>("Error: boom"));

    auto asObject = try_parse_response(R"({"id":"1","error":{"message":"bad"}})");
    REQUIRE(asObject.has_value());
    REQUIRE(*asObject);
    CHECK(asObject->value().error == std::optional<std::string>("bad"));

    auto noId = try_parse_response(R"({"result":1})");
    REQUIRE(noId.has_value());
    CHECK_FALSE(*noId);
}

TEST_CASE("control messages", "[daemon][protocol]") {
    auto ready = parse_control_message(encode_ready_message("/tmp/mcp-cmd-a.sock"));
    REQUIRE(ready);
    CHECK(ready.value().type == ControlMessage::Type::Ready);
    CHECK(ready.value().socketAddress == "/tmp/mcp-cmd-a.sock");

    auto error = parse_control_message(encode_error_message("spawn npx ENOENT"));
    REQUIRE(error);
    CHECK(error.value().type == ControlMessage::Type::Error);
    CHECK(error.value().message == "spawn npx ENOENT");

    CHECK_FALSE(parse_control_message(R"({"type":"ready"})"));
    CHECK_FALSE(parse_control_message(R"({"type":"other"})"));
    CHECK_FALSE(parse_control_message("garbage"));
}

TEST_CASE("control messages with non-string fields", "[daemon][protocol]") {
    CHECK(parse_control_message(R"({"type":1})").error().code == ErrorCode::MalformedMessage);
    CHECK(parse_control_message(R"({"type":"ready","socketAddress":7})").error().code ==
          ErrorCode::MalformedMessage);

    auto error = parse_control_message(R"({"type":"error","message":{"code":2}})");
    REQUIRE(error);
    CHECK(error.value().type == ControlMessage::Type::Error);
    CHECK(error.value().message == "worker failed to start");
}
