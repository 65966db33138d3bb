/**
 * @file test_protocol.cpp
 * @brief Unit tests for the JSON-RPC codec (Request/Response)
 */

#include <gtest/gtest.h>
#include "remindd/rpc/protocol.h"
#include "remindd/logger.h"

using remindd::json;

class ProtocolTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Initialize logger in non-journald mode for tests
        remindd::Logger::init(remindd::LogLevel::CRITICAL, false);
    }

    void TearDown() override {
        remindd::Logger::shutdown();
    }

    static void expect_error(const remindd::DecodeResult& result, int code, const json& id) {
        ASSERT_FALSE(result.ok());
        ASSERT_TRUE(result.error.has_value());
        json wire = json::parse(remindd::Codec::encode(*result.error));
        EXPECT_EQ(wire["jsonrpc"], "2.0");
        EXPECT_EQ(wire["error"]["code"], code);
        EXPECT_EQ(wire["id"], id);
        EXPECT_FALSE(wire.contains("result"));
    }
};

// ============================================================================
// Codec::decode() valid input
// ============================================================================

TEST_F(ProtocolTest, DecodesRequestWithIntegerId) {
    auto result = remindd::Codec::decode(R"({"jsonrpc":"2.0","id":7,"method":"ping"})");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.request->method, "ping");
    ASSERT_TRUE(result.request->id.has_value());
    EXPECT_TRUE(result.request->id->is_integer());
    EXPECT_EQ(*result.request->id, remindd::RequestId(7));
    EXPECT_TRUE(result.request->params.is_object());
    EXPECT_TRUE(result.request->params.empty());
}

TEST_F(ProtocolTest, DecodesRequestWithStringIdAndParams) {
    auto result = remindd::Codec::decode(
        R"({"jsonrpc":"2.0","id":"abc","method":"tools/call","params":{"name":"get_lists"}})");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(*result.request->id, remindd::RequestId("abc"));
    EXPECT_EQ(result.request->params["name"], "get_lists");
}

TEST_F(ProtocolTest, DecodesNotification) {
    auto result = remindd::Codec::decode(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");

    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.request->is_notification());
    EXPECT_FALSE(result.error.has_value());
}

TEST_F(ProtocolTest, NullParamsTreatedAsEmpty) {
    auto result = remindd::Codec::decode(R"({"jsonrpc":"2.0","id":1,"method":"ping","params":null})");

    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.request->params.is_object());
}

TEST_F(ProtocolTest, StringAndIntegerIdsAreDistinct) {
    EXPECT_NE(remindd::RequestId(1), remindd::RequestId("1"));
}

// ============================================================================
// Codec::decode() error mapping
// ============================================================================

TEST_F(ProtocolTest, MalformedJsonIsParseErrorWithNullId) {
    expect_error(remindd::Codec::decode(R"({"id":1,)"), remindd::ErrorCodes::PARSE_ERROR, nullptr);
    expect_error(remindd::Codec::decode("not json"), remindd::ErrorCodes::PARSE_ERROR, nullptr);
}

TEST_F(ProtocolTest, NonObjectIsInvalidRequest) {
    expect_error(remindd::Codec::decode("42"), remindd::ErrorCodes::INVALID_REQUEST, nullptr);
    expect_error(remindd::Codec::decode(R"("ping")"), remindd::ErrorCodes::INVALID_REQUEST, nullptr);
}

TEST_F(ProtocolTest, BatchArrayIsInvalidRequest) {
    expect_error(remindd::Codec::decode(R"([{"jsonrpc":"2.0","id":1,"method":"ping"}])"),
                 remindd::ErrorCodes::INVALID_REQUEST, nullptr);
}

TEST_F(ProtocolTest, BadIdTypeIsInvalidRequest) {
    expect_error(remindd::Codec::decode(R"({"jsonrpc":"2.0","id":{"x":1},"method":"ping"})"),
                 remindd::ErrorCodes::INVALID_REQUEST, nullptr);
    expect_error(remindd::Codec::decode(R"({"jsonrpc":"2.0","id":1.5,"method":"ping"})"),
                 remindd::ErrorCodes::INVALID_REQUEST, nullptr);
}

TEST_F(ProtocolTest, IdBeyondInt64IsInvalidRequest) {
    expect_error(remindd::Codec::decode(R"({"jsonrpc":"2.0","id":18446744073709551615,"method":"ping"})"),
                 remindd::ErrorCodes::INVALID_REQUEST, nullptr);
    expect_error(remindd::Codec::decode(R"({"jsonrpc":"2.0","id":9223372036854775808,"method":"ping"})"),
                 remindd::ErrorCodes::INVALID_REQUEST, nullptr);
}

TEST_F(ProtocolTest, Int64BoundaryIdsEchoUnchanged) {
    for (const char* frame : {R"({"jsonrpc":"2.0","id":9223372036854775807,"method":"ping"})",
                              R"({"jsonrpc":"2.0","id":-9223372036854775808,"method":"ping"})"}) {
        auto decoded = remindd::Codec::decode(frame);
        ASSERT_TRUE(decoded.ok()) << frame;
        json sent = json::parse(frame)["id"];
        auto resp = remindd::Response::success(decoded.request->id, json::object());
        EXPECT_EQ(json::parse(remindd::Codec::encode(resp))["id"], sent);
    }
}

TEST_F(ProtocolTest, WrongVersionKeepsId) {
    expect_error(remindd::Codec::decode(R"({"jsonrpc":"1.0","id":3,"method":"ping"})"),
                 remindd::ErrorCodes::INVALID_REQUEST, 3);
    expect_error(remindd::Codec::decode(R"({"id":"q","method":"ping"})"),
                 remindd::ErrorCodes::INVALID_REQUEST, "q");
}

TEST_F(ProtocolTest, MissingMethodKeepsId) {
    expect_error(remindd::Codec::decode(R"({"jsonrpc":"2.0","id":4})"),
                 remindd::ErrorCodes::INVALID_REQUEST, 4);
    expect_error(remindd::Codec::decode(R"({"jsonrpc":"2.0","id":4,"method":12})"),
                 remindd::ErrorCodes::INVALID_REQUEST, 4);
}

TEST_F(ProtocolTest, NonObjectParamsIsInvalidParams) {
    expect_error(remindd::Codec::decode(R"({"jsonrpc":"2.0","id":5,"method":"ping","params":[1]})"),
                 remindd::ErrorCodes::INVALID_PARAMS, 5);
}

TEST_F(ProtocolTest, NotificationWithBadParamsIsDropped) {
    auto result = remindd::Codec::decode(R"({"jsonrpc":"2.0","method":"ping","params":"x"})");
    EXPECT_FALSE(result.request.has_value());
    EXPECT_FALSE(result.error.has_value());
}

// ============================================================================
// Response encoding
// ============================================================================

TEST_F(ProtocolTest, SuccessHasResultAndNoError) {
    auto resp = remindd::Response::success(remindd::RequestId(9), {{"ok", true}});
    json wire = json::parse(remindd::Codec::encode(resp));

    EXPECT_EQ(wire["jsonrpc"], "2.0");
    EXPECT_EQ(wire["id"], 9);
    EXPECT_EQ(wire["result"]["ok"], true);
    EXPECT_FALSE(wire.contains("error"));
}

TEST_F(ProtocolTest, FailureCarriesData) {
    auto resp = remindd::Response::failure(remindd::RequestId("z"), remindd::ErrorCodes::INVALID_PARAMS,
                                           "Invalid params", json{{"detail", "title: is required"}});
    json wire = json::parse(remindd::Codec::encode(resp));

    EXPECT_EQ(wire["id"], "z");
    EXPECT_EQ(wire["error"]["code"], -32602);
    EXPECT_EQ(wire["error"]["message"], "Invalid params");
    EXPECT_EQ(wire["error"]["data"]["detail"], "title: is required");
    EXPECT_FALSE(wire.contains("result"));
}

TEST_F(ProtocolTest, FailureWithoutIdSerializesNull) {
    auto resp = remindd::Response::failure(std::nullopt, remindd::ErrorCodes::PARSE_ERROR, "Parse error");
    json wire = json::parse(remindd::Codec::encode(resp));

    EXPECT_TRUE(wire["id"].is_null());
    EXPECT_FALSE(wire["error"].contains("data"));
}

TEST_F(ProtocolTest, EncodedResponseIsSingleLine) {
    auto resp = remindd::Response::success(remindd::RequestId(1),
                                           {{"text", "line one\nline two"}});
    std::string wire = remindd::Codec::encode(resp);
    EXPECT_EQ(wire.find('\n'), std::string::npos);
}

TEST_F(ProtocolTest, InvalidUtf8IsReplacedNotThrown) {
    std::string bad = "caf\xC3";
    auto resp = remindd::Response::success(remindd::RequestId(1), {{"title", bad}});
    std::string wire;
    EXPECT_NO_THROW(wire = remindd::Codec::encode(resp));
    EXPECT_NO_THROW(json::parse(wire));
}

TEST_F(ProtocolTest, RequestEncodeDecodes) {
    remindd::Request req;
    req.id = remindd::RequestId("r1");
    req.method = "tools/list";
    auto result = remindd::Codec::decode(remindd::Codec::encode(req));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(*result.request, req);
}
