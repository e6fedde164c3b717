#include <gtest/gtest.h>
#include "mcpsse/json_rpc.hpp"
#include "mcpsse/version.hpp"
#include <nlohmann/json.hpp>
#include <limits>

using namespace mcpsse;

TEST(JsonRpcRequest, ConstructAndSerialize) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "tools/call";
    req.params = nlohmann::json{{"name", "search"}};

    nlohmann::json j;
    to_json(j, req);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["method"], "tools/call");
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["params"]["name"], "search");
}

TEST(JsonRpcRequest, StringId) {
    JsonRpcRequest req;
    req.id = RequestId{std::string{"my-id"}};
    req.method = "ping";

    nlohmann::json j;
    to_json(j, req);
    EXPECT_EQ(j["id"], "my-id");
}

TEST(JsonRpcResponse, WithResult) {
    JsonRpcResponse resp;
    resp.id = RequestId{int64_t{42}};
    resp.result = nlohmann::json{{"ok", true}};

    nlohmann::json j;
    to_json(j, resp);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 42);
    EXPECT_EQ(j["result"]["ok"], true);
    EXPECT_FALSE(j.contains("error"));
}

TEST(JsonRpcResponse, WithError) {
    JsonRpcResponse resp;
    resp.id = RequestId{int64_t{1}};
    resp.error = JsonRpcError{-32601, "Method not found", std::nullopt};

    nlohmann::json j;
    to_json(j, resp);
    EXPECT_EQ(j["error"]["code"], -32601);
    EXPECT_EQ(j["error"]["message"], "Method not found");
    EXPECT_FALSE(j["error"].contains("data"));
    EXPECT_FALSE(j.contains("result"));
}

TEST(JsonRpcResponse, ErrorWinsOverResult) {
    JsonRpcResponse resp;
    resp.id = RequestId{int64_t{1}};
    resp.result = nlohmann::json::object();
    resp.error = JsonRpcError{-32603, "Internal error", nlohmann::json("boom")};

    nlohmann::json j;
    to_json(j, resp);
    EXPECT_TRUE(j.contains("error"));
    EXPECT_FALSE(j.contains("result"));
    EXPECT_EQ(j["error"]["data"], "boom");
}

TEST(JsonRpcResponse, MissingResultSerializesAsNull) {
    JsonRpcResponse resp;
    resp.id = RequestId{int64_t{3}};

    nlohmann::json j;
    to_json(j, resp);
    ASSERT_TRUE(j.contains("result"));
    EXPECT_TRUE(j["result"].is_null());
}

TEST(JsonRpcResponse, NullIdIsKept) {
    JsonRpcResponse resp;
    resp.error = JsonRpcError{-32700, "Parse error", std::nullopt};

    nlohmann::json j;
    to_json(j, resp);
    ASSERT_TRUE(j.contains("id"));
    EXPECT_TRUE(j["id"].is_null());
}

TEST(JsonRpcNotification, Serialize) {
    JsonRpcNotification notif;
    notif.method = "notification/initialized";
    notif.params = nlohmann::json::object();

    nlohmann::json j;
    to_json(j, notif);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["method"], "notification/initialized");
    EXPECT_TRUE(j["params"].is_object());
    EXPECT_FALSE(j.contains("id"));
}

TEST(RequestId, IntId) {
    RequestId id = int64_t{123};
    nlohmann::json j;
    to_json(j, id);
    EXPECT_EQ(j, 123);
}

TEST(RequestId, StringId) {
    RequestId id = std::string{"hello"};
    nlohmann::json j;
    to_json(j, id);
    EXPECT_EQ(j, "hello");
}

TEST(RequestId, FromJsonInt) {
    nlohmann::json j = 42;
    RequestId id;
    from_json(j, id);
    ASSERT_TRUE(std::holds_alternative<int64_t>(id));
    EXPECT_EQ(std::get<int64_t>(id), 42);
}

TEST(RequestId, FromJsonFloat) {
    nlohmann::json j = 1.5;
    RequestId id;
    from_json(j, id);
    ASSERT_TRUE(std::holds_alternative<double>(id));
    EXPECT_DOUBLE_EQ(std::get<double>(id), 1.5);
}

TEST(RequestId, FromJsonNull) {
    nlohmann::json j = nullptr;
    RequestId id = int64_t{7};
    from_json(j, id);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(id));
}

TEST(RequestId, FromJsonUnsignedInRangeIsSigned) {
    nlohmann::json j = uint64_t{42};
    RequestId id;
    from_json(j, id);
    ASSERT_TRUE(std::holds_alternative<int64_t>(id));
    EXPECT_EQ(std::get<int64_t>(id), 42);
}

TEST(RequestId, FromJsonAboveInt64Max) {
    nlohmann::json j = std::numeric_limits<uint64_t>::max();
    RequestId id;
    from_json(j, id);
    ASSERT_TRUE(std::holds_alternative<uint64_t>(id));
    EXPECT_EQ(std::get<uint64_t>(id), std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(to_string(id), "18446744073709551615");
}

TEST(RequestId, FromJsonObjectThrows) {
    nlohmann::json j = nlohmann::json::object();
    RequestId id;
    EXPECT_THROW(from_json(j, id), std::invalid_argument);
}

TEST(RequestId, DefaultIsNull) {
    RequestId id;
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(id));
    EXPECT_EQ(to_string(id), "null");
}

TEST(JsonRpcError, Equality) {
    JsonRpcError e1{-32601, "Not found", std::nullopt};
    JsonRpcError e2{-32601, "Not found", std::nullopt};
    JsonRpcError e3{-32600, "Invalid", std::nullopt};
    EXPECT_EQ(e1, e2);
    EXPECT_FALSE(e1 == e3);
}
