#include <gtest/gtest.h>
#include "mcpsse/mcpsse.hpp"
#include <httplib.h>
#include <chrono>
#include <thread>
#include <vector>

using namespace mcpsse;

namespace {

/// Split an event-stream body into its frames, separators included.
std::vector<std::string> split_frames(const std::string& body) {
    std::vector<std::string> frames;
    size_t start = 0;
    while (start < body.size()) {
        size_t end = body.find("\n\n", start);
        if (end == std::string::npos) {
            frames.push_back(body.substr(start));
            break;
        }
        frames.push_back(body.substr(start, end - start + 2));
        start = end + 2;
    }
    return frames;
}

nlohmann::json frame_json(const std::string& frame) {
    EXPECT_EQ(frame.rfind("data: ", 0), 0u) << frame;
    return nlohmann::json::parse(frame.substr(6));
}

} // anonymous namespace

class HttpE2ETest : public ::testing::Test {
protected:
    ToolRegistry registry_{default_tools()};
    StubDataProvider provider_{[] { return std::string("2024-11-05T10:00:00.000Z"); }};
    std::unique_ptr<Dispatcher> dispatcher_;
    std::unique_ptr<SseHttpServer> server_;
    std::unique_ptr<httplib::Client> client_;
    std::thread server_thread_;

    void SetUp() override {
        dispatcher_ = std::make_unique<Dispatcher>(registry_, provider_);

        SseHttpServer::Options opts;
        opts.host = "127.0.0.1";
        opts.max_connections = 4;
        opts.timings.drain_delay = std::chrono::milliseconds(50);
        opts.poll_interval = std::chrono::milliseconds(10);
        server_ = std::make_unique<SseHttpServer>(*dispatcher_, opts);

        int port = server_->bind_to_any_port();
        server_thread_ = std::thread([this]() {
            server_->listen_after_bind();
        });

        // Wait for server to be ready
        for (int i = 0; i < 100 && !server_->is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        client_ = std::make_unique<httplib::Client>("127.0.0.1", port);
        client_->set_read_timeout(5, 0);
    }

    void TearDown() override {
        server_->shutdown();
        if (server_thread_.joinable()) server_thread_.join();
    }

    nlohmann::json post(const std::string& body) {
        auto res = client_->Post("/sse", body, "application/json");
        EXPECT_TRUE(res);
        if (!res) return nullptr;
        EXPECT_EQ(res->status, 200);
        auto frames = split_frames(res->body);
        EXPECT_EQ(frames.size(), 1u) << res->body;
        if (frames.empty()) return nullptr;
        return frame_json(frames[0]);
    }
};

TEST_F(HttpE2ETest, InitializeOverPost) {
    auto resp = post(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","clientInfo":{"name":"e2e","version":"1"}}})");
    EXPECT_EQ(resp["id"], 1);
    EXPECT_EQ(resp["result"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ(resp["result"]["serverInfo"]["name"], "ghl-mcp-server");
    EXPECT_EQ(resp["result"]["capabilities"]["tools"], nlohmann::json::object());
}

TEST_F(HttpE2ETest, PostResponseHeaders) {
    auto res = client_->Post("/sse", R"({"jsonrpc":"2.0","id":1,"method":"ping"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->get_header_value("Content-Type"), "text/event-stream");
    EXPECT_EQ(res->get_header_value("Cache-Control"), "no-cache");
    EXPECT_EQ(res->get_header_value("X-Accel-Buffering"), "no");
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
    EXPECT_EQ(res->body, "data: {\"id\":1,\"jsonrpc\":\"2.0\",\"result\":{}}\n\n");
}

TEST_F(HttpE2ETest, RepeatedPingsOverPost) {
    auto first = post(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    auto second = post(R"({"jsonrpc":"2.0","id":"b","method":"ping"})");
    auto third = post(R"({"jsonrpc":"2.0","id":3,"method":"ping"})");

    EXPECT_EQ(first["id"], 1);
    EXPECT_EQ(second["id"], "b");
    EXPECT_EQ(third["id"], 3);
    for (const auto& resp : {first, second, third}) {
        EXPECT_EQ(resp["result"], nlohmann::json::object());
        EXPECT_FALSE(resp.contains("error"));
    }
}

TEST_F(HttpE2ETest, ToolsListOverPost) {
    auto resp = post(R"({"jsonrpc":"2.0","id":"list","method":"tools/list"})");
    EXPECT_EQ(resp["id"], "list");
    ASSERT_EQ(resp["result"]["tools"].size(), 2u);
    EXPECT_EQ(resp["result"]["tools"][0]["name"], "search");
    EXPECT_EQ(resp["result"]["tools"][1]["name"], "retrieve");
}

TEST_F(HttpE2ETest, ToolsCallOverPost) {
    auto resp = post(R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"retrieve","arguments":{"id":"c-1","type":"contact"}}})");
    ASSERT_TRUE(resp.contains("result"));
    const auto& content = resp["result"]["content"];
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(content[0]["type"], "text");
    std::string text = content[0]["text"];
    EXPECT_NE(text.find("GoHighLevel contact Retrieved: ID c-1"), std::string::npos);
    EXPECT_NE(text.find("Last Updated: 2024-11-05T10:00:00.000Z"), std::string::npos);
}

TEST_F(HttpE2ETest, UnknownToolOverPost) {
    auto resp = post(R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"export"}})");
    EXPECT_EQ(resp["id"], 4);
    EXPECT_EQ(resp["error"]["code"], error::MethodNotFound);
    EXPECT_EQ(resp["error"]["message"], "Method not found: export");
}

TEST_F(HttpE2ETest, WrongVersionOverPost) {
    auto resp = post(R"({"jsonrpc":"1.0","id":5,"method":"ping"})");
    EXPECT_EQ(resp["id"], 5);
    EXPECT_EQ(resp["error"]["code"], error::InvalidRequest);
}

TEST_F(HttpE2ETest, ParseErrorOverPost) {
    auto resp = post("this is not json");
    EXPECT_TRUE(resp["id"].is_null());
    EXPECT_EQ(resp["error"]["code"], error::ParseError);
    EXPECT_EQ(resp["error"]["message"], "Parse error");
}

TEST_F(HttpE2ETest, NotificationOverPostHasEmptyBody) {
    auto res = client_->Post("/sse", R"({"jsonrpc":"2.0","method":"notifications/initialized"})",
                             "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_TRUE(res->body.empty());
}

TEST_F(HttpE2ETest, Health) {
    for (const char* path : {"/", "/health"}) {
        auto res = client_->Get(path);
        ASSERT_TRUE(res) << path;
        EXPECT_EQ(res->status, 200);
        auto body = nlohmann::json::parse(res->body);
        EXPECT_EQ(body["status"], "healthy");
        EXPECT_EQ(body["server"], "ghl-mcp-server");
        EXPECT_EQ(body["version"], "1.0.0");
        EXPECT_EQ(body["protocol"], "2024-11-05");
        EXPECT_EQ(body["tools"], nlohmann::json::array({"search", "retrieve"}));
        EXPECT_EQ(body["endpoint"], "/sse");
        EXPECT_TRUE(body["timestamp"].is_string());
    }
}

TEST_F(HttpE2ETest, HealthAnswersAnyMethod) {
    std::vector<httplib::Result> results;
    results.push_back(client_->Post("/", "", "application/json"));
    results.push_back(client_->Post("/health", "{}", "application/json"));
    results.push_back(client_->Put("/health", "", "application/json"));
    results.push_back(client_->Delete("/health"));
    for (auto& res : results) {
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 200);
        EXPECT_EQ(nlohmann::json::parse(res->body)["status"], "healthy");
    }
}

TEST_F(HttpE2ETest, PreflightCors) {
    auto res = client_->Options("/sse");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Methods"), "GET, POST, OPTIONS");
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Headers"), "Content-Type, Accept, Authorization");
    EXPECT_EQ(res->get_header_value("Access-Control-Max-Age"), "86400");
}

TEST_F(HttpE2ETest, UnknownPath) {
    auto res = client_->Get("/nowhere");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(nlohmann::json::parse(res->body), (nlohmann::json{{"error", "Not found"}}));
}

TEST_F(HttpE2ETest, FaviconIsBare404) {
    auto res = client_->Get("/favicon.ico");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_TRUE(res->body.empty());
}
