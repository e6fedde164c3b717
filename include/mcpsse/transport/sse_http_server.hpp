#pragma once
#include "../dispatcher.hpp"
#include "../session.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    class Server;
    class DataSink;
    struct Request;
    struct Response;
}

namespace mcpsse {

/// HTTP front end: `GET <sse_path>` opens a stream session,
/// `POST <sse_path>` runs a single exchange, `/` and `/health` report
/// status, every response carries permissive CORS headers.
///
/// Each accepted stream is driven to completion on the httplib worker that
/// accepted it; sessions share nothing but the dispatcher.
class SseHttpServer {
public:
    struct Options {
        std::string host = "0.0.0.0";
        uint16_t port = 3000;
        std::string sse_path = "/sse";
        /// Concurrent streams. Further GET/POST on the stream path are
        /// answered 503 until a slot frees up.
        int max_connections = 100;
        SessionTimings timings;
        /// Upper bound on how long a stream goes without checking for a
        /// disconnected peer.
        std::chrono::milliseconds poll_interval{50};
    };

    SseHttpServer(const Dispatcher& dispatcher, Options opts);
    ~SseHttpServer();

    SseHttpServer(const SseHttpServer&) = delete;
    SseHttpServer& operator=(const SseHttpServer&) = delete;

    /// Bind and serve; blocks until shutdown().
    /// Throws McpTransportError when the address cannot be bound.
    void listen();

    /// Bind to an ephemeral port on the configured host and return it.
    /// Serve with listen_after_bind().
    int bind_to_any_port();
    void listen_after_bind();

    /// Stop accepting and close every open stream.
    void shutdown();

    [[nodiscard]] bool is_running() const;
    /// Streams holding a slot, from acceptance until their response is
    /// released.
    [[nodiscard]] int active_sessions() const noexcept { return active_sessions_; }
    [[nodiscard]] uint16_t port() const noexcept { return opts_.port; }

private:
    void setup_routes();
    void handle_health(const httplib::Request& req, httplib::Response& res) const;
    void set_stream_headers(httplib::Response& res) const;
    bool drive(Session& session, httplib::DataSink& sink);

    /// Claim one of the max_connections stream slots, or nullptr when all
    /// are taken.
    std::shared_ptr<void> reserve_stream();
    void reject_busy(httplib::Response& res) const;

    const Dispatcher& dispatcher_;
    Options opts_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::atomic<int> active_sessions_{0};
};

} // namespace mcpsse
