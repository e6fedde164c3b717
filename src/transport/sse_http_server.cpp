#include "mcpsse/transport/sse_http_server.hpp"
#include "mcpsse/data_provider.hpp"
#include "mcpsse/error.hpp"
#include "mcpsse/log.hpp"
#include "mcpsse/version.hpp"

#include <httplib.h>

#include <string_view>
#include <thread>

namespace mcpsse {

namespace {

/// IStreamSink over the chunked body of one httplib response.
class HttpStreamSink : public IStreamSink {
public:
    explicit HttpStreamSink(httplib::DataSink& sink) : sink_(sink) {}

    bool write(std::string_view frame) override {
        if (done_ || !sink_.is_writable()) return false;
        return sink_.write(frame.data(), frame.size());
    }

    void close() override {
        if (done_) return;
        done_ = true;
        sink_.done();
    }

private:
    httplib::DataSink& sink_;
    bool done_{false};
};

// Workers kept free of streams so health checks and rejections are served
// while every stream slot is taken.
constexpr size_t SPARE_WORKERS = 2;

/// One reserved stream slot; released when the response owning it is
/// destroyed.
struct StreamSlot {
    explicit StreamSlot(std::atomic<int>& counter) : counter_(counter) {}
    ~StreamSlot() { --counter_; }
    std::atomic<int>& counter_;
};

void log_request(const httplib::Request& req) {
    logger()->info("{} {}", req.method, req.path);
    logger()->debug("User-Agent: {}", req.get_header_value("User-Agent"));
}

} // anonymous namespace

SseHttpServer::SseHttpServer(const Dispatcher& dispatcher, Options opts)
    : dispatcher_(dispatcher)
    , opts_(std::move(opts))
    , server_(std::make_unique<httplib::Server>()) {
    const size_t streams = static_cast<size_t>(opts_.max_connections > 0 ? opts_.max_connections : 1);
    const size_t workers = streams + SPARE_WORKERS;
    server_->new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
    setup_routes();
}

SseHttpServer::~SseHttpServer() {
    shutdown();
}

void SseHttpServer::set_stream_headers(httplib::Response& res) const {
    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");
    res.set_header("X-Accel-Buffering", "no");
}

void SseHttpServer::handle_health(const httplib::Request& req, httplib::Response& res) const {
    log_request(req);
    const auto& info = dispatcher_.options().server_info;
    nlohmann::json body = {
        {"status", "healthy"},
        {"server", info.name},
        {"version", info.version},
        {"protocol", std::string(PROTOCOL_VERSION)},
        {"timestamp", iso8601_now()},
        {"tools", dispatcher_.registry().names()},
        {"endpoint", opts_.sse_path}
    };
    res.set_content(body.dump(), "application/json");
}

std::shared_ptr<void> SseHttpServer::reserve_stream() {
    int current = active_sessions_.load();
    do {
        if (current >= opts_.max_connections) return nullptr;
    } while (!active_sessions_.compare_exchange_weak(current, current + 1));
    return std::make_shared<StreamSlot>(active_sessions_);
}

void SseHttpServer::reject_busy(httplib::Response& res) const {
    logger()->warn("Rejecting stream: all {} stream slots in use", opts_.max_connections);
    res.status = 503;
    res.set_header("Retry-After", "1");
    res.set_content("{\"error\":\"Too many connections\"}", "application/json");
}

bool SseHttpServer::drive(Session& session, httplib::DataSink& sink) {
    while (session.phase() == SessionPhase::Open) {
        if (!running_) {
            session.close(CloseReason::Shutdown);
            break;
        }
        if (!sink.is_writable()) {
            session.on_disconnect();
            break;
        }
        auto wake = TimerQueue::Clock::now() + opts_.poll_interval;
        auto deadline = session.next_deadline();
        if (deadline && *deadline < wake) wake = *deadline;
        std::this_thread::sleep_until(wake);
        session.poll();
    }

    // Returning false makes httplib drop the connection instead of
    // finishing the chunked body.
    auto reason = session.close_reason();
    return reason != CloseReason::ClientDisconnect && reason != CloseReason::WriteError;
}

void SseHttpServer::setup_routes() {
    const std::string path = opts_.sse_path;

    server_->set_default_headers({
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type, Accept, Authorization"},
        {"Access-Control-Max-Age", "86400"}
    });

    // CORS preflight for any path
    server_->Options(R"(.*)", [](const httplib::Request& req, httplib::Response& res) {
        log_request(req);
        res.status = 200;
    });

    auto health = [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    };
    for (const char* route : {"/", "/health"}) {
        server_->Get(route, health);
        server_->Post(route, health);
        server_->Put(route, health);
        server_->Patch(route, health);
        server_->Delete(route, health);
    }

    // GET: long-lived stream
    server_->Get(path, [this](const httplib::Request& req, httplib::Response& res) {
        log_request(req);
        auto slot = reserve_stream();
        if (!slot) {
            reject_busy(res);
            return;
        }
        set_stream_headers(res);
        res.set_chunked_content_provider("text/event-stream",
            [this, slot](size_t /*offset*/, httplib::DataSink& sink) -> bool {
                HttpStreamSink out(sink);
                Session session(dispatcher_, out, opts_.timings);
                session.open_stream();
                return drive(session, sink);
            });
    });

    // POST: one JSON-RPC message in, one frame out
    server_->Post(path, [this](const httplib::Request& req, httplib::Response& res) {
        log_request(req);
        auto slot = reserve_stream();
        if (!slot) {
            reject_busy(res);
            return;
        }
        set_stream_headers(res);
        res.set_chunked_content_provider("text/event-stream",
            [this, slot, body = req.body](size_t /*offset*/, httplib::DataSink& sink) -> bool {
                HttpStreamSink out(sink);
                Session session(dispatcher_, out, opts_.timings);
                session.exchange(body);
                return drive(session, sink);
            });
    });

    server_->set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        // Favicon probes get a bare 404.
        if (res.status == 404 && res.body.empty()
            && req.path.find("favicon") == std::string::npos) {
            res.set_content("{\"error\":\"Not found\"}", "application/json");
        }
    });
}

void SseHttpServer::listen() {
    if (running_.exchange(true)) return;

    logger()->info("MCP SSE server listening on {}:{}{}", opts_.host, opts_.port, opts_.sse_path);
    if (!server_->listen(opts_.host, opts_.port) && running_) {
        running_ = false;
        throw McpTransportError("Failed to start HTTP server on " + opts_.host + ":" + std::to_string(opts_.port));
    }
}

int SseHttpServer::bind_to_any_port() {
    int port = server_->bind_to_any_port(opts_.host);
    if (port < 0) {
        throw McpTransportError("Failed to bind HTTP server on " + opts_.host);
    }
    opts_.port = static_cast<uint16_t>(port);
    return port;
}

void SseHttpServer::listen_after_bind() {
    if (running_.exchange(true)) return;

    logger()->info("MCP SSE server listening on {}:{}{}", opts_.host, opts_.port, opts_.sse_path);
    if (!server_->listen_after_bind() && running_) {
        running_ = false;
        throw McpTransportError("HTTP server on port " + std::to_string(opts_.port) + " stopped unexpectedly");
    }
}

void SseHttpServer::shutdown() {
    if (!running_.exchange(false)) return;
    logger()->info("MCP SSE server shutting down");
    server_->stop();
}

bool SseHttpServer::is_running() const {
    return running_ && server_->is_running();
}

} // namespace mcpsse
