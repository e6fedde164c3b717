#include "mcpsse/transport/shutdown_signal.hpp"
#include "mcpsse/log.hpp"
#include "mcpsse/transport/sse_http_server.hpp"

#include <csignal>

namespace mcpsse {

namespace {

std::atomic_bool g_stop_requested(false);

static_assert(std::atomic_bool::is_always_lock_free, "stop flag must be usable from a signal handler");

void on_signal(int) {
    g_stop_requested = true;
}

} // anonymous namespace

void install_stop_handlers() {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
}

bool stop_requested() noexcept {
    return g_stop_requested;
}

void reset_stop_request() noexcept {
    g_stop_requested = false;
}

ShutdownWatcher::ShutdownWatcher(SseHttpServer& server, std::chrono::milliseconds poll_interval)
    : server_(server)
    , poll_interval_(poll_interval)
    , thread_([this] { run(); }) {}

ShutdownWatcher::~ShutdownWatcher() {
    watching_ = false;
    if (thread_.joinable()) thread_.join();
}

void ShutdownWatcher::run() {
    bool announced = false;
    while (watching_) {
        if (stop_requested()) {
            if (!announced) {
                logger()->info("Stop signal received");
                announced = true;
            }
            // Wait for the accept loop; stopping earlier would not reach it.
            if (server_.is_running()) server_.shutdown();
        }
        std::this_thread::sleep_for(poll_interval_);
    }
}

} // namespace mcpsse
