#pragma once
#include <atomic>
#include <chrono>
#include <thread>

namespace mcpsse {

class SseHttpServer;

/// Route SIGINT and SIGTERM to a stop request. The handler only sets a
/// lock-free flag; nothing else runs in signal context.
void install_stop_handlers();

[[nodiscard]] bool stop_requested() noexcept;

/// Clear a pending stop request, e.g. between tests.
void reset_stop_request() noexcept;

/// Shuts the server down from an ordinary thread once a stop is requested.
///
/// shutdown() logs and stops the listener, neither of which may happen
/// inside a signal handler. Keeps asking until destroyed, since a request
/// that arrives before listen() has started would otherwise be lost.
class ShutdownWatcher {
public:
    explicit ShutdownWatcher(SseHttpServer& server,
                             std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));
    ~ShutdownWatcher();

    ShutdownWatcher(const ShutdownWatcher&) = delete;
    ShutdownWatcher& operator=(const ShutdownWatcher&) = delete;

private:
    void run();

    SseHttpServer& server_;
    std::chrono::milliseconds poll_interval_;
    std::atomic_bool watching_{true};
    std::thread thread_;
};

} // namespace mcpsse
