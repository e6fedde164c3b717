#pragma once
#include "dispatcher.hpp"
#include "json_rpc.hpp"
#include "timer_queue.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace mcpsse {

enum class SessionPhase {
    Connecting,
    Open,
    Closing,
    Closed
};

enum class CloseReason {
    None,
    ClientDisconnect,
    WriteError,
    IdleTimeout,
    ExchangeComplete,
    Shutdown
};

const char* to_string(SessionPhase phase);
const char* to_string(CloseReason reason);

/// Writable end of one event stream.
class IStreamSink {
public:
    virtual ~IStreamSink() = default;

    /// Write one complete frame. Returns false once the stream is unusable.
    virtual bool write(std::string_view frame) = 0;

    /// End the stream from the server side.
    virtual void close() = 0;
};

struct SessionTimings {
    std::chrono::milliseconds list_changed_delay{100};
    std::chrono::milliseconds heartbeat_interval{25000};
    std::chrono::milliseconds idle_timeout{50000};
    std::chrono::milliseconds drain_delay{2500};
};

/// One streaming connection.
///
/// A stream session (open_stream) announces itself, sends a delayed
/// tools/list_changed notification, heartbeats on an interval and closes
/// itself after the idle timeout. An exchange session (exchange) answers a
/// single posted message and closes after the drain delay.
///
/// The session owns its timers and cancels all of them on every terminal
/// transition, so no callback runs once the stream is torn down. It is
/// driven from a single thread: the owner calls poll() whenever
/// next_deadline() passes.
class Session {
public:
    using Clock = std::function<TimerQueue::TimePoint()>;

    /// `clock` defaults to std::chrono::steady_clock.
    Session(const Dispatcher& dispatcher, IStreamSink& sink,
            SessionTimings timings = SessionTimings{}, Clock clock = nullptr);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Connecting -> Open for a long-lived stream.
    /// Throws McpTransportError if the session was already started.
    void open_stream();

    /// Connecting -> Open for a single request/response exchange.
    /// Throws McpTransportError if the session was already started.
    void exchange(std::string_view body);

    /// Run timers that are due now. Returns the number of callbacks run.
    size_t poll();

    [[nodiscard]] std::optional<TimerQueue::TimePoint> next_deadline() const;

    /// The peer went away; the sink is not touched again.
    void on_disconnect();

    /// Server-initiated close, e.g. on shutdown.
    void close(CloseReason reason = CloseReason::Shutdown);

    [[nodiscard]] SessionPhase phase() const noexcept { return phase_; }
    [[nodiscard]] CloseReason close_reason() const noexcept { return close_reason_; }
    [[nodiscard]] size_t pending_timers() const noexcept { return timers_.pending(); }
    [[nodiscard]] size_t frames_sent() const noexcept { return frames_sent_; }
    [[nodiscard]] const std::string& id() const noexcept { return id_; }

private:
    void start();
    bool send(std::string_view frame);
    bool push(const JsonRpcMessage& msg);
    void schedule_drain();
    void terminate(CloseReason reason, bool close_sink);

    const Dispatcher& dispatcher_;
    IStreamSink& sink_;
    SessionTimings timings_;
    Clock clock_;
    std::string id_;

    SessionPhase phase_{SessionPhase::Connecting};
    CloseReason close_reason_{CloseReason::None};
    TimerQueue timers_;
    size_t frames_sent_{0};
};

} // namespace mcpsse
