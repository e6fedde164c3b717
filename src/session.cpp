#include "mcpsse/session.hpp"
#include "mcpsse/codec.hpp"
#include "mcpsse/error.hpp"
#include "mcpsse/log.hpp"
#include <iomanip>
#include <random>
#include <sstream>

namespace mcpsse {

namespace {

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t a = dis(gen), b = dis(gen);
    // Format as UUID v4
    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8)  << (a >> 32);
    oss << "-" << std::setw(4) << ((a >> 16) & 0xFFFF);
    oss << "-" << std::setw(4) << (a & 0xFFFF);
    oss << "-" << std::setw(4) << (b >> 48);
    oss << "-" << std::setw(12) << (b & 0xFFFFFFFFFFFFull);
    return oss.str();
}

} // anonymous namespace

const char* to_string(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::Connecting: return "connecting";
        case SessionPhase::Open:       return "open";
        case SessionPhase::Closing:    return "closing";
        case SessionPhase::Closed:     return "closed";
    }
    return "unknown";
}

const char* to_string(CloseReason reason) {
    switch (reason) {
        case CloseReason::None:             return "none";
        case CloseReason::ClientDisconnect: return "client disconnect";
        case CloseReason::WriteError:       return "write error";
        case CloseReason::IdleTimeout:      return "idle timeout";
        case CloseReason::ExchangeComplete: return "exchange complete";
        case CloseReason::Shutdown:         return "shutdown";
    }
    return "unknown";
}

Session::Session(const Dispatcher& dispatcher, IStreamSink& sink,
                 SessionTimings timings, Clock clock)
    : dispatcher_(dispatcher)
    , sink_(sink)
    , timings_(timings)
    , clock_(clock ? std::move(clock) : Clock([] { return TimerQueue::Clock::now(); }))
    , id_(generate_uuid()) {
}

Session::~Session() {
    // Never fire into a sink that may no longer exist.
    timers_.cancel_all();
}

void Session::start() {
    if (phase_ != SessionPhase::Connecting) {
        throw McpTransportError(std::string("Session ") + id_ + " already started (phase: "
                                + to_string(phase_) + ")");
    }
    phase_ = SessionPhase::Open;
}

void Session::open_stream() {
    start();
    logger()->info("SSE session {} opened", id_);

    if (!push(Codec::make_notification("notification/initialized"))) return;

    auto now = clock_();
    timers_.schedule_once(now, timings_.list_changed_delay, [this] {
        push(Codec::make_notification("notification/tools/list_changed"));
    });
    timers_.schedule_every(now, timings_.heartbeat_interval, [this] {
        send(Codec::HEARTBEAT_FRAME);
    });
    timers_.schedule_once(now, timings_.idle_timeout, [this] {
        logger()->info("SSE session {} auto-closed after timeout", id_);
        terminate(CloseReason::IdleTimeout, true);
    });
}

void Session::exchange(std::string_view body) {
    start();
    logger()->debug("Exchange session {} received {} bytes", id_, body.size());

    JsonRpcMessage msg;
    try {
        msg = Codec::parse(body);
    } catch (const McpParseError& e) {
        logger()->warn("Session {}: unparseable body: {}", id_, e.what());
        JsonRpcError err{error::ParseError, "Parse error", std::nullopt};
        if (push(Codec::make_error(nullptr, std::move(err)))) {
            terminate(CloseReason::ExchangeComplete, true);
        }
        return;
    } catch (const McpProtocolError& e) {
        logger()->warn("Session {}: invalid envelope: {}", id_, e.what());
        if (push(Codec::make_error(nullptr, JsonRpcError{e.code, e.what(), e.data}))) {
            schedule_drain();
        }
        return;
    }

    auto response = dispatcher_.handle(msg);
    if (response && !push(*response)) return;
    schedule_drain();
}

void Session::schedule_drain() {
    timers_.schedule_once(clock_(), timings_.drain_delay, [this] {
        logger()->info("Session {}: response sent, closing stream", id_);
        terminate(CloseReason::ExchangeComplete, true);
    });
}

size_t Session::poll() {
    if (phase_ != SessionPhase::Open) return 0;
    return timers_.run_due(clock_());
}

std::optional<TimerQueue::TimePoint> Session::next_deadline() const {
    return timers_.next_deadline();
}

void Session::on_disconnect() {
    if (phase_ == SessionPhase::Open || phase_ == SessionPhase::Connecting) {
        logger()->info("SSE session {} closed by client", id_);
    }
    terminate(CloseReason::ClientDisconnect, false);
}

void Session::close(CloseReason reason) {
    terminate(reason, true);
}

bool Session::send(std::string_view frame) {
    if (phase_ != SessionPhase::Open) return false;
    if (!sink_.write(frame)) {
        logger()->warn("SSE session {}: stream write failed", id_);
        terminate(CloseReason::WriteError, false);
        return false;
    }
    ++frames_sent_;
    return true;
}

bool Session::push(const JsonRpcMessage& msg) {
    std::string frame = Codec::sse_frame(msg);
    bool ok = send(frame);
    if (ok) logger()->debug("Session {} sent: {}", id_, frame.substr(0, frame.size() - 2));
    return ok;
}

void Session::terminate(CloseReason reason, bool close_sink) {
    if (phase_ == SessionPhase::Closing || phase_ == SessionPhase::Closed) return;

    bool was_open = phase_ == SessionPhase::Open;
    phase_ = SessionPhase::Closing;
    close_reason_ = reason;
    size_t cancelled = timers_.cancel_all();
    if (close_sink && was_open) sink_.close();
    phase_ = SessionPhase::Closed;

    logger()->debug("Session {} closed ({}), {} timer(s) cancelled",
                    id_, to_string(reason), cancelled);
}

} // namespace mcpsse
