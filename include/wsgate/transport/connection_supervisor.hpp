#ifndef WSGATE_TRANSPORT_CONNECTION_SUPERVISOR_HPP
#define WSGATE_TRANSPORT_CONNECTION_SUPERVISOR_HPP

#include "wsgate/transport.hpp"
#include "wsgate/transport/backoff_policy.hpp"
#include "wsgate/transport/keepalive_monitor.hpp"
#include "wsgate/transport/retry_policy.hpp"
#include "wsgate/transport/transport_connection.hpp"
#include "wsgate/transport/transport_error.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <asio/any_io_executor.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>

namespace wsgate {

/// Sequence number of a physical connection attempt. Starts at 1 and is
/// never reused by a supervisor.
using AttemptId = std::uint64_t;

// ─────────────────────────────────────────────────────────────────────────────
// Connection State
// ─────────────────────────────────────────────────────────────────────────────

/// Transitions:
///   Idle       -> Connecting   connect()
///   Connecting -> Open         transport connected
///   Connecting -> Backoff      retryable failure within the retry budget
///   Connecting -> Terminated   otherwise
///   Open       -> Backoff      unexpected close, error while open, keepalive expiry
///   Backoff    -> Connecting   retry delay elapsed
///   any        -> Connecting   reconnect() (except from Idle)
///   any        -> Idle         disconnect()
enum class ConnectionState : std::uint8_t {
    Idle,         ///< No transport and nothing scheduled
    Connecting,   ///< A transport is connecting
    Open,         ///< The transport is connected
    Backoff,      ///< Waiting for the retry delay to elapse
    Terminated    ///< Retries exhausted or a non-retryable failure
};

[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Idle:       return "Idle";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Open:       return "Open";
        case ConnectionState::Backoff:    return "Backoff";
        case ConnectionState::Terminated: return "Terminated";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Configuration and Events
// ─────────────────────────────────────────────────────────────────────────────

struct SupervisorConfig {
    RetryPolicy retry;
    std::shared_ptr<IBackoffPolicy> backoff{std::make_shared<ConstantBackoff>(std::chrono::seconds{10})};
    std::chrono::milliseconds keepalive_timeout{30000};
};

/// Callbacks raised on the supervisor's strand.
struct SupervisorEvents {
    std::function<void(AttemptId)> on_connected;
    std::function<void(AttemptId, const CloseInfo&)> on_disconnected;
    std::function<void(AttemptId, std::size_t attempts, const ConnectionError&)> on_connection_error;
    std::function<void(AttemptId, std::size_t attempts, const ConnectionError&)> on_terminated;
    std::function<void(AttemptId, std::string raw)> on_frame;
};

// ─────────────────────────────────────────────────────────────────────────────
// ConnectionSupervisor
// ─────────────────────────────────────────────────────────────────────────────
// Owns at most one transport at a time and drives the reconnect state
// machine above.
//
// Threading: connect(), disconnect(), reconnect() and send() must run on the
// strand given to create(). Transport events are re-posted onto that strand
// tagged with their attempt id; events whose attempt id is not current, or
// which do not fit the current state, are ignored. state(), is_open() and
// current_attempt() may be called from any thread.

class ConnectionSupervisor : public std::enable_shared_from_this<ConnectionSupervisor> {
public:
    using Strand = asio::strand<asio::any_io_executor>;

    /// Builds the transport options for the next attempt (the URI carries
    /// the current session id).
    using OptionsProvider = std::function<TransportOptions()>;

    /// @throws std::invalid_argument if factory, options or the backoff
    ///         policy are missing
    [[nodiscard]] static std::shared_ptr<ConnectionSupervisor> create(
        Strand strand,
        std::shared_ptr<ITransportFactory> factory,
        SupervisorConfig config,
        OptionsProvider options,
        SupervisorEvents events
    );

    ~ConnectionSupervisor();

    ConnectionSupervisor(const ConnectionSupervisor&) = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle (strand only)
    // ─────────────────────────────────────────────────────────────────────────

    /// Start connecting. Only effective from Idle.
    /// @return true if a new attempt was started
    bool connect();

    /// Close the transport, cancel pending timers and return to Idle.
    void disconnect();

    /// Drop the current transport (if any) and start a fresh attempt at once
    /// with the failure counter reset. No effect while Idle.
    void reconnect();

    /// Send one frame on the open transport.
    [[nodiscard]] TransportResult<void> send(std::string frame);

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] ConnectionState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool is_open() const noexcept {
        return state() == ConnectionState::Open;
    }

    [[nodiscard]] AttemptId current_attempt() const noexcept {
        return attempt_seq_.load(std::memory_order_acquire);
    }

    /// Consecutive failed attempts of the current logical connection (strand only).
    [[nodiscard]] std::size_t consecutive_failures() const noexcept {
        return failures_;
    }

    [[nodiscard]] const SupervisorConfig& config() const noexcept {
        return config_;
    }

private:
    class AttemptListener;

    ConnectionSupervisor(
        Strand strand,
        std::shared_ptr<ITransportFactory> factory,
        SupervisorConfig config,
        OptionsProvider options,
        SupervisorEvents events
    );

    void start_attempt();
    void drop_transport();
    void schedule_retry(std::chrono::milliseconds delay);
    void on_retry_timer(std::uint64_t generation);
    void set_state(ConnectionState next);

    // Transport events, already on the strand
    void handle_connected(AttemptId id);
    void handle_message(AttemptId id, std::string raw);
    void handle_alive(AttemptId id);
    void handle_closed(AttemptId id, CloseInfo info);
    void handle_error(AttemptId id, ConnectionError error);
    void handle_keepalive_timeout(AttemptId id);

    void fail_attempt(AttemptId id, const ConnectionError& error);
    void lose_connection(AttemptId id, const CloseInfo& info);

    [[nodiscard]] bool is_current(AttemptId id) const noexcept {
        return id == attempt_seq_.load(std::memory_order_relaxed);
    }

    Strand strand_;
    std::shared_ptr<ITransportFactory> factory_;
    SupervisorConfig config_;
    OptionsProvider options_;
    SupervisorEvents events_;

    std::unique_ptr<ITransportConnection> transport_;
    std::shared_ptr<KeepaliveMonitor> keepalive_;
    asio::steady_timer retry_timer_;
    std::uint64_t retry_generation_{0};
    std::size_t failures_{0};

    std::atomic<ConnectionState> state_{ConnectionState::Idle};
    std::atomic<AttemptId> attempt_seq_{0};
};

}  // namespace wsgate

#endif  // WSGATE_TRANSPORT_CONNECTION_SUPERVISOR_HPP
