#ifndef WSGATE_TRANSPORT_KEEPALIVE_MONITOR_HPP
#define WSGATE_TRANSPORT_KEEPALIVE_MONITOR_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include <asio/any_io_executor.hpp>
#include <asio/steady_timer.hpp>

namespace wsgate {

// ─────────────────────────────────────────────────────────────────────────────
// KeepaliveMonitor
// ─────────────────────────────────────────────────────────────────────────────
// Detects silent connection loss on an open connection.
//
// Every window the monitor clears its "alive" flag and sends a ping. Any pong
// or inbound frame during the window sets the flag again (record_activity()).
// If the window elapses with the flag still clear, on_timeout fires once and
// the monitor stops.
//
// All member functions must be called on the executor passed to create();
// the timer completes on that same executor.

class KeepaliveMonitor : public std::enable_shared_from_this<KeepaliveMonitor> {
public:
    using PingFn = std::function<void()>;
    using TimeoutFn = std::function<void()>;

    [[nodiscard]] static std::shared_ptr<KeepaliveMonitor> create(asio::any_io_executor executor);

    KeepaliveMonitor(const KeepaliveMonitor&) = delete;
    KeepaliveMonitor& operator=(const KeepaliveMonitor&) = delete;

    /// Start monitoring. Restarts the cycle if already running.
    void start(std::chrono::milliseconds window, PingFn ping, TimeoutFn on_timeout);

    /// Stop monitoring. A window already elapsed but not yet handled is
    /// discarded.
    void stop();

    /// Record a sign of life (pong or inbound frame).
    void record_activity() noexcept {
        alive_ = true;
    }

    [[nodiscard]] bool running() const noexcept {
        return running_;
    }

    [[nodiscard]] std::chrono::milliseconds window() const noexcept {
        return window_;
    }

private:
    explicit KeepaliveMonitor(asio::any_io_executor executor);

    void begin_window();
    void on_window_elapsed(std::uint64_t generation);

    asio::steady_timer timer_;
    std::chrono::milliseconds window_{0};
    PingFn ping_;
    TimeoutFn on_timeout_;
    std::uint64_t generation_{0};
    bool running_{false};
    bool alive_{false};
};

}  // namespace wsgate

#endif  // WSGATE_TRANSPORT_KEEPALIVE_MONITOR_HPP
