#include "wsgate/transport/keepalive_monitor.hpp"

#include "wsgate/log/logger.hpp"

namespace wsgate {

std::shared_ptr<KeepaliveMonitor> KeepaliveMonitor::create(asio::any_io_executor executor) {
    return std::shared_ptr<KeepaliveMonitor>(new KeepaliveMonitor(std::move(executor)));
}

KeepaliveMonitor::KeepaliveMonitor(asio::any_io_executor executor)
    : timer_(std::move(executor))
{}

void KeepaliveMonitor::start(std::chrono::milliseconds window, PingFn ping, TimeoutFn on_timeout) {
    stop();
    window_ = window;
    ping_ = std::move(ping);
    on_timeout_ = std::move(on_timeout);
    running_ = true;
    begin_window();
}

void KeepaliveMonitor::stop() {
    ++generation_;
    running_ = false;
    timer_.cancel();
}

void KeepaliveMonitor::begin_window() {
    alive_ = false;
    if (ping_) {
        ping_();
    }

    const auto generation = generation_;
    std::weak_ptr<KeepaliveMonitor> weak_self = weak_from_this();
    timer_.expires_after(window_);
    timer_.async_wait([weak_self, generation](const std::error_code& ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        auto self = weak_self.lock();
        if (self == nullptr) {
            return;
        }
        self->on_window_elapsed(generation);
    });
}

void KeepaliveMonitor::on_window_elapsed(std::uint64_t generation) {
    const bool stale = (generation != generation_) || (running_ == false);
    if (stale) {
        return;
    }

    if (alive_) {
        begin_window();
        return;
    }

    WSGATE_LOG_WARN("No sign of life within {}ms", window_.count());
    running_ = false;
    // Move out first: the callback may restart the monitor
    auto on_timeout = std::move(on_timeout_);
    on_timeout_ = nullptr;
    if (on_timeout) {
        on_timeout();
    }
}

}  // namespace wsgate
