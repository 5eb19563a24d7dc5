#include "wsgate/transport/connection_supervisor.hpp"

#include "wsgate/log/logger.hpp"

#include <stdexcept>

#include <asio/post.hpp>

namespace wsgate {

// ─────────────────────────────────────────────────────────────────────────────
// AttemptListener
// ─────────────────────────────────────────────────────────────────────────────
// One per transport. Tags every event with the attempt id and hops onto the
// strand. Events are always posted, never dispatched, so a transport that
// reports synchronously from inside connect() or close() does not re-enter
// the supervisor.

class ConnectionSupervisor::AttemptListener final : public ITransportListener {
public:
    AttemptListener(std::weak_ptr<ConnectionSupervisor> owner, Strand strand, AttemptId id)
        : owner_(std::move(owner))
        , strand_(std::move(strand))
        , id_(id)
    {}

    void on_connected() override {
        deliver([](ConnectionSupervisor& self, AttemptId id) {
            self.handle_connected(id);
        });
    }

    void on_message(std::string raw) override {
        deliver([raw = std::move(raw)](ConnectionSupervisor& self, AttemptId id) mutable {
            self.handle_message(id, std::move(raw));
        });
    }

    void on_alive() override {
        deliver([](ConnectionSupervisor& self, AttemptId id) {
            self.handle_alive(id);
        });
    }

    void on_closed(CloseInfo info) override {
        deliver([info = std::move(info)](ConnectionSupervisor& self, AttemptId id) mutable {
            self.handle_closed(id, std::move(info));
        });
    }

    void on_connection_error(ConnectionError error) override {
        deliver([error = std::move(error)](ConnectionSupervisor& self, AttemptId id) mutable {
            self.handle_error(id, std::move(error));
        });
    }

private:
    template <typename Fn>
    void deliver(Fn fn) {
        asio::post(strand_, [owner = owner_, id = id_, fn = std::move(fn)]() mutable {
            auto self = owner.lock();
            if (self == nullptr) {
                return;
            }
            fn(*self, id);
        });
    }

    std::weak_ptr<ConnectionSupervisor> owner_;
    Strand strand_;
    AttemptId id_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

std::shared_ptr<ConnectionSupervisor> ConnectionSupervisor::create(
    Strand strand,
    std::shared_ptr<ITransportFactory> factory,
    SupervisorConfig config,
    OptionsProvider options,
    SupervisorEvents events
) {
    if (factory == nullptr) {
        throw std::invalid_argument("ConnectionSupervisor: transport factory cannot be null");
    }
    if (config.backoff == nullptr) {
        throw std::invalid_argument("ConnectionSupervisor: backoff policy cannot be null");
    }
    if (options == nullptr) {
        throw std::invalid_argument("ConnectionSupervisor: options provider cannot be empty");
    }
    return std::shared_ptr<ConnectionSupervisor>(new ConnectionSupervisor(
        std::move(strand),
        std::move(factory),
        std::move(config),
        std::move(options),
        std::move(events)
    ));
}

ConnectionSupervisor::ConnectionSupervisor(
    Strand strand,
    std::shared_ptr<ITransportFactory> factory,
    SupervisorConfig config,
    OptionsProvider options,
    SupervisorEvents events
)
    : strand_(std::move(strand))
    , factory_(std::move(factory))
    , config_(std::move(config))
    , options_(std::move(options))
    , events_(std::move(events))
    , keepalive_(KeepaliveMonitor::create(strand_))
    , retry_timer_(strand_)
{}

ConnectionSupervisor::~ConnectionSupervisor() {
    keepalive_->stop();
    retry_timer_.cancel();
    if (transport_ != nullptr) {
        transport_->close();
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

bool ConnectionSupervisor::connect() {
    if (state() != ConnectionState::Idle) {
        return false;
    }
    failures_ = 0;
    start_attempt();
    return true;
}

void ConnectionSupervisor::disconnect() {
    if (state() == ConnectionState::Idle) {
        return;
    }
    WSGATE_LOG_INFO(
        "Disconnecting (state {}, {} attempts made)",
        to_string(state()), current_attempt()
    );
    ++retry_generation_;
    retry_timer_.cancel();
    drop_transport();
    failures_ = 0;
    set_state(ConnectionState::Idle);
}

void ConnectionSupervisor::reconnect() {
    if (state() == ConnectionState::Idle) {
        return;
    }
    WSGATE_LOG_INFO("Reconnecting from state {}", to_string(state()));
    ++retry_generation_;
    retry_timer_.cancel();
    drop_transport();
    failures_ = 0;
    config_.backoff->reset();
    start_attempt();
}

TransportResult<void> ConnectionSupervisor::send(std::string frame) {
    const bool can_send = (state() == ConnectionState::Open) && (transport_ != nullptr);
    if (can_send == false) {
        return tl::unexpected(TransportError::closed());
    }
    return transport_->send(std::move(frame));
}

// ─────────────────────────────────────────────────────────────────────────────
// Attempts
// ─────────────────────────────────────────────────────────────────────────────

void ConnectionSupervisor::start_attempt() {
    const AttemptId id = attempt_seq_.fetch_add(1, std::memory_order_acq_rel) + 1;
    set_state(ConnectionState::Connecting);

    auto listener = std::make_shared<AttemptListener>(weak_from_this(), strand_, id);
    transport_ = factory_->create(options_(), std::move(listener));
    if (transport_ == nullptr) {
        // Reported asynchronously like any other attempt failure
        auto error = ConnectionError::connect_failed("Transport factory returned no connection");
        error.retryable = false;
        asio::post(strand_, [weak_self = weak_from_this(), id, error = std::move(error)]() {
            auto self = weak_self.lock();
            if (self == nullptr) {
                return;
            }
            self->handle_error(id, error);
        });
        return;
    }

    WSGATE_LOG_DEBUG("Connection #{} connecting", id);
    transport_->connect();
}

void ConnectionSupervisor::drop_transport() {
    keepalive_->stop();
    auto transport = std::move(transport_);
    if (transport != nullptr) {
        transport->close();
    }
}

void ConnectionSupervisor::schedule_retry(std::chrono::milliseconds delay) {
    const auto generation = ++retry_generation_;
    retry_timer_.expires_after(delay);
    retry_timer_.async_wait([weak_self = weak_from_this(), generation](const std::error_code& ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        auto self = weak_self.lock();
        if (self == nullptr) {
            return;
        }
        self->on_retry_timer(generation);
    });
}

void ConnectionSupervisor::on_retry_timer(std::uint64_t generation) {
    const bool stale = (generation != retry_generation_) || (state() != ConnectionState::Backoff);
    if (stale) {
        return;
    }
    start_attempt();
}

void ConnectionSupervisor::set_state(ConnectionState next) {
    const auto previous = state_.exchange(next, std::memory_order_acq_rel);
    if (previous != next) {
        WSGATE_LOG_DEBUG("Connection state {} -> {}", to_string(previous), to_string(next));
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Transport Events
// ─────────────────────────────────────────────────────────────────────────────

void ConnectionSupervisor::handle_connected(AttemptId id) {
    if (is_current(id) == false || state() != ConnectionState::Connecting) {
        return;
    }
    WSGATE_LOG_INFO("Connection #{} connected", id);
    set_state(ConnectionState::Open);
    config_.backoff->reset();

    std::weak_ptr<ConnectionSupervisor> weak_self = weak_from_this();
    keepalive_->start(
        config_.keepalive_timeout,
        [weak_self]() {
            auto self = weak_self.lock();
            if (self != nullptr && self->transport_ != nullptr) {
                self->transport_->ping();
            }
        },
        [weak_self, id]() {
            auto self = weak_self.lock();
            if (self != nullptr) {
                self->handle_keepalive_timeout(id);
            }
        }
    );

    if (events_.on_connected) {
        events_.on_connected(id);
    }
}

void ConnectionSupervisor::handle_message(AttemptId id, std::string raw) {
    if (is_current(id) == false || state() != ConnectionState::Open) {
        return;
    }
    keepalive_->record_activity();
    if (events_.on_frame) {
        events_.on_frame(id, std::move(raw));
    }
}

void ConnectionSupervisor::handle_alive(AttemptId id) {
    if (is_current(id) == false || state() != ConnectionState::Open) {
        return;
    }
    keepalive_->record_activity();
}

void ConnectionSupervisor::handle_closed(AttemptId id, CloseInfo info) {
    if (is_current(id) == false) {
        return;
    }
    switch (state()) {
        case ConnectionState::Connecting:
            fail_attempt(id, ConnectionError::closed_before_open(info.code, info.reason));
            return;
        case ConnectionState::Open:
            lose_connection(id, info);
            return;
        default:
            return;
    }
}

void ConnectionSupervisor::handle_error(AttemptId id, ConnectionError error) {
    if (is_current(id) == false) {
        return;
    }
    switch (state()) {
        case ConnectionState::Connecting:
            fail_attempt(id, error);
            return;
        case ConnectionState::Open:
            lose_connection(id, CloseInfo{kAbnormalClosure, error.message});
            return;
        default:
            return;
    }
}

void ConnectionSupervisor::handle_keepalive_timeout(AttemptId id) {
    if (is_current(id) == false || state() != ConnectionState::Open) {
        return;
    }
    lose_connection(id, CloseInfo{kAbnormalClosure, "keepalive timeout"});
}

// ─────────────────────────────────────────────────────────────────────────────
// Failure Handling
// ─────────────────────────────────────────────────────────────────────────────

void ConnectionSupervisor::fail_attempt(AttemptId id, const ConnectionError& error) {
    drop_transport();
    ++failures_;

    if (config_.retry.should_retry(error, failures_)) {
        const auto delay = config_.backoff->next_delay(failures_);
        WSGATE_LOG_INFO(
            "Connection #{} failed (will try to reconnect in {}ms): attempts = {}, error = '{}'",
            id, delay.count(), failures_, error.message
        );
        set_state(ConnectionState::Backoff);
        schedule_retry(delay);
        if (events_.on_connection_error) {
            events_.on_connection_error(id, failures_, error);
        }
        return;
    }

    WSGATE_LOG_ERROR(
        "Connection #{} failed (no more retry left): attempts = {}, error = '{}' ({})",
        id, failures_, error.message, to_string(error.code)
    );
    set_state(ConnectionState::Terminated);
    if (events_.on_terminated) {
        events_.on_terminated(id, failures_, error);
    }
}

void ConnectionSupervisor::lose_connection(AttemptId id, const CloseInfo& info) {
    drop_transport();
    failures_ = 0;

    const auto delay = config_.backoff->next_delay(failures_);
    WSGATE_LOG_WARN(
        "Connection #{} disconnected (will try to reconnect in {}ms): code = {}, reason = '{}'",
        id, delay.count(), info.code, info.reason
    );
    set_state(ConnectionState::Backoff);
    schedule_retry(delay);
    if (events_.on_disconnected) {
        events_.on_disconnected(id, info);
    }
}

}  // namespace wsgate
