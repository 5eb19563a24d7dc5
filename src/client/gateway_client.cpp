#include "wsgate/client/gateway_client.hpp"

#include "wsgate/log/logger.hpp"

#include <stdexcept>
#include <variant>

#include <asio/post.hpp>

namespace wsgate {

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

std::shared_ptr<GatewayClient> GatewayClient::create(
    asio::any_io_executor executor,
    std::shared_ptr<ITransportFactory> factory,
    ClientConfig config
) {
    const std::string error = config.validation_error();
    if (error.empty() == false) {
        throw std::invalid_argument("Invalid ClientConfig: " + error);
    }
    if (factory == nullptr) {
        throw std::invalid_argument("Invalid ClientConfig: transport factory cannot be null");
    }
    auto uri = ConnectionUri::parse(config.uri);
    if (uri.has_value() == false) {
        throw std::invalid_argument("Invalid ClientConfig: Argument 'uri' should start with 'ws://' or 'wss://'");
    }

    const bool auto_connect = config.auto_connect;
    std::shared_ptr<GatewayClient> client(new GatewayClient(
        std::move(executor),
        std::move(factory),
        std::move(config),
        std::move(*uri)
    ));
    if (auto_connect) {
        client->connect();
    }
    return client;
}

GatewayClient::GatewayClient(
    asio::any_io_executor executor,
    std::shared_ptr<ITransportFactory> factory,
    ClientConfig config,
    ConnectionUri uri
)
    : config_(std::move(config))
    , uri_(std::move(uri))
    , strand_(asio::make_strand(std::move(executor)))
    , session_(config_.session_id.has_value() ? config_.session_id : uri_.session_id())
    , router_(config_.notification_mode)
{
    SupervisorEvents events;
    events.on_connected = [this](AttemptId id) {
        handle_connected(id);
    };
    events.on_disconnected = [this](AttemptId id, const CloseInfo& info) {
        handle_disconnected(id, info);
    };
    events.on_connection_error = [this](AttemptId id, std::size_t attempts, const ConnectionError& error) {
        handle_connection_error(id, attempts, error);
    };
    events.on_terminated = [this](AttemptId id, std::size_t attempts, const ConnectionError& error) {
        handle_terminated(id, attempts, error);
    };
    events.on_frame = [this](AttemptId id, std::string raw) {
        handle_frame(id, std::move(raw));
    };

    supervisor_ = ConnectionSupervisor::create(
        strand_,
        std::move(factory),
        config_.supervisor_config(),
        [this]() { return next_transport_options(); },
        std::move(events)
    );
}

GatewayClient::~GatewayClient() {
    supervisor_.reset();
    try {
        const auto cancelled = correlator_.fail_all(CommandError::cancelled());
        if (cancelled > 0) {
            WSGATE_LOG_DEBUG("Cancelled {} pending command(s) on shutdown", cancelled);
        }
    } catch (const std::exception& e) {
        WSGATE_LOG_ERROR("Result handler threw while cancelling commands on shutdown: {}", e.what());
    } catch (...) {
        WSGATE_LOG_ERROR("Result handler threw a non-standard exception while cancelling commands on shutdown");
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Public Operations
// ═══════════════════════════════════════════════════════════════════════════

template <typename Fn>
void GatewayClient::post_to_strand(Fn fn) {
    asio::post(strand_, [weak_self = weak_from_this(), fn = std::move(fn)]() mutable {
        auto self = weak_self.lock();
        if (self == nullptr) {
            return;
        }
        fn(*self);
    });
}

void GatewayClient::connect() {
    post_to_strand([](GatewayClient& self) {
        self.do_connect();
    });
}

void GatewayClient::disconnect() {
    post_to_strand([](GatewayClient& self) {
        self.do_disconnect();
    });
}

void GatewayClient::reconnect() {
    post_to_strand([](GatewayClient& self) {
        self.do_reconnect();
    });
}

void GatewayClient::validate_command(const Command& command) {
    if (command.name.empty()) {
        throw std::invalid_argument("Argument 'command' should be a non-empty string");
    }
}

void GatewayClient::execute(Command command, ResultHandler handler) {
    validate_command(command);
    post_to_strand([command = std::move(command), handler = std::move(handler)](GatewayClient& self) mutable {
        self.do_execute(std::move(command), std::move(handler));
    });
}

void GatewayClient::execute(std::string name, std::optional<Json> params, ResultHandler handler) {
    execute(Command{std::move(name), std::move(params)}, std::move(handler));
}

void GatewayClient::add_observer(std::shared_ptr<IClientObserver> observer) {
    router_.add_observer(std::move(observer));
}

void GatewayClient::remove_observer(const std::shared_ptr<IClientObserver>& observer) {
    router_.remove_observer(observer);
}

bool GatewayClient::is_connected() const noexcept {
    return supervisor_->is_open();
}

bool GatewayClient::is_ready() const {
    return session_.has_been_ready();
}

ConnectionState GatewayClient::connection_state() const noexcept {
    return supervisor_->state();
}

std::optional<std::string> GatewayClient::session_id() const {
    return session_.session_id();
}

// ═══════════════════════════════════════════════════════════════════════════
// Strand-side Operations
// ═══════════════════════════════════════════════════════════════════════════

void GatewayClient::do_connect() {
    supervisor_->connect();
}

void GatewayClient::do_disconnect() {
    if (supervisor_->state() == ConnectionState::Idle) {
        return;
    }
    supervisor_->disconnect();
    fail_transmitted_commands();
}

void GatewayClient::do_reconnect() {
    if (supervisor_->state() == ConnectionState::Idle) {
        return;
    }
    supervisor_->reconnect();
    fail_transmitted_commands();
}

void GatewayClient::do_execute(Command command, ResultHandler handler) {
    CommandFrame frame{std::move(command.name), std::move(command.params), std::nullopt};
    if (handler) {
        frame.id = correlator_.register_command(std::move(handler));
    }
    send_frame(frame.serialize(), frame.id);
}

void GatewayClient::send_frame(std::string payload, std::optional<CorrelationId> id) {
    // Frames left behind by a failed send on a usable session go out first
    flush_outbound();

    // Older frames go first, and nothing goes out before the first handshake
    const bool can_send_now = supervisor_->is_open()
        && session_.has_been_ready()
        && outbound_.empty()
        && (outbound_.flushing() == false);
    if (can_send_now && transmit(payload, id)) {
        return;
    }

    outbound_.enqueue(std::move(payload), id);
    if (supervisor_->state() == ConnectionState::Idle) {
        WSGATE_LOG_DEBUG("Connecting on demand ({} message(s) queued)", outbound_.size());
        supervisor_->connect();
    }
}

bool GatewayClient::transmit(const std::string& payload, std::optional<CorrelationId> id) {
    auto sent = supervisor_->send(payload);
    if (sent.has_value() == false) {
        WSGATE_LOG_WARN("Could not send message: {}", sent.error().message);
        return false;
    }
    WSGATE_LOG_TRACE("Sent message: {}", payload);
    if (id.has_value()) {
        correlator_.mark_transmitted(*id);
    }
    return true;
}

void GatewayClient::flush_outbound() {
    if (outbound_.empty()) {
        return;
    }
    if (supervisor_->is_open() == false || session_.has_been_ready() == false) {
        return;
    }
    const auto sent = outbound_.flush([this](QueuedMessage& message) {
        return transmit(message.payload, message.correlation_id);
    });
    WSGATE_LOG_DEBUG("Flushed {} queued message(s), {} left", sent, outbound_.size());
}

void GatewayClient::fail_transmitted_commands() {
    if (config_.pending_command_policy != PendingCommandPolicy::FailOnReset) {
        return;
    }
    const auto failed = correlator_.fail_transmitted(CommandError::connection_reset());
    if (failed > 0) {
        WSGATE_LOG_INFO("{} command(s) lost with the connection", failed);
    }
}

TransportOptions GatewayClient::next_transport_options() const {
    TransportOptions options;
    options.uri = uri_.build(session_.session_id(), session_.has_been_ready());
    options.api_key = config_.api_key;
    return options;
}

// ═══════════════════════════════════════════════════════════════════════════
// Supervisor Events
// ═══════════════════════════════════════════════════════════════════════════

void GatewayClient::handle_connected(AttemptId id) {
    router_.publish(ConnectedEvent{id});
}

void GatewayClient::handle_disconnected(AttemptId id, const CloseInfo& info) {
    router_.publish(DisconnectedEvent{id, info.code, info.reason});
    fail_transmitted_commands();
}

void GatewayClient::handle_connection_error(AttemptId id, std::size_t attempts, const ConnectionError& error) {
    router_.publish(ConnectionErrorEvent{id, attempts, error});
}

void GatewayClient::handle_terminated(AttemptId id, std::size_t attempts, const ConnectionError& error) {
    router_.publish(TerminatedEvent{id, attempts, error});
}

void GatewayClient::handle_frame(AttemptId id, std::string raw) {
    auto decoded = decode_frame(raw);
    if (decoded.has_value() == false) {
        WSGATE_LOG_DEBUG(
            "Connection #{}: dropping invalid message ({}: {})",
            id, to_string(decoded.error().code), decoded.error().message
        );
        return;
    }
    InboundFrame& frame = *decoded;

    if (const auto* hello = std::get_if<HelloFrame>(&frame)) {
        handle_hello(*hello);
        return;
    }

    if (session_.has_been_ready() == false) {
        WSGATE_LOG_DEBUG("Connection #{}: ignoring message received before the handshake", id);
        return;
    }

    if (auto* notification = std::get_if<NotificationFrame>(&frame)) {
        router_.route(std::move(*notification));
    } else if (auto* result = std::get_if<ResultFrame>(&frame)) {
        correlator_.resolve(result->id, std::move(result->result));
    } else if (auto* error = std::get_if<ErrorFrame>(&frame)) {
        correlator_.reject(error->id, std::move(error->error));
    }
}

void GatewayClient::handle_hello(const HelloFrame& hello) {
    const auto outcome = session_.handle_hello(hello);
    if (outcome.became_ready) {
        WSGATE_LOG_INFO("Session '{}' ready (new = {})", outcome.session_id, outcome.is_new);
        router_.publish(ReadyEvent{outcome.session_id, outcome.is_new});
    } else {
        WSGATE_LOG_INFO("Session '{}' resumed", outcome.session_id);
    }
    flush_outbound();
}

}  // namespace wsgate
