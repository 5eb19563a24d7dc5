#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Gateway Client
// ═══════════════════════════════════════════════════════════════════════════
// Keeps one logical session with a streaming gateway alive across
// reconnections.
//
// Usage:
//   asio::io_context io;
//   ClientConfig config;
//   config.uri = "wss://gateway.example/";
//
//   auto client = GatewayClient::create(io.get_executor(), factory, config);
//   client->add_observer(observer);
//   client->execute(commands::subscribe_to_tickers("binance", {"USDT-BTC"}));
//
//   // Completion tokens work as well
//   auto pairs = client->async_execute(commands::get_pairs("binance"), asio::use_future);
//
//   io.run();
//
// Threading: every state change happens on an internal strand. The public
// operations post to that strand and return at once, so they may be called
// from any thread, including from observer callbacks and result handlers.
// is_connected(), is_ready(), connection_state() and session_id() are safe
// from any thread.

#include "wsgate/client/client_config.hpp"
#include "wsgate/client/command_correlator.hpp"
#include "wsgate/client/command_error.hpp"
#include "wsgate/client/event_router.hpp"
#include "wsgate/client/outbound_buffer.hpp"
#include "wsgate/protocol/commands.hpp"
#include "wsgate/protocol/frames.hpp"
#include "wsgate/session/session_manager.hpp"
#include "wsgate/transport/connection_supervisor.hpp"
#include "wsgate/transport/connection_uri.hpp"
#include "wsgate/transport/transport_connection.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

#include <asio/any_io_executor.hpp>
#include <asio/associated_executor.hpp>
#include <asio/async_result.hpp>
#include <asio/dispatch.hpp>
#include <asio/strand.hpp>

namespace wsgate {

class GatewayClient : public std::enable_shared_from_this<GatewayClient> {
public:
    using Strand = asio::strand<asio::any_io_executor>;

    /// Create a client. Connects right away when config.auto_connect is set.
    /// @throws std::invalid_argument if the configuration is invalid or the
    ///         factory is null
    [[nodiscard]] static std::shared_ptr<GatewayClient> create(
        asio::any_io_executor executor,
        std::shared_ptr<ITransportFactory> factory,
        ClientConfig config
    );

    /// Commands still pending are resolved with CommandError::cancelled().
    ~GatewayClient();

    GatewayClient(const GatewayClient&) = delete;
    GatewayClient& operator=(const GatewayClient&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Connection Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Start connecting if idle. No effect otherwise.
    void connect();

    /// Close the connection and stop reconnecting. Buffered frames are kept
    /// and sent on the next ready session.
    void disconnect();

    /// Replace the current connection with a fresh one, resetting the retry
    /// budget. This is the only way out of the terminated state. No effect
    /// while idle.
    void reconnect();

    // ─────────────────────────────────────────────────────────────────────────
    // Commands
    // ─────────────────────────────────────────────────────────────────────────

    /// Send a command. With a handler, a correlation id is allocated and the
    /// handler is invoked exactly once with the result or error. Sending
    /// while idle starts connecting.
    /// @throws std::invalid_argument if the command name is empty
    void execute(Command command, ResultHandler handler = nullptr);

    void execute(std::string name, std::optional<Json> params, ResultHandler handler = nullptr);

    /// Send a command and complete the token with its CommandResult.
    /// Works with callbacks, asio::use_future and asio::use_awaitable.
    /// @throws std::invalid_argument if the command name is empty
    template <typename CompletionToken>
    auto async_execute(Command command, CompletionToken&& token) {
        validate_command(command);
        return asio::async_initiate<CompletionToken, void(CommandResult)>(
            [self = shared_from_this(), command = std::move(command)](auto handler) mutable {
                using Handler = std::decay_t<decltype(handler)>;
                // ResultHandler is copyable; completion handlers may not be
                auto shared_handler = std::make_shared<Handler>(std::move(handler));
                self->execute(std::move(command), [fallback = self->get_executor(), shared_handler](CommandResult result) {
                    auto executor = asio::get_associated_executor(*shared_handler, fallback);
                    asio::dispatch(executor, [shared_handler, result = std::move(result)]() mutable {
                        std::move(*shared_handler)(std::move(result));
                    });
                });
            },
            token
        );
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Observers
    // ─────────────────────────────────────────────────────────────────────────

    void add_observer(std::shared_ptr<IClientObserver> observer);
    void remove_observer(const std::shared_ptr<IClientObserver>& observer);

    // ─────────────────────────────────────────────────────────────────────────
    // State Queries
    // ─────────────────────────────────────────────────────────────────────────

    /// The transport is open.
    [[nodiscard]] bool is_connected() const noexcept;

    /// A handshake has been received at least once.
    [[nodiscard]] bool is_ready() const;

    [[nodiscard]] ConnectionState connection_state() const noexcept;

    [[nodiscard]] std::optional<std::string> session_id() const;

    /// Commands waiting for a result (strand only).
    [[nodiscard]] std::size_t pending_command_count() const noexcept {
        return correlator_.size();
    }

    /// Frames waiting for a usable session (strand only).
    [[nodiscard]] std::size_t queued_message_count() const noexcept {
        return outbound_.size();
    }

    [[nodiscard]] const ClientConfig& config() const noexcept {
        return config_;
    }

    [[nodiscard]] asio::any_io_executor get_executor() const noexcept {
        return strand_.get_inner_executor();
    }

private:
    GatewayClient(
        asio::any_io_executor executor,
        std::shared_ptr<ITransportFactory> factory,
        ClientConfig config,
        ConnectionUri uri
    );

    static void validate_command(const Command& command);

    /// Post a member call onto the strand, skipped if the client is gone.
    template <typename Fn>
    void post_to_strand(Fn fn);

    // Strand-side operations
    void do_connect();
    void do_disconnect();
    void do_reconnect();
    void do_execute(Command command, ResultHandler handler);

    void send_frame(std::string payload, std::optional<CorrelationId> id);
    bool transmit(const std::string& payload, std::optional<CorrelationId> id);
    void flush_outbound();
    void fail_transmitted_commands();

    [[nodiscard]] TransportOptions next_transport_options() const;

    // Supervisor events
    void handle_connected(AttemptId id);
    void handle_disconnected(AttemptId id, const CloseInfo& info);
    void handle_connection_error(AttemptId id, std::size_t attempts, const ConnectionError& error);
    void handle_terminated(AttemptId id, std::size_t attempts, const ConnectionError& error);
    void handle_frame(AttemptId id, std::string raw);
    void handle_hello(const HelloFrame& hello);

    ClientConfig config_;
    ConnectionUri uri_;
    Strand strand_;

    SessionManager session_;
    CommandCorrelator correlator_;
    OutboundBuffer outbound_;
    EventRouter router_;

    // Declared last: destroyed first, closing the transport while the
    // members its callbacks use are still alive
    std::shared_ptr<ConnectionSupervisor> supervisor_;
};

}  // namespace wsgate
