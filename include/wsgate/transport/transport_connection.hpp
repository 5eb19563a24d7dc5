#ifndef WSGATE_TRANSPORT_TRANSPORT_CONNECTION_HPP
#define WSGATE_TRANSPORT_TRANSPORT_CONNECTION_HPP

#include "wsgate/transport.hpp"
#include "wsgate/transport/transport_error.hpp"

#include <memory>
#include <optional>
#include <string>

namespace wsgate {

// ═══════════════════════════════════════════════════════════════════════════
// Transport Contract
// ═══════════════════════════════════════════════════════════════════════════
// One ITransportConnection represents exactly one physical websocket
// connection attempt. It is never reopened: the supervisor asks the factory
// for a fresh instance on every attempt.
//
// Listener callbacks may arrive on any thread. The supervisor re-posts them
// onto its strand, so implementations must not assume strand affinity.

/// Events raised by a transport connection.
class ITransportListener {
public:
    virtual ~ITransportListener() = default;

    /// The websocket upgrade completed.
    virtual void on_connected() = 0;

    /// A text frame arrived.
    virtual void on_message(std::string raw) = 0;

    /// A pong arrived.
    virtual void on_alive() = 0;

    /// The connection closed after having been established (or the peer
    /// closed during the upgrade).
    virtual void on_closed(CloseInfo info) = 0;

    /// The connection attempt failed.
    virtual void on_connection_error(ConnectionError error) = 0;
};

/// One physical connection attempt.
class ITransportConnection {
public:
    virtual ~ITransportConnection() = default;

    /// Begin connecting. Completion is reported through the listener.
    virtual void connect() = 0;

    /// Send one text frame.
    [[nodiscard]] virtual TransportResult<void> send(std::string frame) = 0;

    /// Send a websocket ping. A pong is reported through on_alive().
    virtual void ping() = 0;

    /// Close the connection. No further listener events are expected after
    /// this call, but the supervisor tolerates late ones.
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;
};

struct TransportOptions {
    std::string uri;
    std::optional<std::string> api_key;  // sent as the "api-key" upgrade header
};

/// Creates one transport per connection attempt.
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    [[nodiscard]] virtual std::unique_ptr<ITransportConnection> create(
        const TransportOptions& options,
        std::shared_ptr<ITransportListener> listener
    ) = 0;
};

}  // namespace wsgate

#endif  // WSGATE_TRANSPORT_TRANSPORT_CONNECTION_HPP
