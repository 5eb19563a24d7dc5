#pragma once

#include "wsgate/protocol/notification.hpp"
#include "wsgate/transport/backoff_policy.hpp"
#include "wsgate/transport/connection_supervisor.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace wsgate {

// ─────────────────────────────────────────────────────────────────────────────
// Pending Command Policy
// ─────────────────────────────────────────────────────────────────────────────
// What happens to commands already written to a connection that is lost
// (unexpected close, reconnect() or disconnect()) before they are answered.
// Commands still buffered are never affected: they go out on the next ready
// session.

enum class PendingCommandPolicy : std::uint8_t {
    FailOnReset,  ///< Resolve them with CommandError::connection_reset()
    Abandon       ///< Leave them pending; a later answer is still delivered
};

[[nodiscard]] constexpr std::string_view to_string(PendingCommandPolicy policy) noexcept {
    switch (policy) {
        case PendingCommandPolicy::FailOnReset: return "FailOnReset";
        case PendingCommandPolicy::Abandon:     return "Abandon";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// ClientConfig
// ─────────────────────────────────────────────────────────────────────────────
// Usage:
//   ClientConfig config;
//   config.uri = "wss://gateway.example/?timeout=60";
//   config.with_retry_count(5)
//         .with_retry_delay(std::chrono::seconds{2})
//         .with_notification_mode(NotificationMode::Aggregated);

struct ClientConfig {
    static constexpr std::chrono::milliseconds kMinRetryDelay{1000};
    static constexpr std::chrono::milliseconds kDefaultRetryDelay{10000};
    static constexpr std::chrono::milliseconds kMinPingTimeout{1000};
    static constexpr std::chrono::milliseconds kDefaultPingTimeout{30000};

    /// ws:// or wss:// gateway URI. Query parameters are forwarded on every
    /// connection; a "sid" parameter seeds the session id.
    std::string uri;

    /// Connect as soon as the client is created.
    bool auto_connect{true};

    NotificationMode notification_mode{NotificationMode::PerKind};

    /// Session to resume. Takes precedence over a sid in the URI.
    std::optional<std::string> session_id;

    /// Sent with every connection attempt.
    std::optional<std::string> api_key;

    /// Retries after consecutive failed attempts; nullopt retries forever.
    std::optional<std::size_t> retry_count;

    /// Delay before each retry (>= kMinRetryDelay).
    std::chrono::milliseconds retry_delay{kDefaultRetryDelay};

    /// Keepalive window (>= kMinPingTimeout).
    std::chrono::milliseconds ping_timeout{kDefaultPingTimeout};

    PendingCommandPolicy pending_command_policy{PendingCommandPolicy::FailOnReset};

    /// Overrides retry_delay when set.
    std::shared_ptr<IBackoffPolicy> backoff_policy;

    // ─────────────────────────────────────────────────────────────────────────
    // Builders
    // ─────────────────────────────────────────────────────────────────────────

    ClientConfig& with_uri(std::string value);
    ClientConfig& with_auto_connect(bool enabled);
    ClientConfig& with_notification_mode(NotificationMode mode);

    /// Surrounding whitespace is trimmed; an empty value clears the session id.
    ClientConfig& with_session_id(std::string_view value);

    /// An empty key clears it.
    ClientConfig& with_api_key(std::string value);

    ClientConfig& with_retry_count(std::size_t retries);
    ClientConfig& with_unbounded_retries();
    ClientConfig& with_retry_delay(std::chrono::milliseconds delay);
    ClientConfig& with_ping_timeout(std::chrono::milliseconds timeout);
    ClientConfig& with_pending_command_policy(PendingCommandPolicy policy);
    ClientConfig& with_backoff_policy(std::shared_ptr<IBackoffPolicy> policy);

    // ─────────────────────────────────────────────────────────────────────────
    // Validation
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] bool is_valid() const {
        return validation_error().empty();
    }

    /// Get validation error message (empty if valid)
    [[nodiscard]] std::string validation_error() const;

    /// Retry, backoff and keepalive settings for the connection supervisor.
    [[nodiscard]] SupervisorConfig supervisor_config() const;
};

}  // namespace wsgate
