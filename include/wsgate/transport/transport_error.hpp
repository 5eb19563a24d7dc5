#ifndef WSGATE_TRANSPORT_TRANSPORT_ERROR_HPP
#define WSGATE_TRANSPORT_TRANSPORT_ERROR_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wsgate {

// ─────────────────────────────────────────────────────────────────────────────
// Connection Error
// ─────────────────────────────────────────────────────────────────────────────
// Reported by a transport when a connection attempt fails. The transport is
// the authority on whether the failure is worth retrying; the supervisor only
// decides whether the retry budget allows it.

struct ConnectionError {
    enum class Code {
        ConnectFailed,       // Generic failure to establish the socket
        Refused,             // Server actively refused (HTTP upgrade rejected, 4xx)
        Timeout,             // Connect or upgrade handshake timed out
        TlsError,            // TLS handshake or certificate verification failed
        ClosedBeforeOpen,    // Peer closed before the connection was confirmed
        Protocol             // Websocket protocol violation during upgrade
    };

    Code code{Code::ConnectFailed};
    std::string message;
    bool retryable{true};
    std::optional<int> http_status{};

    static ConnectionError connect_failed(std::string msg) {
        return {Code::ConnectFailed, std::move(msg), true, std::nullopt};
    }

    static ConnectionError refused(int status, std::string msg) {
        // Authentication and not-found style rejections will not heal by retrying
        const bool retryable = (status >= 500) || (status == 429);
        return {Code::Refused, std::move(msg), retryable, status};
    }

    static ConnectionError timeout(std::string msg) {
        return {Code::Timeout, std::move(msg), true, std::nullopt};
    }

    static ConnectionError tls_error(std::string msg) {
        return {Code::TlsError, std::move(msg), false, std::nullopt};
    }

    static ConnectionError closed_before_open(int close_code, const std::string& reason) {
        std::string msg = "Connection closed before open (code " + std::to_string(close_code) + ")";
        if (reason.empty() == false) {
            msg += ": " + reason;
        }
        return {Code::ClosedBeforeOpen, std::move(msg), true, std::nullopt};
    }

    static ConnectionError protocol(std::string msg) {
        return {Code::Protocol, std::move(msg), false, std::nullopt};
    }
};

[[nodiscard]] constexpr std::string_view to_string(ConnectionError::Code code) noexcept {
    switch (code) {
        case ConnectionError::Code::ConnectFailed:    return "ConnectFailed";
        case ConnectionError::Code::Refused:          return "Refused";
        case ConnectionError::Code::Timeout:          return "Timeout";
        case ConnectionError::Code::TlsError:         return "TlsError";
        case ConnectionError::Code::ClosedBeforeOpen: return "ClosedBeforeOpen";
        case ConnectionError::Code::Protocol:         return "Protocol";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Close Information
// ─────────────────────────────────────────────────────────────────────────────

/// Websocket close code used when the connection is dropped locally
/// (keepalive expiry, transport error while open).
inline constexpr int kAbnormalClosure = 1006;

struct CloseInfo {
    int code{kAbnormalClosure};
    std::string reason;
};

}  // namespace wsgate

#endif  // WSGATE_TRANSPORT_TRANSPORT_ERROR_HPP
