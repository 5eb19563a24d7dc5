#ifndef WSGATE_TRANSPORT_CONNECTION_URI_HPP
#define WSGATE_TRANSPORT_CONNECTION_URI_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wsgate {

// ─────────────────────────────────────────────────────────────────────────────
// Connection URI
// ─────────────────────────────────────────────────────────────────────────────
// The gateway is addressed by a ws:// or wss:// URI whose query string carries
// connection parameters. Two of them are special:
//
// - sid: the session to resume. A sid in the configured URI seeds the initial
//   session id; afterwards the id announced by the gateway is used.
// - expires, timeout: only meaningful when the gateway creates a session, so
//   they are dropped once a session has been ready.
//
// Parsing and query encoding use ada-url (WHATWG URL parsing).
//
// Usage:
//   auto uri = ConnectionUri::parse("wss://gw.example/?timeout=60&sid=abc");
//   uri->build("abc", /*ever_ready=*/true);   // wss://gw.example/?sid=abc

class ConnectionUri {
public:
    using QueryParam = std::pair<std::string, std::string>;

    /// Parse a websocket URI. Returns nullopt when the URI is malformed, uses
    /// a scheme other than ws/wss, or has no host.
    [[nodiscard]] static std::optional<ConnectionUri> parse(std::string_view uri);

    /// scheme://host[:port]/path, without query or fragment
    [[nodiscard]] const std::string& base() const noexcept { return base_; }

    /// Query parameters other than sid, in URI order
    [[nodiscard]] const std::vector<QueryParam>& query_params() const noexcept { return params_; }

    /// Value of the sid query parameter, if one was present and non-empty
    [[nodiscard]] const std::optional<std::string>& session_id() const noexcept { return session_id_; }


    /// URI for the next connection attempt.
    [[nodiscard]] std::string build(const std::optional<std::string>& session_id, bool ever_ready) const;

private:
    ConnectionUri() = default;

    std::string base_;
    std::vector<QueryParam> params_;
    std::optional<std::string> session_id_;
};

}  // namespace wsgate

#endif  // WSGATE_TRANSPORT_CONNECTION_URI_HPP
