#pragma once

#include "wsgate/protocol/frames.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace wsgate {

// ─────────────────────────────────────────────────────────────────────────────
// Handshake Outcome
// ─────────────────────────────────────────────────────────────────────────────

struct HandshakeOutcome {
    std::string session_id;
    bool is_new{false};

    /// True when the handshake must be reported as "ready": the session was
    /// never ready before, or the gateway started a new one.
    bool became_ready{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// Session Manager
// ─────────────────────────────────────────────────────────────────────────────

/// Tracks the gateway session across physical reconnections.
///
/// The gateway greets every new connection with {"hello":{"sid","isNew"}}.
/// The session id is kept so that the next connection URI can ask for the
/// same session. Readiness is sticky: once a hello has been received the
/// client stays "ever ready" for the rest of its life, and a resumed session
/// (isNew=false) never raises ready again.
///
/// Thread-safe. Mutation happens on the client strand while queries may
/// come from any thread.
class SessionManager {
public:
    using Clock = std::chrono::steady_clock;

    /// Maximum length accepted for a caller-supplied session id.
    static constexpr std::size_t kMaxSessionIdLength = 256;

    SessionManager() = default;

    /// Start with a known session id (from the URI or the configuration).
    explicit SessionManager(std::optional<std::string> initial_session_id);

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /// Interpret a handshake frame.
    [[nodiscard]] HandshakeOutcome handle_hello(const HelloFrame& hello);

    /// True once any handshake has been received.
    [[nodiscard]] bool has_been_ready() const;

    /// Session id to request on the next connection, if any.
    [[nodiscard]] std::optional<std::string> session_id() const;

    /// Time of the last handshake that raised ready.
    [[nodiscard]] std::optional<Clock::time_point> ready_at() const;

    /// Non-empty, bounded, printable, without whitespace.
    [[nodiscard]] static bool is_valid_session_id(std::string_view id) noexcept;

private:
    mutable std::mutex mutex_;
    std::optional<std::string> session_id_;
    std::optional<Clock::time_point> ready_at_;
    std::size_t handshake_count_{0};
};

}  // namespace wsgate
