#include "wsgate/client/client_config.hpp"

#include "wsgate/session/session_manager.hpp"
#include "wsgate/transport/connection_uri.hpp"

#include <format>

namespace wsgate {

namespace {

std::string_view trim(std::string_view value) noexcept {
    constexpr std::string_view kWhitespace = " \t\r\n\f\v";
    const auto first = value.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(kWhitespace);
    return value.substr(first, last - first + 1);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Builders
// ─────────────────────────────────────────────────────────────────────────────

ClientConfig& ClientConfig::with_uri(std::string value) {
    uri = std::move(value);
    return *this;
}

ClientConfig& ClientConfig::with_auto_connect(bool enabled) {
    auto_connect = enabled;
    return *this;
}

ClientConfig& ClientConfig::with_notification_mode(NotificationMode mode) {
    notification_mode = mode;
    return *this;
}

ClientConfig& ClientConfig::with_session_id(std::string_view value) {
    const auto trimmed = trim(value);
    if (trimmed.empty()) {
        session_id.reset();
    } else {
        session_id = std::string(trimmed);
    }
    return *this;
}

ClientConfig& ClientConfig::with_api_key(std::string value) {
    if (value.empty()) {
        api_key.reset();
    } else {
        api_key = std::move(value);
    }
    return *this;
}

ClientConfig& ClientConfig::with_retry_count(std::size_t retries) {
    retry_count = retries;
    return *this;
}

ClientConfig& ClientConfig::with_unbounded_retries() {
    retry_count.reset();
    return *this;
}

ClientConfig& ClientConfig::with_retry_delay(std::chrono::milliseconds delay) {
    retry_delay = delay;
    return *this;
}

ClientConfig& ClientConfig::with_ping_timeout(std::chrono::milliseconds timeout) {
    ping_timeout = timeout;
    return *this;
}

ClientConfig& ClientConfig::with_pending_command_policy(PendingCommandPolicy policy) {
    pending_command_policy = policy;
    return *this;
}

ClientConfig& ClientConfig::with_backoff_policy(std::shared_ptr<IBackoffPolicy> policy) {
    backoff_policy = std::move(policy);
    return *this;
}

// ─────────────────────────────────────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────────────────────────────────────

std::string ClientConfig::validation_error() const {
    if (ConnectionUri::parse(uri).has_value() == false) {
        return "Argument 'uri' should start with 'ws://' or 'wss://'";
    }
    if (retry_delay < kMinRetryDelay) {
        return std::format("Argument 'retry_delay' should be >= {}ms", kMinRetryDelay.count());
    }
    if (ping_timeout < kMinPingTimeout) {
        return std::format("Argument 'ping_timeout' should be >= {}ms", kMinPingTimeout.count());
    }
    if (session_id.has_value() && SessionManager::is_valid_session_id(*session_id) == false) {
        return "Argument 'session_id' should be a non-empty string without whitespace";
    }
    if (api_key.has_value() && api_key->empty()) {
        return "Argument 'api_key' should be a non-empty string";
    }
    return "";
}

SupervisorConfig ClientConfig::supervisor_config() const {
    SupervisorConfig config;
    if (retry_count.has_value()) {
        config.retry.with_max_retries(*retry_count);
    } else {
        config.retry.unbounded();
    }
    if (backoff_policy != nullptr) {
        config.backoff = backoff_policy;
    } else {
        config.backoff = std::make_shared<ConstantBackoff>(retry_delay);
    }
    config.keepalive_timeout = ping_timeout;
    return config;
}

}  // namespace wsgate
