#include "wsgate/session/session_manager.hpp"

#include "wsgate/log/logger.hpp"

namespace wsgate {

SessionManager::SessionManager(std::optional<std::string> initial_session_id)
    : session_id_(std::move(initial_session_id))
{}

HandshakeOutcome SessionManager::handle_hello(const HelloFrame& hello) {
    std::lock_guard<std::mutex> lock(mutex_);

    HandshakeOutcome outcome;
    outcome.session_id = hello.session_id;
    outcome.is_new = hello.is_new;

    const bool never_ready = (ready_at_.has_value() == false);
    outcome.became_ready = never_ready || hello.is_new;

    session_id_ = hello.session_id;
    ++handshake_count_;
    if (outcome.became_ready) {
        ready_at_ = Clock::now();
    }

    WSGATE_LOG_DEBUG(
        "Handshake #{}: sid='{}' isNew={} ready={}",
        handshake_count_, hello.session_id, hello.is_new, outcome.became_ready
    );
    return outcome;
}

bool SessionManager::has_been_ready() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_at_.has_value();
}

std::optional<std::string> SessionManager::session_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_id_;
}

std::optional<SessionManager::Clock::time_point> SessionManager::ready_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_at_;
}

bool SessionManager::is_valid_session_id(std::string_view id) noexcept {
    if (id.empty() || id.size() > kMaxSessionIdLength) {
        return false;
    }
    for (const char c : id) {
        const auto byte = static_cast<unsigned char>(c);
        const bool is_control = (byte < 0x21) || (byte == 0x7F);
        if (is_control) {
            return false;
        }
    }
    return true;
}

}  // namespace wsgate
