#ifndef WSGATE_TESTS_MOCKS_RECORDING_OBSERVER_HPP
#define WSGATE_TESTS_MOCKS_RECORDING_OBSERVER_HPP

#include "wsgate/client/event_router.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace wsgate::testing {

// ─────────────────────────────────────────────────────────────────────────────
// RecordingObserver - Client observer that logs every callback
// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle events are recorded as compact strings so that whole sequences
// can be compared at once:
//   connected:<attempt>
//   disconnected:<attempt>:<code>
//   connectionError:<attempt>:<attempts>
//   terminated:<attempt>:<attempts>
//   ready:<sid>:new|resumed

class RecordingObserver : public IClientObserver {
public:
    std::vector<std::string> events;
    std::vector<Notification> notifications;
    std::vector<Json> global_notifications;
    std::vector<ConnectionError> errors;

    /// Runs after every recorded lifecycle event.
    std::function<void()> on_event;

    void on_notification(const Notification& notification) override {
        notifications.push_back(notification);
    }

    void on_global_notification(const Json& payload) override {
        global_notifications.push_back(payload);
    }

    void on_connected(const ConnectedEvent& event) override {
        record("connected:" + std::to_string(event.attempt_id));
    }

    void on_disconnected(const DisconnectedEvent& event) override {
        record("disconnected:" + std::to_string(event.attempt_id) + ":" + std::to_string(event.code));
    }

    void on_connection_error(const ConnectionErrorEvent& event) override {
        errors.push_back(event.error);
        record("connectionError:" + std::to_string(event.attempt_id) + ":" + std::to_string(event.attempts));
    }

    void on_terminated(const TerminatedEvent& event) override {
        errors.push_back(event.error);
        record("terminated:" + std::to_string(event.attempt_id) + ":" + std::to_string(event.attempts));
    }

    void on_ready(const ReadyEvent& event) override {
        record("ready:" + event.session_id + (event.is_new ? ":new" : ":resumed"));
    }

    [[nodiscard]] std::size_t count(const std::string& prefix) const {
        std::size_t total = 0;
        for (const auto& event : events) {
            if (event.rfind(prefix, 0) == 0) {
                ++total;
            }
        }
        return total;
    }

private:
    void record(std::string event) {
        events.push_back(std::move(event));
        if (on_event) {
            on_event();
        }
    }
};

}  // namespace wsgate::testing

#endif  // WSGATE_TESTS_MOCKS_RECORDING_OBSERVER_HPP
