#pragma once

#include "wsgate/protocol/notification.hpp"
#include "wsgate/transport/connection_supervisor.hpp"
#include "wsgate/transport/transport_error.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace wsgate {

// ─────────────────────────────────────────────────────────────────────────────
// Client Events
// ─────────────────────────────────────────────────────────────────────────────

struct ConnectedEvent {
    AttemptId attempt_id{0};
};

struct DisconnectedEvent {
    AttemptId attempt_id{0};
    int code{kAbnormalClosure};
    std::string reason;
};

struct ConnectionErrorEvent {
    AttemptId attempt_id{0};
    std::size_t attempts{0};
    ConnectionError error;
};

/// Same shape as ConnectionErrorEvent; no further attempt follows.
struct TerminatedEvent {
    AttemptId attempt_id{0};
    std::size_t attempts{0};
    ConnectionError error;
};

struct ReadyEvent {
    std::string session_id;
    bool is_new{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// Observer Interfaces
// ─────────────────────────────────────────────────────────────────────────────
// All callbacks run on the client strand. Override only what you need.

class INotificationObserver {
public:
    virtual ~INotificationObserver() = default;

    /// Per-kind delivery (NotificationMode::PerKind)
    virtual void on_notification(const Notification& /*notification*/) {}

    /// Aggregated delivery (NotificationMode::Aggregated). The payload
    /// carries the notification name in its "notification" field.
    virtual void on_global_notification(const Json& /*payload*/) {}
};

class IClientObserver : public INotificationObserver {
public:
    virtual void on_connected(const ConnectedEvent& /*event*/) {}
    virtual void on_disconnected(const DisconnectedEvent& /*event*/) {}
    virtual void on_connection_error(const ConnectionErrorEvent& /*event*/) {}
    virtual void on_terminated(const TerminatedEvent& /*event*/) {}
    virtual void on_ready(const ReadyEvent& /*event*/) {}
};

// ─────────────────────────────────────────────────────────────────────────────
// EventRouter
// ─────────────────────────────────────────────────────────────────────────────
// Fans client events out to observers. The notification mode is fixed at
// construction.
//
// Observers are copied under the lock and invoked without it, so an observer
// may add or remove observers from inside a callback. An exception thrown by
// an observer is logged and does not prevent delivery to the others.

class EventRouter {
public:
    explicit EventRouter(NotificationMode mode = NotificationMode::PerKind)
        : mode_(mode) {}

    EventRouter(const EventRouter&) = delete;
    EventRouter& operator=(const EventRouter&) = delete;

    void add_observer(std::shared_ptr<IClientObserver> observer);
    void remove_observer(const std::shared_ptr<IClientObserver>& observer);

    [[nodiscard]] std::size_t observer_count() const;

    [[nodiscard]] NotificationMode mode() const noexcept {
        return mode_;
    }

    /// Deliver a notification frame according to the mode. Frames without a
    /// name are dropped.
    void route(NotificationFrame frame);

    void publish(const ConnectedEvent& event);
    void publish(const DisconnectedEvent& event);
    void publish(const ConnectionErrorEvent& event);
    void publish(const TerminatedEvent& event);
    void publish(const ReadyEvent& event);

private:
    template <typename Fn>
    void notify(const char* what, Fn&& fn);

    NotificationMode mode_;
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<IClientObserver>> observers_;
};

}  // namespace wsgate
