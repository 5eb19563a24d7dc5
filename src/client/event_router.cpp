#include "wsgate/client/event_router.hpp"

#include "wsgate/log/logger.hpp"

#include <algorithm>
#include <exception>

namespace wsgate {

void EventRouter::add_observer(std::shared_ptr<IClientObserver> observer) {
    if (observer == nullptr) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.push_back(std::move(observer));
}

void EventRouter::remove_observer(const std::shared_ptr<IClientObserver>& observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

std::size_t EventRouter::observer_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return observers_.size();
}

template <typename Fn>
void EventRouter::notify(const char* what, Fn&& fn) {
    std::vector<std::shared_ptr<IClientObserver>> observers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        observers = observers_;
    }

    for (const auto& observer : observers) {
        try {
            fn(*observer);
        } catch (const std::exception& e) {
            WSGATE_LOG_ERROR("Observer threw while handling {}: {}", what, e.what());
        }
    }
}

void EventRouter::route(NotificationFrame frame) {
    if (frame.name.empty()) {
        WSGATE_LOG_DEBUG("Dropping notification without a name");
        return;
    }

    if (mode_ == NotificationMode::Aggregated) {
        const Json payload = aggregate_payload(std::move(frame));
        notify("notification", [&payload](IClientObserver& observer) {
            observer.on_global_notification(payload);
        });
        return;
    }

    const Notification notification = Notification::from_frame(std::move(frame));
    if (notification.kind == NotificationKind::Unknown) {
        WSGATE_LOG_DEBUG("Delivering notification of unknown kind '{}'", notification.name);
    }
    notify("notification", [&notification](IClientObserver& observer) {
        observer.on_notification(notification);
    });
}

void EventRouter::publish(const ConnectedEvent& event) {
    notify("connected", [&event](IClientObserver& observer) {
        observer.on_connected(event);
    });
}

void EventRouter::publish(const DisconnectedEvent& event) {
    notify("disconnected", [&event](IClientObserver& observer) {
        observer.on_disconnected(event);
    });
}

void EventRouter::publish(const ConnectionErrorEvent& event) {
    notify("connectionError", [&event](IClientObserver& observer) {
        observer.on_connection_error(event);
    });
}

void EventRouter::publish(const TerminatedEvent& event) {
    notify("terminated", [&event](IClientObserver& observer) {
        observer.on_terminated(event);
    });
}

void EventRouter::publish(const ReadyEvent& event) {
    notify("ready", [&event](IClientObserver& observer) {
        observer.on_ready(event);
    });
}

}  // namespace wsgate
