#pragma once

#include "wsgate/protocol/frames.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace wsgate {

// ─────────────────────────────────────────────────────────────────────────────
// Notification Kinds
// ─────────────────────────────────────────────────────────────────────────────
// The gateway publishes one notification per exchange/pair (and per interval
// for klines). Names not listed here are still delivered, as Unknown.

enum class NotificationKind : std::uint8_t {
    Ticker,
    OrderBook,
    OrderBookUpdate,
    Trades,
    Kline,
    TickerMonitor,
    Unknown
};

/// Wire name of a kind ("ticker", "orderBook", ...). Unknown has no wire name.
[[nodiscard]] constexpr std::string_view to_string(NotificationKind kind) noexcept {
    switch (kind) {
        case NotificationKind::Ticker:          return "ticker";
        case NotificationKind::OrderBook:       return "orderBook";
        case NotificationKind::OrderBookUpdate: return "orderBookUpdate";
        case NotificationKind::Trades:          return "trades";
        case NotificationKind::Kline:           return "kline";
        case NotificationKind::TickerMonitor:   return "tickerMonitor";
        case NotificationKind::Unknown:         return "unknown";
    }
    return "unknown";
}

[[nodiscard]] constexpr NotificationKind notification_kind_from_name(std::string_view name) noexcept {
    if (name == "ticker")          return NotificationKind::Ticker;
    if (name == "orderBook")       return NotificationKind::OrderBook;
    if (name == "orderBookUpdate") return NotificationKind::OrderBookUpdate;
    if (name == "trades")          return NotificationKind::Trades;
    if (name == "kline")           return NotificationKind::Kline;
    if (name == "tickerMonitor")   return NotificationKind::TickerMonitor;
    return NotificationKind::Unknown;
}

/// A notification as delivered in per-kind mode.
struct Notification {
    NotificationKind kind{NotificationKind::Unknown};
    std::string name;  // wire name as received, meaningful for Unknown kinds
    Json data;

    [[nodiscard]] static Notification from_frame(NotificationFrame frame) {
        const auto kind = notification_kind_from_name(frame.name);
        return {kind, std::move(frame.name), std::move(frame.data)};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Delivery Mode
// ─────────────────────────────────────────────────────────────────────────────

enum class NotificationMode : std::uint8_t {
    PerKind,     // INotificationObserver::on_notification(Notification)
    Aggregated   // INotificationObserver::on_global_notification(payload)
};

[[nodiscard]] constexpr std::string_view to_string(NotificationMode mode) noexcept {
    switch (mode) {
        case NotificationMode::PerKind:    return "PerKind";
        case NotificationMode::Aggregated: return "Aggregated";
    }
    return "Unknown";
}

/// Payload for aggregated delivery: the frame data with the wire name
/// injected as "notification". Non-object data is wrapped as
/// {"notification": name, "data": data}.
[[nodiscard]] inline Json aggregate_payload(NotificationFrame frame) {
    if (frame.data.is_object()) {
        frame.data["notification"] = std::move(frame.name);
        return std::move(frame.data);
    }
    return Json{{"notification", std::move(frame.name)}, {"data", std::move(frame.data)}};
}

}  // namespace wsgate
