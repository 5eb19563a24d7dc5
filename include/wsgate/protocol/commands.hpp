#pragma once

#include "wsgate/transport.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wsgate {

// ─────────────────────────────────────────────────────────────────────────────
// Command
// ─────────────────────────────────────────────────────────────────────────────
// A gateway command before it is assigned a correlation id. The builders below
// validate their arguments synchronously and throw std::invalid_argument.

struct Command {
    std::string name;
    std::optional<Json> params;
};

namespace commands {

using PairList = std::vector<std::string>;

/// Restricts getPairs to pairs involving one currency. currency wins when
/// both are set.
struct PairFilter {
    std::optional<std::string> currency;
    std::optional<std::string> base_currency;
};

[[nodiscard]] Command get_pairs(std::string_view exchange, const PairFilter& filter = {});

// Tickers
[[nodiscard]] Command subscribe_to_tickers(std::string_view exchange, const PairList& pairs, bool reset = false);
[[nodiscard]] Command unsubscribe_from_tickers(std::string_view exchange, const PairList& pairs);
[[nodiscard]] Command unsubscribe_from_all_tickers(std::string_view exchange);

// Order books. A full orderBook notification follows each (re)subscription
// and each resync; orderBookUpdate notifications carry the diffs.
[[nodiscard]] Command subscribe_to_order_books(std::string_view exchange, const PairList& pairs, bool reset = false);
[[nodiscard]] Command resync_order_books(std::string_view exchange, const PairList& pairs);
[[nodiscard]] Command unsubscribe_from_order_books(std::string_view exchange, const PairList& pairs);
[[nodiscard]] Command unsubscribe_from_all_order_books(std::string_view exchange);

// Trades
[[nodiscard]] Command subscribe_to_trades(std::string_view exchange, const PairList& pairs, bool reset = false);
[[nodiscard]] Command unsubscribe_from_trades(std::string_view exchange, const PairList& pairs);
[[nodiscard]] Command unsubscribe_from_all_trades(std::string_view exchange);

// Klines
[[nodiscard]] Command subscribe_to_klines(
    std::string_view exchange,
    const PairList& pairs,
    std::string_view interval,
    bool reset = false
);
/// Without an interval, every interval of the given pairs is unsubscribed.
[[nodiscard]] Command unsubscribe_from_klines(
    std::string_view exchange,
    const PairList& pairs,
    std::optional<std::string_view> interval = std::nullopt
);
[[nodiscard]] Command unsubscribe_from_all_klines(std::string_view exchange);

/// Drop every subscription, optionally limited to one exchange.
[[nodiscard]] Command unsubscribe(std::optional<std::string_view> exchange = std::nullopt);

}  // namespace commands

}  // namespace wsgate
