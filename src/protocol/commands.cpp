#include "wsgate/protocol/commands.hpp"

#include <stdexcept>

namespace wsgate::commands {

namespace {

void require_exchange(std::string_view exchange) {
    if (exchange.empty()) {
        throw std::invalid_argument("Argument 'exchange' should be a non-empty string");
    }
}

void require_interval(std::string_view interval) {
    if (interval.empty()) {
        throw std::invalid_argument("Argument 'interval' should be a non-empty string");
    }
}

Json exchange_params(std::string_view exchange) {
    require_exchange(exchange);
    return Json{{"exchange", std::string(exchange)}};
}

Json pair_params(std::string_view exchange, const PairList& pairs) {
    Json params = exchange_params(exchange);
    params["pairs"] = pairs;
    return params;
}

Json subscription_params(std::string_view exchange, const PairList& pairs, bool reset) {
    Json params = pair_params(exchange, pairs);
    params["reset"] = reset;
    return params;
}

}  // namespace

Command get_pairs(std::string_view exchange, const PairFilter& filter) {
    Json params = exchange_params(exchange);
    const bool has_currency = filter.currency.has_value() && (filter.currency->empty() == false);
    const bool has_base = filter.base_currency.has_value() && (filter.base_currency->empty() == false);
    if (has_currency) {
        params["filter"] = {{"currency", *filter.currency}};
    } else if (has_base) {
        params["filter"] = {{"baseCurrency", *filter.base_currency}};
    }
    return {"getPairs", std::move(params)};
}

// ─────────────────────────────────────────────────────────────────────────────
// Tickers
// ─────────────────────────────────────────────────────────────────────────────

Command subscribe_to_tickers(std::string_view exchange, const PairList& pairs, bool reset) {
    return {"subscribeToTickers", subscription_params(exchange, pairs, reset)};
}

Command unsubscribe_from_tickers(std::string_view exchange, const PairList& pairs) {
    return {"unsubscribeFromTickers", pair_params(exchange, pairs)};
}

Command unsubscribe_from_all_tickers(std::string_view exchange) {
    return {"unsubscribeFromAllTickers", exchange_params(exchange)};
}

// ─────────────────────────────────────────────────────────────────────────────
// Order Books
// ─────────────────────────────────────────────────────────────────────────────

Command subscribe_to_order_books(std::string_view exchange, const PairList& pairs, bool reset) {
    return {"subscribeToOrderBooks", subscription_params(exchange, pairs, reset)};
}

Command resync_order_books(std::string_view exchange, const PairList& pairs) {
    return {"resyncOrderBooks", pair_params(exchange, pairs)};
}

Command unsubscribe_from_order_books(std::string_view exchange, const PairList& pairs) {
    return {"unsubscribeFromOrderBooks", pair_params(exchange, pairs)};
}

Command unsubscribe_from_all_order_books(std::string_view exchange) {
    return {"unsubscribeFromAllOrderBooks", exchange_params(exchange)};
}

// ─────────────────────────────────────────────────────────────────────────────
// Trades
// ─────────────────────────────────────────────────────────────────────────────

Command subscribe_to_trades(std::string_view exchange, const PairList& pairs, bool reset) {
    return {"subscribeToTrades", subscription_params(exchange, pairs, reset)};
}

Command unsubscribe_from_trades(std::string_view exchange, const PairList& pairs) {
    return {"unsubscribeFromTrades", pair_params(exchange, pairs)};
}

Command unsubscribe_from_all_trades(std::string_view exchange) {
    return {"unsubscribeFromAllTrades", exchange_params(exchange)};
}

// ─────────────────────────────────────────────────────────────────────────────
// Klines
// ─────────────────────────────────────────────────────────────────────────────

Command subscribe_to_klines(
    std::string_view exchange,
    const PairList& pairs,
    std::string_view interval,
    bool reset
) {
    Json params = subscription_params(exchange, pairs, reset);
    require_interval(interval);
    params["interval"] = std::string(interval);
    return {"subscribeToKlines", std::move(params)};
}

Command unsubscribe_from_klines(
    std::string_view exchange,
    const PairList& pairs,
    std::optional<std::string_view> interval
) {
    Json params = pair_params(exchange, pairs);
    if (interval.has_value()) {
        require_interval(*interval);
        params["interval"] = std::string(*interval);
    }
    return {"unsubscribeFromKlines", std::move(params)};
}

Command unsubscribe_from_all_klines(std::string_view exchange) {
    return {"unsubscribeFromAllKlines", exchange_params(exchange)};
}

Command unsubscribe(std::optional<std::string_view> exchange) {
    if (exchange.has_value()) {
        return {"unsubscribe", exchange_params(*exchange)};
    }
    return {"unsubscribe", Json::object()};
}

}  // namespace wsgate::commands
