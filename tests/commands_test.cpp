#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "wsgate/protocol/commands.hpp"

#include <stdexcept>

using namespace wsgate;
using namespace wsgate::commands;
using Catch::Matchers::ContainsSubstring;

// ═══════════════════════════════════════════════════════════════════════════
// Market Data Commands
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("get_pairs builds the filter", "[commands]") {
    SECTION("no filter") {
        const auto command = get_pairs("binance");
        REQUIRE(command.name == "getPairs");
        REQUIRE(*command.params == Json{{"exchange", "binance"}});
    }

    SECTION("currency") {
        const auto command = get_pairs("binance", PairFilter{"BTC", std::nullopt});
        REQUIRE(*command.params == Json{{"exchange", "binance"}, {"filter", {{"currency", "BTC"}}}});
    }

    SECTION("base currency") {
        const auto command = get_pairs("binance", PairFilter{std::nullopt, "USDT"});
        REQUIRE(*command.params == Json{{"exchange", "binance"}, {"filter", {{"baseCurrency", "USDT"}}}});
    }

    SECTION("currency wins over base currency") {
        const auto command = get_pairs("binance", PairFilter{"BTC", "USDT"});
        REQUIRE(command.params->at("filter") == Json{{"currency", "BTC"}});
    }

    SECTION("empty filter values are ignored") {
        const auto command = get_pairs("binance", PairFilter{"", ""});
        REQUIRE(command.params->contains("filter") == false);
    }
}

TEST_CASE("Subscription commands carry exchange, pairs and reset", "[commands]") {
    const PairList pairs = {"USDT-BTC", "USDT-ETH"};

    SECTION("tickers") {
        const auto command = subscribe_to_tickers("binance", pairs);
        REQUIRE(command.name == "subscribeToTickers");
        REQUIRE(*command.params == Json{{"exchange", "binance"}, {"pairs", pairs}, {"reset", false}});
    }

    SECTION("order books with reset") {
        const auto command = subscribe_to_order_books("kraken", pairs, true);
        REQUIRE(command.name == "subscribeToOrderBooks");
        REQUIRE(command.params->at("reset") == true);
    }

    SECTION("trades") {
        REQUIRE(subscribe_to_trades("binance", pairs).name == "subscribeToTrades");
    }

    SECTION("klines add the interval") {
        const auto command = subscribe_to_klines("binance", pairs, "5m");
        REQUIRE(command.name == "subscribeToKlines");
        REQUIRE(*command.params == Json{{"exchange", "binance"}, {"pairs", pairs}, {"reset", false}, {"interval", "5m"}});
    }
}

TEST_CASE("Unsubscribe commands", "[commands]") {
    const PairList pairs = {"USDT-BTC"};

    REQUIRE(*unsubscribe_from_tickers("binance", pairs).params == Json{{"exchange", "binance"}, {"pairs", pairs}});
    REQUIRE(unsubscribe_from_order_books("binance", pairs).name == "unsubscribeFromOrderBooks");
    REQUIRE(unsubscribe_from_trades("binance", pairs).name == "unsubscribeFromTrades");
    REQUIRE(resync_order_books("binance", pairs).name == "resyncOrderBooks");

    SECTION("all subscriptions of one exchange") {
        REQUIRE(unsubscribe_from_all_tickers("binance").name == "unsubscribeFromAllTickers");
        REQUIRE(unsubscribe_from_all_order_books("binance").name == "unsubscribeFromAllOrderBooks");
        REQUIRE(unsubscribe_from_all_trades("binance").name == "unsubscribeFromAllTrades");
        REQUIRE(*unsubscribe_from_all_klines("binance").params == Json{{"exchange", "binance"}});
    }

    SECTION("klines with and without an interval") {
        REQUIRE(unsubscribe_from_klines("binance", pairs, "1h").params->at("interval") == "1h");
        REQUIRE(unsubscribe_from_klines("binance", pairs).params->contains("interval") == false);
    }

    SECTION("everything") {
        REQUIRE(unsubscribe().name == "unsubscribe");
        REQUIRE(*unsubscribe().params == Json::object());
        REQUIRE(*unsubscribe("binance").params == Json{{"exchange", "binance"}});
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Argument Validation
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Commands reject an empty exchange", "[commands][validation]") {
    REQUIRE_THROWS_AS(get_pairs(""), std::invalid_argument);
    REQUIRE_THROWS_AS(subscribe_to_tickers("", {"USDT-BTC"}), std::invalid_argument);
    REQUIRE_THROWS_AS(unsubscribe_from_all_trades(""), std::invalid_argument);
    REQUIRE_THROWS_AS(unsubscribe(std::string_view{}), std::invalid_argument);
    REQUIRE_THROWS_WITH(
        resync_order_books("", {"USDT-BTC"}),
        ContainsSubstring("Argument 'exchange' should be a non-empty string")
    );
}

TEST_CASE("Kline commands reject an empty interval", "[commands][validation]") {
    REQUIRE_THROWS_WITH(
        subscribe_to_klines("binance", {"USDT-BTC"}, ""),
        ContainsSubstring("Argument 'interval' should be a non-empty string")
    );
    REQUIRE_THROWS_AS(unsubscribe_from_klines("binance", {"USDT-BTC"}, std::string_view{}), std::invalid_argument);
}
