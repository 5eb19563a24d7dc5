#include <catch2/catch_test_macros.hpp>

#include "wsgate/protocol/frames.hpp"
#include "wsgate/protocol/notification.hpp"

#include <string>
#include <variant>

using namespace wsgate;

// ═══════════════════════════════════════════════════════════════════════════
// Outbound Frames
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("CommandFrame serializes only present members", "[frames][outbound]") {
    SECTION("method only") {
        CommandFrame frame{"unsubscribe", std::nullopt, std::nullopt};
        REQUIRE(frame.to_json() == Json{{"m", "unsubscribe"}});
    }

    SECTION("with params and id") {
        CommandFrame frame{"getPairs", Json{{"exchange", "binance"}}, CorrelationId{7}};
        const Json expected = {{"m", "getPairs"}, {"p", {{"exchange", "binance"}}}, {"i", 7}};
        REQUIRE(frame.to_json() == expected);
        REQUIRE(Json::parse(frame.serialize()) == expected);
    }

    SECTION("serialized text is compact") {
        CommandFrame frame{"m1", Json::object(), CorrelationId{1}};
        REQUIRE(frame.serialize().find(' ') == std::string::npos);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Inbound Classification
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("decode_frame recognizes the hello handshake", "[frames][inbound]") {
    auto decoded = decode_frame(R"({"hello":{"sid":"s-42","isNew":true}})");
    REQUIRE(decoded.has_value());

    const auto* hello = std::get_if<HelloFrame>(&*decoded);
    REQUIRE(hello != nullptr);
    REQUIRE(hello->session_id == "s-42");
    REQUIRE(hello->is_new == true);

    SECTION("isNew defaults to false") {
        auto resumed = decode_frame(R"({"hello":{"sid":"s-42"}})");
        REQUIRE(resumed.has_value());
        REQUIRE(std::get<HelloFrame>(*resumed).is_new == false);
    }

    SECTION("malformed hello members are rejected") {
        REQUIRE(decode_frame(R"({"hello":"s-42"})").error().code == FrameError::Code::InvalidField);
        REQUIRE(decode_frame(R"({"hello":{"sid":5}})").error().code == FrameError::Code::InvalidField);
        REQUIRE(decode_frame(R"({"hello":{"sid":"x","isNew":"yes"}})").error().code == FrameError::Code::InvalidField);
    }
}

TEST_CASE("decode_frame recognizes notifications", "[frames][inbound]") {
    auto decoded = decode_frame(R"({"n":"ticker","d":{"exchange":"binance","pair":"USDT-BTC","last":"64000.5"}})");
    REQUIRE(decoded.has_value());

    const auto& notification = std::get<NotificationFrame>(*decoded);
    REQUIRE(notification.name == "ticker");
    REQUIRE(notification.data["pair"] == "USDT-BTC");

    SECTION("data is optional") {
        auto bare = decode_frame(R"({"n":"orderBook"})");
        REQUIRE(bare.has_value());
        REQUIRE(std::get<NotificationFrame>(*bare).data.is_null());
    }

    SECTION("the name must be a string") {
        REQUIRE(decode_frame(R"({"n":3,"d":{}})").error().code == FrameError::Code::InvalidField);
    }
}

TEST_CASE("decode_frame recognizes results and errors", "[frames][inbound]") {
    SECTION("result") {
        auto decoded = decode_frame(R"({"i":12,"r":["USDT-BTC","USDT-ETH"]})");
        REQUIRE(decoded.has_value());
        const auto& result = std::get<ResultFrame>(*decoded);
        REQUIRE(result.id == 12);
        REQUIRE(result.result.size() == 2);
    }

    SECTION("null result is still a result") {
        auto decoded = decode_frame(R"({"i":3,"r":null})");
        REQUIRE(decoded.has_value());
        REQUIRE(std::get<ResultFrame>(*decoded).result.is_null());
    }

    SECTION("error") {
        auto decoded = decode_frame(R"({"i":4,"e":"Unknown exchange"})");
        REQUIRE(decoded.has_value());
        const auto& error = std::get<ErrorFrame>(*decoded);
        REQUIRE(error.id == 4);
        REQUIRE(error.error == "Unknown exchange");
    }

    SECTION("large ids survive decoding") {
        auto decoded = decode_frame(R"({"i":18446744073709551615,"r":true})");
        REQUIRE(decoded.has_value());
        REQUIRE(std::get<ResultFrame>(*decoded).id == 18446744073709551615ULL);
    }

    SECTION("results need a non-negative integer id") {
        REQUIRE(decode_frame(R"({"r":1})").error().code == FrameError::Code::InvalidField);
        REQUIRE(decode_frame(R"({"i":-1,"r":1})").error().code == FrameError::Code::InvalidField);
        REQUIRE(decode_frame(R"({"i":"1","e":"x"})").error().code == FrameError::Code::InvalidField);
        REQUIRE(decode_frame(R"({"i":1.5,"r":1})").error().code == FrameError::Code::InvalidField);
    }
}

TEST_CASE("decode_frame classifies in a fixed order", "[frames][inbound]") {
    SECTION("hello wins over everything else") {
        auto decoded = decode_frame(R"({"n":"ticker","hello":{"sid":"s"},"i":1,"r":1})");
        REQUIRE(decoded.has_value());
        REQUIRE(std::holds_alternative<HelloFrame>(*decoded));
    }

    SECTION("notification wins over result") {
        auto decoded = decode_frame(R"({"i":1,"r":1,"n":"trades"})");
        REQUIRE(decoded.has_value());
        REQUIRE(std::holds_alternative<NotificationFrame>(*decoded));
    }

    SECTION("result wins over error") {
        auto decoded = decode_frame(R"({"i":1,"e":"x","r":1})");
        REQUIRE(decoded.has_value());
        REQUIRE(std::holds_alternative<ResultFrame>(*decoded));
    }
}

TEST_CASE("decode_frame rejects malformed input", "[frames][inbound]") {
    REQUIRE(decode_frame("<html>").error().code == FrameError::Code::InvalidJson);
    REQUIRE(decode_frame(R"({"n":"ticker")").error().code == FrameError::Code::InvalidJson);
    REQUIRE(decode_frame(R"({"n":"ticker"} trailing)").error().code == FrameError::Code::InvalidJson);
    REQUIRE(decode_frame("42").error().code == FrameError::Code::NotAnObject);
    REQUIRE(decode_frame(R"("hello")").error().code == FrameError::Code::NotAnObject);
    REQUIRE(decode_frame("[1,2]").error().code == FrameError::Code::NotAnObject);
    REQUIRE(decode_frame(R"({"x":1})").error().code == FrameError::Code::Unrecognized);
    REQUIRE(decode_frame("{}").error().code == FrameError::Code::Unrecognized);
}

TEST_CASE("FrameDecoder enforces the depth limit", "[frames][inbound]") {
    FrameDecoder decoder(4);

    REQUIRE(decoder.max_depth() == 4);
    REQUIRE(decoder.decode(R"({"n":"x","d":{"a":{"b":1}}})").has_value());

    auto too_deep = decoder.decode(R"({"n":"x","d":{"a":{"b":{"c":{"d":{"e":1}}}}}})");
    REQUIRE(too_deep.has_value() == false);
    REQUIRE(too_deep.error().code == FrameError::Code::TooDeep);

    SECTION("the decoder is reusable after an error") {
        REQUIRE(decoder.decode(R"({"i":1,"r":{}})").has_value());
    }
}

TEST_CASE("FrameDecoder preserves value types", "[frames][inbound]") {
    FrameDecoder decoder;
    auto parsed = decoder.parse(R"({"s":"a\"b","neg":-3,"big":12345678901234,"f":0.25,"t":true,"z":null,"arr":[1,"2"]})");
    REQUIRE(parsed.has_value());

    const Json& doc = *parsed;
    REQUIRE(doc["s"] == "a\"b");
    REQUIRE(doc["neg"] == -3);
    REQUIRE(doc["big"] == 12345678901234LL);
    REQUIRE(doc["f"] == 0.25);
    REQUIRE(doc["t"] == true);
    REQUIRE(doc["z"].is_null());
    REQUIRE(doc["arr"] == Json::array({1, "2"}));
}

// ═══════════════════════════════════════════════════════════════════════════
// Notifications
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Notification kinds map to wire names", "[frames][notification]") {
    REQUIRE(notification_kind_from_name("ticker") == NotificationKind::Ticker);
    REQUIRE(notification_kind_from_name("orderBook") == NotificationKind::OrderBook);
    REQUIRE(notification_kind_from_name("orderBookUpdate") == NotificationKind::OrderBookUpdate);
    REQUIRE(notification_kind_from_name("trades") == NotificationKind::Trades);
    REQUIRE(notification_kind_from_name("kline") == NotificationKind::Kline);
    REQUIRE(notification_kind_from_name("tickerMonitor") == NotificationKind::TickerMonitor);
    REQUIRE(notification_kind_from_name("OrderBook") == NotificationKind::Unknown);
    REQUIRE(to_string(NotificationKind::OrderBookUpdate) == "orderBookUpdate");

    const auto notification = Notification::from_frame(NotificationFrame{"candles", Json{{"x", 1}}});
    REQUIRE(notification.kind == NotificationKind::Unknown);
    REQUIRE(notification.name == "candles");
}

TEST_CASE("aggregate_payload injects the notification name", "[frames][notification]") {
    SECTION("object data") {
        const Json payload = aggregate_payload(NotificationFrame{"trades", Json{{"pair", "USDT-BTC"}}});
        REQUIRE(payload == Json{{"pair", "USDT-BTC"}, {"notification", "trades"}});
    }

    SECTION("non-object data is wrapped") {
        const Json payload = aggregate_payload(NotificationFrame{"kline", Json::array({1, 2})});
        REQUIRE(payload == Json{{"notification", "kline"}, {"data", Json::array({1, 2})}});
    }
}
