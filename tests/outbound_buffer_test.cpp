#include <catch2/catch_test_macros.hpp>

#include "wsgate/client/outbound_buffer.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace wsgate;

// ═══════════════════════════════════════════════════════════════════════════
// OutboundBuffer Unit Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("OutboundBuffer flushes in enqueue order", "[outbound]") {
    OutboundBuffer buffer;
    buffer.enqueue("a");
    buffer.enqueue("b", CorrelationId{5});
    buffer.enqueue("c");

    REQUIRE(buffer.size() == 3);
    REQUIRE(buffer.messages()[1].correlation_id == CorrelationId{5});

    std::vector<std::string> sent;
    const auto count = buffer.flush([&sent](QueuedMessage& message) {
        sent.push_back(message.payload);
        return true;
    });

    REQUIRE(count == 3);
    REQUIRE(sent == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(buffer.empty());
    REQUIRE(buffer.flushing() == false);
}

TEST_CASE("OutboundBuffer keeps the remainder when the sink refuses", "[outbound]") {
    OutboundBuffer buffer;
    buffer.enqueue("a");
    buffer.enqueue("b");
    buffer.enqueue("c");

    int accepted = 0;
    const auto count = buffer.flush([&accepted](QueuedMessage&) {
        if (accepted == 1) {
            return false;
        }
        ++accepted;
        return true;
    });

    REQUIRE(count == 1);
    REQUIRE(buffer.size() == 2);
    REQUIRE(buffer.messages()[0].payload == "b");
    REQUIRE(buffer.messages()[1].payload == "c");
}

TEST_CASE("OutboundBuffer sends frames added during a flush last", "[outbound]") {
    OutboundBuffer buffer;
    buffer.enqueue("a");
    buffer.enqueue("b");

    std::vector<std::string> sent;
    const auto count = buffer.flush([&](QueuedMessage& message) {
        sent.push_back(message.payload);
        if (message.payload == "a") {
            buffer.enqueue("late");
            // A nested flush joins the running one
            REQUIRE(buffer.flushing());
            REQUIRE(buffer.flush([](QueuedMessage&) { return true; }) == 0);
        }
        return true;
    });

    REQUIRE(count == 3);
    REQUIRE(sent == std::vector<std::string>{"a", "b", "late"});
    REQUIRE(buffer.empty());
}

TEST_CASE("OutboundBuffer refusal keeps old frames ahead of new ones", "[outbound]") {
    OutboundBuffer buffer;
    buffer.enqueue("a");
    buffer.enqueue("b");

    const auto count = buffer.flush([&buffer](QueuedMessage& message) {
        if (message.payload == "a") {
            buffer.enqueue("late");
            return true;
        }
        return false;
    });

    REQUIRE(count == 1);
    REQUIRE(buffer.size() == 2);
    REQUIRE(buffer.messages()[0].payload == "b");
    REQUIRE(buffer.messages()[1].payload == "late");
}

TEST_CASE("OutboundBuffer requeues when the sink throws", "[outbound]") {
    OutboundBuffer buffer;
    buffer.enqueue("a");
    buffer.enqueue("b");

    REQUIRE_THROWS_AS(
        buffer.flush([](QueuedMessage&) -> bool { throw std::runtime_error("sink failed"); }),
        std::runtime_error
    );

    REQUIRE(buffer.size() == 2);
    REQUIRE(buffer.messages()[0].payload == "a");
    REQUIRE(buffer.flushing() == false);

    SECTION("non-standard exceptions too") {
        REQUIRE_THROWS_AS(
            buffer.flush([](QueuedMessage&) -> bool { throw 42; }),
            int
        );
        REQUIRE(buffer.size() == 2);
        REQUIRE(buffer.flushing() == false);

        std::vector<std::string> sent;
        REQUIRE(buffer.flush([&sent](QueuedMessage& message) {
            sent.push_back(message.payload);
            return true;
        }) == 2);
        REQUIRE(sent == std::vector<std::string>{"a", "b"});
    }
}

TEST_CASE("OutboundBuffer flush of an empty buffer is a no-op", "[outbound]") {
    OutboundBuffer buffer;
    int calls = 0;

    REQUIRE(buffer.flush([&calls](QueuedMessage&) { ++calls; return true; }) == 0);
    REQUIRE(calls == 0);
    REQUIRE(buffer.empty());
}
