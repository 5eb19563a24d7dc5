#include <catch2/catch_test_macros.hpp>

#include "wsgate/session/session_manager.hpp"

#include <string>

using namespace wsgate;

// ═══════════════════════════════════════════════════════════════════════════
// Handshake Handling
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SessionManager first handshake raises ready", "[session]") {
    SessionManager session;

    REQUIRE(session.has_been_ready() == false);
    REQUIRE(session.session_id().has_value() == false);
    REQUIRE(session.ready_at().has_value() == false);

    SECTION("new session") {
        const auto outcome = session.handle_hello(HelloFrame{"s1", true});
        REQUIRE(outcome.became_ready);
        REQUIRE(outcome.is_new);
        REQUIRE(outcome.session_id == "s1");
    }

    SECTION("resumed session on the very first connection") {
        const auto outcome = session.handle_hello(HelloFrame{"s1", false});
        REQUIRE(outcome.became_ready);
        REQUIRE(outcome.is_new == false);
    }

    REQUIRE(session.has_been_ready());
    REQUIRE(session.session_id() == "s1");
    REQUIRE(session.ready_at().has_value());
}

TEST_CASE("SessionManager resumed sessions do not raise ready again", "[session]") {
    SessionManager session;
    REQUIRE(session.handle_hello(HelloFrame{"s1", true}).became_ready);
    const auto first_ready = session.ready_at();

    const auto resumed = session.handle_hello(HelloFrame{"s1", false});
    REQUIRE(resumed.became_ready == false);
    REQUIRE(session.session_id() == "s1");
    REQUIRE(session.ready_at() == first_ready);

    SECTION("a new session raises ready again") {
        const auto fresh = session.handle_hello(HelloFrame{"s2", true});
        REQUIRE(fresh.became_ready);
        REQUIRE(session.session_id() == "s2");
    }

    SECTION("readiness is sticky") {
        REQUIRE(session.has_been_ready());
    }
}

TEST_CASE("SessionManager starts from a known session id", "[session]") {
    SessionManager session(std::string("resume-me"));

    REQUIRE(session.session_id() == "resume-me");
    REQUIRE(session.has_been_ready() == false);

    SECTION("gateway honours it") {
        const auto outcome = session.handle_hello(HelloFrame{"resume-me", false});
        REQUIRE(outcome.became_ready);
        REQUIRE(session.session_id() == "resume-me");
    }

    SECTION("gateway replaces it") {
        const auto outcome = session.handle_hello(HelloFrame{"other", true});
        REQUIRE(outcome.became_ready);
        REQUIRE(session.session_id() == "other");
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Session Id Validation
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SessionManager validates session ids", "[session][validation]") {
    REQUIRE(SessionManager::is_valid_session_id("a1b2-c3d4"));
    REQUIRE(SessionManager::is_valid_session_id(std::string(SessionManager::kMaxSessionIdLength, 'x')));

    REQUIRE(SessionManager::is_valid_session_id("") == false);
    REQUIRE(SessionManager::is_valid_session_id("has space") == false);
    REQUIRE(SessionManager::is_valid_session_id("tab\there") == false);
    REQUIRE(SessionManager::is_valid_session_id(std::string("nul\0id", 6)) == false);
    REQUIRE(SessionManager::is_valid_session_id("del\x7f") == false);
    REQUIRE(SessionManager::is_valid_session_id(std::string(SessionManager::kMaxSessionIdLength + 1, 'x')) == false);
}
