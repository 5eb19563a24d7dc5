#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Gateway Wire Frames
// ═══════════════════════════════════════════════════════════════════════════
// Every websocket message is one JSON text frame.
//
// Outbound (client → gateway):
//   {"m": "<method>", "p": {...}, "i": 7}      p and i are optional
//
// Inbound (gateway → client):
//   {"hello": {"sid": "...", "isNew": true}}   session handshake
//   {"n": "<kind>", "d": {...}}                 notification
//   {"i": 7, "r": ...}                          command result
//   {"i": 7, "e": ...}                          command error
//
// Inbound frames are parsed with simdjson on-demand and handed out as
// nlohmann::json payloads; outbound frames are built with nlohmann.

#include "wsgate/transport.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <simdjson.h>
#include <tl/expected.hpp>

namespace wsgate {

using CorrelationId = std::uint64_t;

// ─────────────────────────────────────────────────────────────────────────────
// Frame Error
// ─────────────────────────────────────────────────────────────────────────────

struct FrameError {
    enum class Code {
        InvalidJson,    // Not parseable as JSON
        TooDeep,        // Nesting exceeds the decoder's depth limit
        NotAnObject,    // Top-level value is not an object
        InvalidField,   // Known frame shape with a malformed member
        Unrecognized    // Object matches no known frame shape
    };

    Code code{Code::InvalidJson};
    std::string message;

    static FrameError invalid_json(std::string msg) {
        return {Code::InvalidJson, std::move(msg)};
    }

    static FrameError too_deep(std::size_t limit) {
        return {Code::TooDeep, "Maximum nesting depth exceeded (" + std::to_string(limit) + ")"};
    }

    static FrameError not_an_object() {
        return {Code::NotAnObject, "Frame is not a JSON object"};
    }

    static FrameError invalid_field(std::string msg) {
        return {Code::InvalidField, std::move(msg)};
    }

    static FrameError unrecognized() {
        return {Code::Unrecognized, "Frame matches no known message type"};
    }
};

[[nodiscard]] constexpr std::string_view to_string(FrameError::Code code) noexcept {
    switch (code) {
        case FrameError::Code::InvalidJson:  return "InvalidJson";
        case FrameError::Code::TooDeep:      return "TooDeep";
        case FrameError::Code::NotAnObject:  return "NotAnObject";
        case FrameError::Code::InvalidField: return "InvalidField";
        case FrameError::Code::Unrecognized: return "Unrecognized";
    }
    return "Unknown";
}

template <typename T>
using FrameResult = tl::expected<T, FrameError>;

// ─────────────────────────────────────────────────────────────────────────────
// Outbound
// ─────────────────────────────────────────────────────────────────────────────

struct CommandFrame {
    std::string method;
    std::optional<Json> params;
    std::optional<CorrelationId> id;

    [[nodiscard]] Json to_json() const;

    /// Compact JSON text as sent on the wire
    [[nodiscard]] std::string serialize() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Inbound
// ─────────────────────────────────────────────────────────────────────────────

struct HelloFrame {
    std::string session_id;
    bool is_new{false};
};

struct NotificationFrame {
    std::string name;
    Json data;
};

struct ResultFrame {
    CorrelationId id{0};
    Json result;
};

struct ErrorFrame {
    CorrelationId id{0};
    Json error;
};

using InboundFrame = std::variant<HelloFrame, NotificationFrame, ResultFrame, ErrorFrame>;

// ─────────────────────────────────────────────────────────────────────────────
// FrameDecoder
// ─────────────────────────────────────────────────────────────────────────────
// Not thread-safe: one decoder per thread (decode_frame() keeps a
// thread_local instance).

class FrameDecoder {
public:
    static constexpr std::size_t kDefaultMaxDepth = 64;

    explicit FrameDecoder(std::size_t max_depth = kDefaultMaxDepth)
        : max_depth_(max_depth) {}

    /// Parse raw text into a JSON document.
    [[nodiscard]] FrameResult<Json> parse(std::string_view raw);

    /// Parse and classify one inbound frame.
    /// Classification order: hello, notification, result, error.
    [[nodiscard]] FrameResult<InboundFrame> decode(std::string_view raw);

    [[nodiscard]] std::size_t max_depth() const noexcept { return max_depth_; }

private:
    simdjson::ondemand::parser parser_;
    std::size_t max_depth_;

    [[nodiscard]] FrameResult<Json> convert(simdjson::ondemand::value value, std::size_t depth);
    [[nodiscard]] FrameResult<Json> convert_object(simdjson::ondemand::object object, std::size_t depth);
    [[nodiscard]] FrameResult<Json> convert_array(simdjson::ondemand::array array, std::size_t depth);
};

/// Classify an already parsed document.
[[nodiscard]] FrameResult<InboundFrame> classify_frame(Json document);

/// Decode with a thread-local FrameDecoder.
[[nodiscard]] FrameResult<InboundFrame> decode_frame(std::string_view raw);

}  // namespace wsgate
