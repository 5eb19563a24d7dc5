#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Command Error
// ═══════════════════════════════════════════════════════════════════════════
// Outcome of a command that did not produce a result frame.

#include "wsgate/transport.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace wsgate {

struct CommandError {
    enum class Code {
        Remote,           ///< The gateway answered with an error frame
        ConnectionReset,  ///< The connection carrying the command was lost
        Cancelled         ///< The client was shut down before an answer
    };

    Code code{Code::Remote};
    std::string message;
    std::optional<Json> payload;  ///< The "e" member of the error frame

    [[nodiscard]] static CommandError remote(Json error) {
        std::string message = "Gateway returned an error";
        if (error.is_string()) {
            message = error.get<std::string>();
        } else if (error.is_object() && error.contains("message") && error["message"].is_string()) {
            message = error["message"].get<std::string>();
        }
        return {Code::Remote, std::move(message), std::move(error)};
    }

    [[nodiscard]] static CommandError connection_reset() {
        return {Code::ConnectionReset, "Connection lost before the command was answered", std::nullopt};
    }

    [[nodiscard]] static CommandError cancelled() {
        return {Code::Cancelled, "Command was cancelled", std::nullopt};
    }
};

[[nodiscard]] constexpr std::string_view to_string(CommandError::Code code) noexcept {
    switch (code) {
        case CommandError::Code::Remote:          return "Remote";
        case CommandError::Code::ConnectionReset: return "ConnectionReset";
        case CommandError::Code::Cancelled:       return "Cancelled";
    }
    return "Unknown";
}

using CommandResult = tl::expected<Json, CommandError>;

/// Invoked exactly once per command that was issued with a handler.
using ResultHandler = std::function<void(CommandResult)>;

}  // namespace wsgate
