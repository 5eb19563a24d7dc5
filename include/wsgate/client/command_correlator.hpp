#pragma once

#include "wsgate/client/command_error.hpp"
#include "wsgate/protocol/frames.hpp"

#include <chrono>
#include <cstddef>
#include <unordered_map>

namespace wsgate {

// ─────────────────────────────────────────────────────────────────────────────
// CommandCorrelator
// ─────────────────────────────────────────────────────────────────────────────
// Pending-reply map keyed by correlation id.
//
// Ids start at 1 and only grow for the lifetime of the correlator, so an id
// is never shared by two outstanding commands. Each entry is removed before
// its handler runs: a handler sees the correlator without itself, and an
// exception thrown by the handler propagates to the caller of resolve() or
// reject() with the map already consistent.
//
// Not thread-safe; owned and used on the client strand.

class CommandCorrelator {
public:
    using Clock = std::chrono::steady_clock;

    /// Allocate the next id and register the handler under it.
    [[nodiscard]] CorrelationId register_command(ResultHandler handler);

    /// The frame carrying this id has been written to a connection.
    void mark_transmitted(CorrelationId id);

    /// Deliver a result. Unknown ids are ignored.
    /// @return true if a pending command was resolved
    bool resolve(CorrelationId id, Json result);

    /// Deliver a remote error. Unknown ids are ignored.
    /// @return true if a pending command was rejected
    bool reject(CorrelationId id, Json error);

    /// Fail every command that was transmitted but not answered. Commands
    /// still waiting to be transmitted are kept. All handlers run; if any
    /// throw, the first exception is rethrown afterwards.
    /// @return number of commands failed
    std::size_t fail_transmitted(const CommandError& error);

    /// Fail every pending command. Same exception handling as
    /// fail_transmitted().
    std::size_t fail_all(const CommandError& error);

    [[nodiscard]] bool contains(CorrelationId id) const {
        return pending_.find(id) != pending_.end();
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return pending_.size();
    }

    [[nodiscard]] bool empty() const noexcept {
        return pending_.empty();
    }

    /// Id that the next registration will receive.
    [[nodiscard]] CorrelationId next_id() const noexcept {
        return next_id_;
    }

private:
    struct PendingCommand {
        ResultHandler handler;
        Clock::time_point issued_at;
        bool transmitted{false};
    };

    bool complete(CorrelationId id, CommandResult outcome);

    std::unordered_map<CorrelationId, PendingCommand> pending_;
    CorrelationId next_id_{1};
};

}  // namespace wsgate
