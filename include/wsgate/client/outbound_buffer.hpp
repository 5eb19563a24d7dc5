#pragma once

#include "wsgate/protocol/frames.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <optional>
#include <string>

namespace wsgate {

struct QueuedMessage {
    std::string payload;                       // serialized frame
    std::optional<CorrelationId> correlation_id;
    std::chrono::steady_clock::time_point enqueued_at;
};

// ─────────────────────────────────────────────────────────────────────────────
// OutboundBuffer
// ─────────────────────────────────────────────────────────────────────────────
// FIFO of frames produced while the session was not usable.
//
// flush() hands frames to a sink in enqueue order. Frames enqueued while a
// flush is running (for instance by a result handler) are sent after every
// frame that was already buffered. If the sink refuses a frame, that frame
// and everything behind it stay buffered in send order.
//
// Not thread-safe; owned and used on the client strand.

class OutboundBuffer {
public:
    /// Returns false when the frame could not be written.
    using Sink = std::function<bool(QueuedMessage&)>;

    void enqueue(std::string payload, std::optional<CorrelationId> correlation_id = std::nullopt);

    /// @return number of frames handed to the sink successfully
    std::size_t flush(const Sink& sink);

    [[nodiscard]] bool empty() const noexcept {
        return queue_.empty();
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return queue_.size();
    }

    [[nodiscard]] bool flushing() const noexcept {
        return flushing_;
    }

    [[nodiscard]] const std::deque<QueuedMessage>& messages() const noexcept {
        return queue_;
    }

private:
    std::deque<QueuedMessage> queue_;
    bool flushing_{false};
};

}  // namespace wsgate
