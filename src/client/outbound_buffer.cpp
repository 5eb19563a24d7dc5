#include "wsgate/client/outbound_buffer.hpp"

#include "wsgate/log/logger.hpp"

#include <exception>
#include <iterator>

namespace wsgate {

void OutboundBuffer::enqueue(std::string payload, std::optional<CorrelationId> correlation_id) {
    WSGATE_LOG_TRACE("Queueing message: {}", payload);
    queue_.push_back(QueuedMessage{
        std::move(payload),
        correlation_id,
        std::chrono::steady_clock::now()
    });
}

std::size_t OutboundBuffer::flush(const Sink& sink) {
    // A sink that triggers another flush joins the running one
    if (flushing_ || queue_.empty()) {
        return 0;
    }
    flushing_ = true;

    std::size_t sent = 0;
    bool stalled = false;
    while (queue_.empty() == false && stalled == false) {
        // Take the current batch; frames enqueued by the sink land in queue_
        std::deque<QueuedMessage> batch;
        batch.swap(queue_);

        while (batch.empty() == false) {
            bool accepted = false;
            try {
                accepted = sink(batch.front());
            } catch (...) {
                // Keep the unsent frames ahead of anything added meanwhile
                batch.insert(batch.end(), std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
                queue_.swap(batch);
                flushing_ = false;
                throw;
            }
            if (accepted == false) {
                stalled = true;
                break;
            }
            batch.pop_front();
            ++sent;
        }

        if (stalled) {
            batch.insert(batch.end(), std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
            queue_.swap(batch);
        }
    }

    flushing_ = false;
    if (stalled) {
        WSGATE_LOG_DEBUG("Flush stopped with {} message(s) still queued", queue_.size());
    }
    return sent;
}

}  // namespace wsgate
