#include "wsgate/client/command_correlator.hpp"

#include "wsgate/log/logger.hpp"

#include <algorithm>
#include <exception>
#include <vector>

namespace wsgate {

namespace {

using FailedCommands = std::vector<std::pair<CorrelationId, ResultHandler>>;

// Handlers run in issue order. Every handler runs even if an earlier one
// throws; the first exception is rethrown once all have been called.
std::size_t deliver_failures(FailedCommands failed, const CommandError& error) {
    std::sort(failed.begin(), failed.end(), [](const auto& a, const auto& b) {
        return a.first < b.first;
    });
    std::exception_ptr first_exception;
    for (auto& [id, handler] : failed) {
        if (handler == nullptr) {
            continue;
        }
        try {
            handler(tl::unexpected(error));
        } catch (...) {
            if (first_exception == nullptr) {
                first_exception = std::current_exception();
            } else {
                WSGATE_LOG_WARN("Result handler for command {} also threw", id);
            }
        }
    }
    if (first_exception != nullptr) {
        std::rethrow_exception(first_exception);
    }
    return failed.size();
}

}  // namespace

CorrelationId CommandCorrelator::register_command(ResultHandler handler) {
    const CorrelationId id = next_id_++;
    pending_.emplace(id, PendingCommand{std::move(handler), Clock::now(), false});
    return id;
}

void CommandCorrelator::mark_transmitted(CorrelationId id) {
    auto it = pending_.find(id);
    if (it != pending_.end()) {
        it->second.transmitted = true;
    }
}

bool CommandCorrelator::resolve(CorrelationId id, Json result) {
    return complete(id, CommandResult(std::move(result)));
}

bool CommandCorrelator::reject(CorrelationId id, Json error) {
    return complete(id, tl::unexpected(CommandError::remote(std::move(error))));
}

bool CommandCorrelator::complete(CorrelationId id, CommandResult outcome) {
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        WSGATE_LOG_DEBUG("No pending command with id {}", id);
        return false;
    }
    auto handler = std::move(it->second.handler);
    pending_.erase(it);

    if (handler) {
        handler(std::move(outcome));
    }
    return true;
}

std::size_t CommandCorrelator::fail_transmitted(const CommandError& error) {
    // Detach first: handlers may register new commands
    FailedCommands failed;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->second.transmitted) {
            failed.emplace_back(it->first, std::move(it->second.handler));
            it = pending_.erase(it);
        } else {
            ++it;
        }
    }
    return deliver_failures(std::move(failed), error);
}

std::size_t CommandCorrelator::fail_all(const CommandError& error) {
    FailedCommands failed;
    failed.reserve(pending_.size());
    for (auto& [id, pending] : pending_) {
        failed.emplace_back(id, std::move(pending.handler));
    }
    pending_.clear();
    return deliver_failures(std::move(failed), error);
}

}  // namespace wsgate
