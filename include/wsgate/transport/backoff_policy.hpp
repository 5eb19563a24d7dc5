#ifndef WSGATE_TRANSPORT_BACKOFF_POLICY_HPP
#define WSGATE_TRANSPORT_BACKOFF_POLICY_HPP

#include <chrono>
#include <cstddef>

namespace wsgate {

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy - Strategy Pattern Interface
// ─────────────────────────────────────────────────────────────────────────────
// Defines how long the supervisor waits before the next connection attempt,
// both after a failed attempt and after an unexpected disconnect.
//
// Usage:
//   auto policy = std::make_shared<ConstantBackoff>(std::chrono::seconds{10});
//   timer.expires_after(policy->next_delay(failures));

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    // Delay before the next attempt.
    // failures: consecutive failed attempts of the current logical connection
    // (0 after an unexpected disconnect of an open connection).
    virtual std::chrono::milliseconds next_delay(std::size_t failures) = 0;

    // Reset internal state (called when a connection is confirmed open).
    virtual void reset() = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ConstantBackoff - Fixed Delay
// ─────────────────────────────────────────────────────────────────────────────
// The gateway protocol uses one configured retry delay for every attempt.

class ConstantBackoff : public IBackoffPolicy {
public:
    explicit ConstantBackoff(std::chrono::milliseconds delay)
        : delay_(delay) {}

    std::chrono::milliseconds next_delay(std::size_t /*failures*/) override {
        return delay_;
    }

    void reset() override {}

    [[nodiscard]] std::chrono::milliseconds delay() const noexcept {
        return delay_;
    }

private:
    std::chrono::milliseconds delay_;
};

// ─────────────────────────────────────────────────────────────────────────────
// NoBackoff - Testing Helper
// ─────────────────────────────────────────────────────────────────────────────
// Returns zero delay; retries run on the next turn of the executor.

class NoBackoff : public IBackoffPolicy {
public:
    std::chrono::milliseconds next_delay(std::size_t /*failures*/) override {
        return std::chrono::milliseconds{0};
    }

    void reset() override {}
};

}  // namespace wsgate

#endif  // WSGATE_TRANSPORT_BACKOFF_POLICY_HPP
