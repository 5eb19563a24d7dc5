#ifndef WSGATE_TRANSPORT_RETRY_POLICY_HPP
#define WSGATE_TRANSPORT_RETRY_POLICY_HPP

#include "wsgate/transport/transport_error.hpp"

#include <cstddef>
#include <optional>

namespace wsgate {

// ─────────────────────────────────────────────────────────────────────────────
// RetryPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Decides whether a failed connection attempt is followed by another one.
//
// This complements IBackoffPolicy (which defines *how long* to wait) by
// defining *whether* to try again:
// - the transport must classify the error as retryable, and
// - the number of consecutive failures must not exceed the retry count.
//
// With a retry count of N, failures 1..N are retried and failure N+1 is
// terminal. Without a retry count the supervisor never gives up.
//
// Usage:
//   RetryPolicy policy;                  // unbounded
//   policy.with_max_retries(2);          // 2 retries, 3rd failure terminates
//
//   if (policy.should_retry(error, failures)) {
//       // schedule next attempt
//   }

class RetryPolicy {
public:
    RetryPolicy() = default;

    /// Limit the number of retries after consecutive failures.
    RetryPolicy& with_max_retries(std::size_t retries) {
        max_retries_ = retries;
        return *this;
    }

    /// Never stop retrying retryable errors.
    RetryPolicy& unbounded() {
        max_retries_.reset();
        return *this;
    }

    [[nodiscard]] std::optional<std::size_t> max_retries() const noexcept {
        return max_retries_;
    }

    [[nodiscard]] bool is_unbounded() const noexcept {
        return max_retries_.has_value() == false;
    }

    /// Check whether a failed attempt should be retried.
    /// @param error The error reported by the transport
    /// @param failures Consecutive failures so far, including this one (>= 1)
    [[nodiscard]] bool should_retry(const ConnectionError& error, std::size_t failures) const noexcept {
        if (error.retryable == false) {
            return false;
        }
        if (is_unbounded()) {
            return true;
        }
        return failures <= *max_retries_;
    }

private:
    std::optional<std::size_t> max_retries_;
};

}  // namespace wsgate

#endif  // WSGATE_TRANSPORT_RETRY_POLICY_HPP
