/**
 * @file retry.hpp
 * @brief Bounded retry with exponential backoff around any fallible operation.
 *
 * The operation returns a std::expected-like value. Failures the predicate accepts are retried
 * after a growing delay until the attempt budget is spent; other failures return at once.
 */

#ifndef RETRY_HPP
#define RETRY_HPP

#include <chrono>
#include <functional>
#include <type_traits>
#include <utility>

/**
 * @brief Retry budget and delay growth.
 */
struct RetryPolicy {
    int maxAttempts = 5;                           ///< Total calls, first attempt included.
    std::chrono::milliseconds baseDelay{1000};     ///< Delay before the second attempt.
    double factor = 2.0;                           ///< Growth per attempt.
    std::chrono::milliseconds maxDelay{60000};     ///< Upper bound of a single delay.
    bool jitter = true;                            ///< Pick a uniform delay in [0, computed].
};

/**
 * @brief Blocks the calling thread for the given delay.
 */
using Sleeper = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief Sleeper backed by std::this_thread::sleep_for.
 */
void threadSleep(std::chrono::milliseconds delay);

/**
 * @brief Delay to wait after failed attempt number @p attempt (1-based), without jitter.
 *
 * Equals min(baseDelay * factor^(attempt - 1), maxDelay).
 */
std::chrono::milliseconds backoffDelay(const RetryPolicy& policy, int attempt);

/**
 * @brief Delay after attempt @p attempt with the policy's jitter applied.
 */
std::chrono::milliseconds nextDelay(const RetryPolicy& policy, int attempt);

/**
 * @brief Calls @p operation until it succeeds, fails terminally, or the budget runs out.
 *
 * @param policy Attempt budget and delay growth.
 * @param operation Callable returning a std::expected-like result; re-invoked unchanged.
 * @param isRetryable Predicate over the error value.
 * @param onRetry Called as onRetry(attempt, error, delay) before each sleep.
 * @param sleeper Performs the wait between attempts.
 * @return The result of the last call.
 */
template <typename Operation, typename Predicate, typename OnRetry>
auto retryWithBackoff(const RetryPolicy& policy,
                      Operation&& operation,
                      Predicate&& isRetryable,
                      OnRetry&& onRetry,
                      const Sleeper& sleeper = threadSleep) -> std::invoke_result_t<Operation&> {
    const int attempts = policy.maxAttempts < 1 ? 1 : policy.maxAttempts;
    for (int attempt = 1;; ++attempt) {
        auto result = operation();
        if (result || attempt >= attempts || !isRetryable(result.error())) {
            return result;
        }
        auto delay = nextDelay(policy, attempt);
        onRetry(attempt, result.error(), delay);
        sleeper(delay);
    }
}

#endif // RETRY_HPP
