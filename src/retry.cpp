#include "retry.hpp"
#include <algorithm>
#include <cmath>
#include <random>
#include <thread>

void threadSleep(std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
}

std::chrono::milliseconds backoffDelay(const RetryPolicy& policy, int attempt) {
    double scaled = static_cast<double>(policy.baseDelay.count()) * std::pow(policy.factor, std::max(attempt - 1, 0));
    double capped = std::min(scaled, static_cast<double>(policy.maxDelay.count()));
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(capped));
}

std::chrono::milliseconds nextDelay(const RetryPolicy& policy, int attempt) {
    auto delay = backoffDelay(policy, attempt);
    if (!policy.jitter || delay.count() <= 0) {
        return delay;
    }
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<std::chrono::milliseconds::rep> dist(0, delay.count());
    return std::chrono::milliseconds(dist(engine));
}
