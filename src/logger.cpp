#include "logger.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <mutex>
#include <print>

namespace {

std::atomic<bool> gDebugEnabled{false};
std::mutex gSinkMutex;
Logger::Sink gSink;

std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm tmNow{};
    localtime_r(&timeT, &tmNow);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmNow);
    return timeBuf;
}

} // namespace

const char* logLevelLabel(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

void Logger::setDebug(bool enabled) {
    gDebugEnabled.store(enabled);
}

bool Logger::debugEnabled() {
    return gDebugEnabled.load();
}

void Logger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(gSinkMutex);
    gSink = std::move(sink);
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level == LogLevel::Debug && !debugEnabled()) {
        return;
    }

    std::string logEntry = std::format("[{}] {}: {}", currentTimestamp(), logLevelLabel(level), message);
    if (level == LogLevel::Warning || level == LogLevel::Error) {
        std::println(stderr, "{}", logEntry);
    } else {
        std::println("{}", logEntry);
    }

    std::lock_guard<std::mutex> lock(gSinkMutex);
    if (gSink) {
        gSink(level, message);
    }
}
