#include "destination_resolver.hpp"
#include <ctime>
#include <filesystem>
#include <format>
#include <string_view>

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kMaxTimestampLength = 4096;

} // namespace

std::expected<std::string, WriterError> formatTimestamp(const std::string& format,
                                                        std::chrono::system_clock::time_point when) {
    const std::string& pattern = format.empty() ? std::string(kDefaultDateFormat) : format;

    auto timeT = std::chrono::system_clock::to_time_t(when);
    std::tm tmUtc{};
    gmtime_r(&timeT, &tmUtc);

    if (pattern.find('%') != std::string::npos) {
        // strftime reports both overflow and empty output as 0.
        for (std::size_t size = 128; size <= kMaxTimestampLength; size *= 2) {
            std::string timeBuf(size, '\0');
            std::size_t len = std::strftime(timeBuf.data(), timeBuf.size(), pattern.c_str(), &tmUtc);
            if (len > 0) {
                timeBuf.resize(len);
                return timeBuf;
            }
        }
        return std::unexpected(WriterError{ErrorKind::InvalidConfiguration,
                                           std::format("Date format '{}' does not produce a timestamp", pattern)});
    }

    std::string result;
    bool afterHour = false;
    std::string_view rest(pattern);
    while (!rest.empty()) {
        if (rest.starts_with("YYYY")) {
            result += std::format("{:04d}", tmUtc.tm_year + 1900);
            rest.remove_prefix(4);
        } else if (rest.starts_with("YY")) {
            result += std::format("{:02d}", (tmUtc.tm_year + 1900) % 100);
            rest.remove_prefix(2);
        } else if (rest.starts_with("MM")) {
            result += std::format("{:02d}", afterHour ? tmUtc.tm_min : tmUtc.tm_mon + 1);
            rest.remove_prefix(2);
        } else if (rest.starts_with("DD")) {
            result += std::format("{:02d}", tmUtc.tm_mday);
            rest.remove_prefix(2);
        } else if (rest.starts_with("HH")) {
            result += std::format("{:02d}", tmUtc.tm_hour);
            afterHour = true;
            rest.remove_prefix(2);
        } else if (rest.starts_with("mm")) {
            result += std::format("{:02d}", tmUtc.tm_min);
            rest.remove_prefix(2);
        } else if (rest.starts_with("SS") || rest.starts_with("ss")) {
            result += std::format("{:02d}", tmUtc.tm_sec);
            rest.remove_prefix(2);
        } else {
            result += rest.front();
            rest.remove_prefix(1);
        }
    }
    return result;
}

std::pair<std::string, std::string> splitExtension(const std::string& fileName) {
    auto dot = fileName.rfind('.');
    auto firstNonDot = fileName.find_first_not_of('.');
    if (dot == std::string::npos || firstNonDot == std::string::npos || firstNonDot > dot) {
        return {fileName, std::string()};
    }
    return {fileName.substr(0, dot), fileName.substr(dot)};
}

std::expected<std::string, WriterError> DestinationResolver::resolve(const std::string& remoteBaseDir,
                                                                     const std::string& logicalName,
                                                                     bool dateStampEnabled,
                                                                     const std::string& dateFormat,
                                                                     std::chrono::system_clock::time_point now) {
    std::string base = remoteBaseDir;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    base += '/';

    auto [stem, extension] = splitExtension(fs::path(logicalName).filename().string());

    std::string suffix;
    if (dateStampEnabled) {
        auto stamp = formatTimestamp(dateFormat, now);
        if (!stamp) {
            return std::unexpected(stamp.error());
        }
        suffix = "_" + *stamp;
    }

    return base + stem + suffix + extension;
}
