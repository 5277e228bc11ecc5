/**
 * @file destination_resolver.hpp
 * @brief Computes the remote path a local artifact is uploaded to.
 */

#ifndef DESTINATION_RESOLVER_HPP
#define DESTINATION_RESOLVER_HPP

#include "errors.hpp"
#include <chrono>
#include <expected>
#include <string>
#include <utility>

/**
 * @brief Date format used when the configuration does not name one.
 */
inline constexpr const char* kDefaultDateFormat = "YYYYMMDDHHMMSS";

/**
 * @brief Formats a UTC timestamp.
 *
 * A format containing '%' is passed to strftime. Otherwise the tokens YYYY, YY, MM, DD, HH, mm,
 * SS and ss are replaced; an MM that follows an hour token stands for minutes, so the default
 * "YYYYMMDDHHMMSS" yields e.g. "20240102153045". Other characters are copied as-is.
 *
 * @param format Token pattern or strftime pattern; empty selects kDefaultDateFormat.
 * @param when Point in time, rendered in UTC.
 * @return The formatted time, or ErrorKind::InvalidConfiguration when a strftime pattern
 *         produces no output.
 */
std::expected<std::string, WriterError> formatTimestamp(const std::string& format,
                                                        std::chrono::system_clock::time_point when);

/**
 * @brief Splits a file name into stem and extension.
 *
 * The extension starts at the last '.', unless only dots precede it: ".env", "..bashrc" and
 * "..." have no extension, "a." has the extension ".".
 */
std::pair<std::string, std::string> splitExtension(const std::string& fileName);

/**
 * @brief Builds remote file paths from the configured remote directory.
 */
class DestinationResolver {
public:
    /**
     * @brief Resolves the remote path of one artifact.
     *
     * The result is remoteBaseDir (trailing separators collapsed to exactly one '/') + stem + optional
     * "_<timestamp>" + extension, where stem and extension come from the base name of
     * logicalName. No remote existence check is made.
     *
     * @param remoteBaseDir Configured remote directory.
     * @param logicalName Artifact name, e.g. "report.csv".
     * @param dateStampEnabled Whether to insert the timestamp suffix.
     * @param dateFormat Timestamp format (see formatTimestamp()).
     * @param now Upload time.
     * @return Full remote path, or the timestamp formatting error.
     */
    static std::expected<std::string, WriterError> resolve(const std::string& remoteBaseDir,
                                                           const std::string& logicalName,
                                                           bool dateStampEnabled,
                                                           const std::string& dateFormat,
                                                           std::chrono::system_clock::time_point now =
                                                               std::chrono::system_clock::now());
};

#endif // DESTINATION_RESOLVER_HPP
