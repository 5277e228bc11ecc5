/**
 * @file retrying_uploader.hpp
 * @brief Uploads one file with bounded retries and classifies the final failure.
 */

#ifndef RETRYING_UPLOADER_HPP
#define RETRYING_UPLOADER_HPP

#include "errors.hpp"
#include "retry.hpp"
#include "transfer_session.hpp"
#include <expected>
#include <string>

/**
 * @brief Sends a single file through a TransferSession, retrying transient faults.
 *
 * Connection losses, generic I/O errors and not-found conditions are retried with exponential
 * backoff; every retry re-sends the whole file. The failure that remains is mapped to
 * RemotePathNotFound, RemotePermissionDenied or Unclassified.
 */
class RetryingUploader {
public:
    /**
     * @brief Constructs an uploader.
     *
     * @param policy Retry budget; defaults to 5 attempts starting at 1 s, doubling, with jitter.
     * @param sleeper Waits between attempts.
     */
    explicit RetryingUploader(RetryPolicy policy = {}, Sleeper sleeper = threadSleep);

    /**
     * @brief Uploads @p localPath to @p destination.
     *
     * @param session Open transfer session.
     * @param localPath Local file to send.
     * @param destination Full remote file path.
     * @param remoteBasePath Configured remote directory, named in error messages.
     * @return std::expected<void, WriterError> Success or the classified failure.
     */
    std::expected<void, WriterError> upload(TransferSession& session,
                                            const std::string& localPath,
                                            const std::string& destination,
                                            const std::string& remoteBasePath) const;

    /**
     * @brief Returns true for faults worth another attempt.
     */
    static bool isRetryable(TransferFault fault) noexcept;

    /**
     * @brief Converts the final transfer failure into an operator-facing error.
     */
    static WriterError classify(const TransferFailure& failure, const std::string& remoteBasePath);

    const RetryPolicy& policy() const noexcept { return policy_; }

private:
    RetryPolicy policy_;
    Sleeper sleeper_;
};

#endif // RETRYING_UPLOADER_HPP
