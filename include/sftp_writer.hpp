/**
 * @file sftp_writer.hpp
 * @brief Upload orchestration for the SFTP writer.
 *
 * The writer owns the transfer session for the whole run, uploads the tasks one at a time in
 * the order they were enumerated, and releases the session exactly once however the run ends.
 */

#ifndef SFTP_WRITER_HPP
#define SFTP_WRITER_HPP

#include "errors.hpp"
#include "input_catalog.hpp"
#include "retrying_uploader.hpp"
#include "transfer_session.hpp"
#include "writer_config.hpp"
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

/**
 * @brief Closes a transfer session once when the guard goes out of scope.
 */
class SessionGuard {
public:
    explicit SessionGuard(TransferSession& session) : session_(session) {}
    ~SessionGuard() { release(); }

    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;

    /**
     * @brief Closes the session now. Later calls and the destructor do nothing.
     */
    void release();

    bool released() const noexcept { return released_; }

private:
    TransferSession& session_;
    bool released_ = false;
};

/**
 * @brief Uploads enumerated tasks through a single session.
 */
class SftpWriter {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @brief Constructs a writer.
     *
     * @param config Validated configuration (remote path and date-stamp settings are used).
     * @param uploader Per-file uploader with its retry policy.
     * @param clock Source of the upload time used for date stamps.
     */
    explicit SftpWriter(WriterConfig config,
                        RetryingUploader uploader = RetryingUploader{},
                        Clock clock = [] { return std::chrono::system_clock::now(); });

    /**
     * @brief Uploads every task in order, stopping at the first failure.
     *
     * @param session Open session; the writer takes ownership and closes it exactly once.
     * @param tasks Tasks in upload order.
     * @return std::expected<void, WriterError> Success or the first failure, unchanged.
     */
    std::expected<void, WriterError> run(std::unique_ptr<TransferSession> session,
                                         const std::vector<UploadTask>& tasks) const;

    /**
     * @brief Returns the remote path for a task at the current clock time.
     */
    std::expected<std::string, WriterError> destinationFor(const UploadTask& task) const;

private:
    WriterConfig config_;
    RetryingUploader uploader_;
    Clock clock_;
};

#endif // SFTP_WRITER_HPP
