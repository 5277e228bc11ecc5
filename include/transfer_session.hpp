/**
 * @file transfer_session.hpp
 * @brief Interface of an open file-transfer session.
 *
 * A session is created once per run by the connection manager and owned exclusively by the
 * upload orchestrator until it is closed.
 */

#ifndef TRANSFER_SESSION_HPP
#define TRANSFER_SESSION_HPP

#include <expected>
#include <string>

/**
 * @brief Low-level cause of a failed transfer attempt.
 */
enum class TransferFault {
    ConnectionLost,   ///< The transport dropped or the channel is gone.
    Io,               ///< Generic I/O failure reported by the server or while streaming.
    NotFound,         ///< Remote path (or its directory) does not exist.
    PermissionDenied, ///< Server refused access to the remote path.
    Other             ///< Anything that retrying cannot fix.
};

/**
 * @brief Failure of a single transfer attempt.
 */
struct TransferFailure {
    TransferFault fault; ///< Cause category.
    std::string detail;  ///< Diagnostic text from the transport.
};

/**
 * @brief Returns the display name of a transfer fault.
 */
const char* transferFaultName(TransferFault fault) noexcept;

/**
 * @brief Interface for an open transfer session.
 *
 * Implementations release the sub-channel before the transport. close() must be idempotent.
 */
class TransferSession {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~TransferSession() = default;

    /**
     * @brief Uploads a whole local file to an exact remote path, replacing any existing file.
     *
     * @param localFile Path to the local file.
     * @param remotePath Full remote file path.
     * @return std::expected<void, TransferFailure> Success or the cause of the failure.
     */
    virtual std::expected<void, TransferFailure> put(const std::string& localFile, const std::string& remotePath) = 0;

    /**
     * @brief Releases the sub-channel and the transport. Later calls do nothing.
     */
    virtual void close() = 0;

    /**
     * @brief Returns true until close() has run.
     */
    virtual bool isOpen() const = 0;
};

#endif // TRANSFER_SESSION_HPP
