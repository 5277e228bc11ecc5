/**
 * @file sftp_session.hpp
 * @brief SFTP implementation of TransferSession on top of libssh.
 *
 * @note Requires libssh. Install via apt (libssh-dev), Homebrew or vcpkg.
 */

#ifndef SFTP_SESSION_HPP
#define SFTP_SESSION_HPP

#include "transfer_session.hpp"
#include <libssh/libssh.h>
#include <libssh/sftp.h>

/**
 * @brief Maps an SFTP status code to a transfer fault.
 *
 * @param sftpStatus Value returned by sftp_get_error().
 * @param transportConnected Whether the SSH transport is still connected.
 */
TransferFault classifySftpStatus(int sftpStatus, bool transportConnected) noexcept;

/**
 * @brief Open SFTP session owning an authenticated SSH transport and its SFTP channel.
 */
class SftpSession : public TransferSession {
public:
    /**
     * @brief Takes ownership of a connected SSH session and an initialized SFTP channel.
     */
    SftpSession(ssh_session ssh, sftp_session sftp);

    /**
     * @brief Closes the session if still open.
     */
    ~SftpSession() override;

    SftpSession(const SftpSession&) = delete;
    SftpSession& operator=(const SftpSession&) = delete;

    /**
     * @brief Streams the local file into the remote path (O_WRONLY | O_CREAT | O_TRUNC, 0644).
     */
    std::expected<void, TransferFailure> put(const std::string& localFile, const std::string& remotePath) override;

    void close() override;

    bool isOpen() const override { return ssh_ != nullptr; }

private:
    TransferFailure lastFailure(const std::string& context) const;

    ssh_session ssh_ = nullptr;   ///< SSH transport.
    sftp_session sftp_ = nullptr; ///< SFTP sub-channel; never outlives ssh_.
};

#endif // SFTP_SESSION_HPP
