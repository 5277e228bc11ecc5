#include "sftp_session.hpp"
#include "logger.hpp"
#include <fcntl.h>
#include <format>
#include <fstream>
#include <vector>

namespace {

constexpr std::size_t kChunkSize = 16384;

} // namespace

const char* transferFaultName(TransferFault fault) noexcept {
    switch (fault) {
    case TransferFault::ConnectionLost:
        return "connection lost";
    case TransferFault::Io:
        return "I/O error";
    case TransferFault::NotFound:
        return "not found";
    case TransferFault::PermissionDenied:
        return "permission denied";
    case TransferFault::Other:
        break;
    }
    return "unrecoverable error";
}

TransferFault classifySftpStatus(int sftpStatus, bool transportConnected) noexcept {
    switch (sftpStatus) {
    case SSH_FX_NO_SUCH_FILE:
    case SSH_FX_NO_SUCH_PATH:
        return TransferFault::NotFound;
    case SSH_FX_PERMISSION_DENIED:
    case SSH_FX_WRITE_PROTECT:
        return TransferFault::PermissionDenied;
    case SSH_FX_NO_CONNECTION:
    case SSH_FX_CONNECTION_LOST:
        return TransferFault::ConnectionLost;
    case SSH_FX_OK:
        // No SFTP status: the failure happened in the transport underneath.
        return transportConnected ? TransferFault::Io : TransferFault::ConnectionLost;
    case SSH_FX_EOF:
    case SSH_FX_FAILURE:
    case SSH_FX_BAD_MESSAGE:
        return TransferFault::Io;
    default:
        return TransferFault::Other;
    }
}

SftpSession::SftpSession(ssh_session ssh, sftp_session sftp)
    : ssh_(ssh), sftp_(sftp) {}

SftpSession::~SftpSession() {
    close();
}

TransferFailure SftpSession::lastFailure(const std::string& context) const {
    if (!ssh_ || !sftp_) {
        return {TransferFault::ConnectionLost, std::format("{}: session is closed", context)};
    }
    int status = sftp_get_error(sftp_);
    bool connected = ssh_is_connected(ssh_) != 0;
    return {classifySftpStatus(status, connected),
            std::format("{}: {} (sftp status {})", context, ssh_get_error(ssh_), status)};
}

std::expected<void, TransferFailure> SftpSession::put(const std::string& localFile, const std::string& remotePath) {
    if (!isOpen()) {
        return std::unexpected(TransferFailure{TransferFault::ConnectionLost, "SFTP session is closed"});
    }

    std::ifstream input(localFile, std::ios::binary);
    if (!input) {
        return std::unexpected(TransferFailure{TransferFault::Other,
                                               std::format("Failed to open local file: {}", localFile)});
    }

    sftp_file file = sftp_open(sftp_, remotePath.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (!file) {
        return std::unexpected(lastFailure(std::format("Failed to open remote file {}", remotePath)));
    }

    std::vector<char> buf(kChunkSize);
    std::size_t total = 0;
    while (input) {
        input.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto count = static_cast<std::size_t>(input.gcount());
        std::size_t offset = 0;
        while (offset < count) {
            ssize_t written = sftp_write(file, buf.data() + offset, count - offset);
            if (written <= 0) {
                auto failure = lastFailure(std::format("Failed to write remote file {}", remotePath));
                sftp_close(file);
                return std::unexpected(failure);
            }
            offset += static_cast<std::size_t>(written);
        }
        total += count;
    }

    if (input.bad()) {
        sftp_close(file);
        return std::unexpected(TransferFailure{TransferFault::Io,
                                               std::format("Failed to read local file: {}", localFile)});
    }

    if (sftp_close(file) != SSH_NO_ERROR) {
        return std::unexpected(lastFailure(std::format("Failed to close remote file {}", remotePath)));
    }

    Logger::debug("Transferred {} bytes to {}", total, remotePath);
    return {};
}

void SftpSession::close() {
    if (sftp_) {
        sftp_free(sftp_);
        sftp_ = nullptr;
    }
    if (ssh_) {
        ssh_disconnect(ssh_);
        ssh_free(ssh_);
        ssh_ = nullptr;
    }
}
