#include "connection_manager.hpp"
#include "logger.hpp"
#include "sftp_session.hpp"
#include <cerrno>
#include <cstring>
#include <format>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

constexpr const char* kHostHint = "Connection failed: recheck your host URL and port parameters";
constexpr const char* kAuthHint = "Connection failed: recheck your authentication and host URL parameters";

struct SshSessionDeleter {
    void operator()(ssh_session ssh) const noexcept {
        ssh_disconnect(ssh);
        ssh_free(ssh);
    }
};

struct SftpSessionDeleter {
    void operator()(sftp_session sftp) const noexcept { sftp_free(sftp); }
};

using SshSessionPtr = std::unique_ptr<std::remove_pointer_t<ssh_session>, SshSessionDeleter>;
using SftpSessionPtr = std::unique_ptr<std::remove_pointer_t<sftp_session>, SftpSessionDeleter>;

/**
 * @brief Resolves the host and opens a connected TCP socket.
 *
 * Tries every address getaddrinfo returns, in order.
 */
std::expected<int, std::string> openSocket(const std::string& host, int port) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::string portStr = std::to_string(port);
    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &res);
    if (gai != 0) {
        return std::unexpected(std::format("Failed to resolve hostname '{}': {}", host, gai_strerror(gai)));
    }

    std::string lastError = "no usable address";
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int sock = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (sock == -1) {
            lastError = std::strerror(errno);
            continue;
        }
        if (::connect(sock, rp->ai_addr, rp->ai_addrlen) == 0) {
            freeaddrinfo(res);
            return sock;
        }
        lastError = std::strerror(errno);
        ::close(sock);
    }
    freeaddrinfo(res);
    return std::unexpected(std::format("Failed to connect to {}:{}: {}", host, port, lastError));
}

} // namespace

int authenticateWith(const AuthMethods& methods) {
    if (methods.publicKey) {
        int rc = methods.publicKey();
        if (rc == SSH_AUTH_SUCCESS || rc == SSH_AUTH_ERROR || !methods.password) {
            return rc;
        }
        Logger::warning("{} key was not accepted, trying password authentication.", methods.keyLabel);
    }
    if (methods.password) {
        return methods.password();
    }
    return SSH_AUTH_DENIED;
}

std::optional<ConnectStage> authFailureStage(int rc) {
    if (rc == SSH_AUTH_SUCCESS) {
        return std::nullopt;
    }
    if (rc == SSH_AUTH_ERROR) {
        return ConnectStage::Handshake;
    }
    return ConnectStage::Authenticate;
}

WriterError classifyConnectFailure(ConnectStage stage, const std::string& detail) {
    ErrorKind kind = ErrorKind::ProtocolOrHostError;
    const char* hint = kHostHint;
    switch (stage) {
    case ConnectStage::Resolve:
        kind = ErrorKind::HostUnreachable;
        break;
    case ConnectStage::Authenticate:
        kind = ErrorKind::AuthenticationFailed;
        hint = kAuthHint;
        break;
    case ConnectStage::Handshake:
    case ConnectStage::Channel:
        break;
    }
    if (detail.empty()) {
        return {kind, hint};
    }
    return {kind, std::format("{} ({})", hint, detail)};
}

std::expected<std::unique_ptr<TransferSession>, WriterError> ConnectionManager::connect(const ConnectionParams& params,
                                                                                        const Credential& credential) const {
    Logger::info("Connecting to {}:{} as {}", params.host, params.port, params.user);

    auto sock = openSocket(params.host, params.port);
    if (!sock) {
        return std::unexpected(classifyConnectFailure(ConnectStage::Resolve, sock.error()));
    }

    SshSessionPtr ssh(ssh_new());
    if (!ssh) {
        ::close(*sock);
        return std::unexpected(WriterError{ErrorKind::Unclassified, "Failed to create SSH session"});
    }

    socket_t fd = *sock;
    unsigned int port = static_cast<unsigned int>(params.port);
    if (ssh_options_set(ssh.get(), SSH_OPTIONS_FD, &fd) != SSH_OK) {
        ::close(fd);
        return std::unexpected(WriterError{ErrorKind::Unclassified,
                                           std::format("Failed to attach socket: {}", ssh_get_error(ssh.get()))});
    }
    // The session owns the socket from here on.
    ssh_options_set(ssh.get(), SSH_OPTIONS_HOST, params.host.c_str());
    ssh_options_set(ssh.get(), SSH_OPTIONS_PORT, &port);
    ssh_options_set(ssh.get(), SSH_OPTIONS_USER, params.user.c_str());

    if (ssh_connect(ssh.get()) != SSH_OK) {
        return std::unexpected(classifyConnectFailure(ConnectStage::Handshake, ssh_get_error(ssh.get())));
    }
    Logger::debug("SSH handshake with {} completed", params.host);

    AuthMethods methods;
    ssh_session raw = ssh.get();
    if (credential.key) {
        ssh_key key = credential.key->handle();
        methods.publicKey = [raw, key] { return ssh_userauth_publickey(raw, nullptr, key); };
        methods.keyLabel = keyTypeName(credential.key->type());
    }
    if (!credential.password.empty()) {
        const std::string& password = credential.password;
        methods.password = [raw, &password] { return ssh_userauth_password(raw, nullptr, password.c_str()); };
    }
    if (auto stage = authFailureStage(authenticateWith(methods))) {
        return std::unexpected(classifyConnectFailure(*stage, ssh_get_error(raw)));
    }

    SftpSessionPtr sftp(sftp_new(ssh.get()));
    if (!sftp) {
        return std::unexpected(classifyConnectFailure(ConnectStage::Channel, ssh_get_error(ssh.get())));
    }
    if (sftp_init(sftp.get()) != SSH_OK) {
        return std::unexpected(classifyConnectFailure(
            ConnectStage::Channel, std::format("{} (sftp status {})", ssh_get_error(ssh.get()), sftp_get_error(sftp.get()))));
    }

    Logger::info("Connected to {}:{}", params.host, params.port);
    sftp_session channel = sftp.release();
    return std::make_unique<SftpSession>(ssh.release(), channel);
}
