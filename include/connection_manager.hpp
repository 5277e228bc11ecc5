/**
 * @file connection_manager.hpp
 * @brief Opens authenticated SFTP sessions and classifies why a connection failed.
 *
 * Connecting runs in stages: resolve and open the TCP socket, run the SSH handshake,
 * authenticate, then start the SFTP channel. The failing stage decides the error kind reported
 * to the operator. None of these failures is retried.
 */

#ifndef CONNECTION_MANAGER_HPP
#define CONNECTION_MANAGER_HPP

#include "credential.hpp"
#include "errors.hpp"
#include "transfer_session.hpp"
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>

/**
 * @brief Stage of the connection sequence.
 */
enum class ConnectStage {
    Resolve,      ///< Name resolution and TCP connect.
    Handshake,    ///< SSH protocol negotiation.
    Authenticate, ///< User authentication.
    Channel       ///< SFTP subsystem start-up.
};

/**
 * @brief Builds the operator-facing error for a failure at @p stage.
 *
 * Resolve maps to HostUnreachable, Authenticate to AuthenticationFailed, and Handshake and
 * Channel to ProtocolOrHostError.
 *
 * @param stage Stage that failed.
 * @param detail Diagnostic text from the transport, appended to the message.
 */
WriterError classifyConnectFailure(ConnectStage stage, const std::string& detail);

/**
 * @brief Authentication methods available for one login, as callables returning SSH_AUTH_* codes.
 *
 * An empty callable means the method is not configured.
 */
struct AuthMethods {
    std::function<int()> publicKey; ///< Offers the private key.
    std::function<int()> password;  ///< Sends the password.
    std::string keyLabel = "Private"; ///< Algorithm name used in the fallback warning.
};

/**
 * @brief Runs authentication, preferring the key over the password.
 *
 * A key that is denied or only partially accepted falls back to the password when one is
 * configured. A transport error (SSH_AUTH_ERROR) ends the attempt immediately.
 *
 * @return SSH_AUTH_SUCCESS, or the code of the last method tried; SSH_AUTH_DENIED when no
 *         method is configured.
 */
int authenticateWith(const AuthMethods& methods);

/**
 * @brief Maps an authentication result code to the failing stage.
 *
 * SSH_AUTH_ERROR is a transport failure and maps to Handshake; any other non-success code
 * means the server rejected the credentials and maps to Authenticate.
 *
 * @return std::nullopt on SSH_AUTH_SUCCESS.
 */
std::optional<ConnectStage> authFailureStage(int rc);

/**
 * @brief Connection endpoint and login name.
 */
struct ConnectionParams {
    std::string host; ///< Host name or address.
    int port = 22;    ///< TCP port.
    std::string user; ///< Login name.
};

/**
 * @brief Factory for authenticated SFTP sessions.
 */
class ConnectionManager {
public:
    /**
     * @brief Opens a session to the remote host.
     *
     * Uses public-key authentication when the credential carries a key, and password
     * authentication otherwise. A denied key falls back to the password when one is set.
     *
     * @param params Host, port and user.
     * @param credential Password and optional private key.
     * @return An exclusively owned session, or HostUnreachable, ProtocolOrHostError or
     *         AuthenticationFailed.
     */
    std::expected<std::unique_ptr<TransferSession>, WriterError> connect(const ConnectionParams& params,
                                                                         const Credential& credential) const;
};

#endif // CONNECTION_MANAGER_HPP
