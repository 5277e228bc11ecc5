/**
 * @file errors.hpp
 * @brief Error taxonomy shared by every stage of the SFTP writer.
 *
 * Failures travel as std::expected<T, WriterError>. Each WriterError carries the kind used to
 * choose the process exit code and a message that is shown to the operator verbatim.
 */

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <string>
#include <string_view>

/**
 * @brief Categories of failure the writer can report.
 *
 * Every kind except Unclassified is user-actionable and carries a remediation hint.
 */
enum class ErrorKind {
    InvalidConfiguration,   ///< Missing or malformed parameters, unreadable data directory.
    InvalidCredential,      ///< Private key text that no supported algorithm accepts.
    AuthenticationFailed,   ///< Credentials rejected by the server.
    ProtocolOrHostError,    ///< SSH handshake or SFTP negotiation failure.
    HostUnreachable,        ///< Name resolution or TCP connect failure.
    RemotePathNotFound,     ///< Remote destination directory does not exist.
    RemotePermissionDenied, ///< Remote destination is not writable.
    Unclassified            ///< Anything else; never expected in normal operation.
};

/**
 * @brief Error value carried through std::expected returns.
 */
struct WriterError {
    ErrorKind kind;      ///< Failure category.
    std::string message; ///< Operator-facing message including the remediation hint.
};

/**
 * @brief Returns a stable, human-readable name for an error kind.
 */
std::string_view errorKindName(ErrorKind kind) noexcept;

/**
 * @brief Tells whether the operator can act on the error.
 *
 * @return true for every kind except ErrorKind::Unclassified.
 */
bool isUserError(ErrorKind kind) noexcept;

/**
 * @brief Maps an error kind to the process exit code.
 *
 * @return 1 for user-actionable errors, 2 for unclassified failures.
 */
int exitCodeFor(ErrorKind kind) noexcept;

#endif // ERRORS_HPP
