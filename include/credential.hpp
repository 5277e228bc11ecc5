/**
 * @file credential.hpp
 * @brief Authentication material handed to the connection manager.
 *
 * A credential is the configured password plus an optional private key. The key owns its
 * libssh handle and is tagged with the algorithm that decoded it.
 */

#ifndef CREDENTIAL_HPP
#define CREDENTIAL_HPP

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <libssh/libssh.h>

/**
 * @brief Private key algorithms the writer accepts, in fallback order.
 */
enum class KeyType {
    Rsa,
    Dsa,
    Ecdsa,
    Ed25519
};

/**
 * @brief Returns the display name of a key algorithm ("RSA", "DSA", "ECDSA", "Ed25519").
 */
const char* keyTypeName(KeyType type) noexcept;

/**
 * @brief Move-only owner of a parsed private key.
 */
class PrivateKey {
public:
    /**
     * @brief Takes ownership of a libssh key handle.
     *
     * @param type Algorithm the key was decoded as.
     * @param key libssh key handle; may be null for keys that never reach a live session.
     */
    PrivateKey(KeyType type, ssh_key key);

    KeyType type() const noexcept { return type_; }

    /**
     * @brief Returns the libssh handle without releasing ownership.
     */
    ssh_key handle() const noexcept { return key_.get(); }

private:
    struct KeyDeleter {
        void operator()(ssh_key key) const noexcept { ssh_key_free(key); }
    };

    KeyType type_;
    std::unique_ptr<std::remove_pointer_t<ssh_key>, KeyDeleter> key_;
};

/**
 * @brief Authentication material for one connection.
 *
 * When a key is present it is preferred; the password is still passed along as the
 * fallback secret for servers that deny the key.
 */
struct Credential {
    std::string password;           ///< Plaintext password, possibly empty.
    std::optional<PrivateKey> key;  ///< Parsed private key, if one was configured.
};

#endif // CREDENTIAL_HPP
