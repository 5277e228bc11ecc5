/**
 * @file key_parser.hpp
 * @brief Parses private key text into a typed credential.
 *
 * The key text is tried against a fixed, ordered list of algorithms (RSA, DSA, ECDSA, Ed25519).
 * The first algorithm that decodes the key wins; each failure is logged as a warning and the
 * next algorithm is tried.
 */

#ifndef KEY_PARSER_HPP
#define KEY_PARSER_HPP

#include "credential.hpp"
#include "errors.hpp"
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Key material decoded once, before the algorithm chain is walked.
 */
struct ImportedKey {
    enum ssh_keytypes_e sshType = SSH_KEYTYPE_UNKNOWN; ///< Type reported by the decoder.
    ssh_key handle = nullptr;                          ///< Owned until claimed by a PrivateKey.
};

/**
 * @brief Ordered private key decoder with algorithm fallback.
 */
class KeyParser {
public:
    /**
     * @brief Decodes key text, or returns the reason it could not.
     */
    using Importer = std::function<std::expected<ImportedKey, std::string>(const std::string& keyText,
                                                                           const std::string& passphrase)>;

    /**
     * @brief One entry of the fallback chain.
     */
    struct Candidate {
        KeyType type;                                  ///< Algorithm tried by this entry.
        std::function<bool(enum ssh_keytypes_e)> accepts; ///< True when the decoded type is this algorithm.
    };

    /**
     * @brief Constructs a parser using libssh in RSA, DSA, ECDSA, Ed25519 order.
     */
    KeyParser();

    /**
     * @brief Constructs a parser with an explicit decoder and fallback chain.
     *
     * @param importer Decoder, called once per parse.
     * @param candidates Algorithms, tried front to back.
     */
    KeyParser(Importer importer, std::vector<Candidate> candidates);

    /**
     * @brief Parses private key text.
     *
     * The text is decoded once; the chain then decides which algorithm the key is tagged with.
     *
     * @param keyText PEM or OpenSSH private key text; empty means "no key".
     * @param passphrase Passphrase for encrypted keys; ignored by unencrypted ones.
     * @return std::nullopt for empty input, the decoded key, or ErrorKind::InvalidCredential
     *         when every algorithm rejected the text.
     */
    std::expected<std::optional<PrivateKey>, WriterError> parse(const std::string& keyText,
                                                                const std::string& passphrase = {}) const;

    /**
     * @brief Returns the default fallback chain.
     */
    static std::vector<Candidate> defaultCandidates();

    /**
     * @brief Decodes key text with ssh_pki_import_privkey_base64.
     */
    static std::expected<ImportedKey, std::string> libsshImport(const std::string& keyText,
                                                                const std::string& passphrase);

private:
    Importer importer_;
    std::vector<Candidate> candidates_;
};

#endif // KEY_PARSER_HPP
