#include "key_parser.hpp"
#include "logger.hpp"
#include <format>
#include <memory>
#include <type_traits>

namespace {

struct ImportedKeyDeleter {
    void operator()(ssh_key key) const noexcept { ssh_key_free(key); }
};

using ImportedKeyPtr = std::unique_ptr<std::remove_pointer_t<ssh_key>, ImportedKeyDeleter>;

bool matchesType(enum ssh_keytypes_e actual, KeyType wanted) {
    switch (wanted) {
    case KeyType::Rsa:
        return actual == SSH_KEYTYPE_RSA;
    case KeyType::Dsa:
        return actual == SSH_KEYTYPE_DSS;
    case KeyType::Ecdsa:
        return actual == SSH_KEYTYPE_ECDSA_P256 || actual == SSH_KEYTYPE_ECDSA_P384 ||
               actual == SSH_KEYTYPE_ECDSA_P521;
    case KeyType::Ed25519:
        return actual == SSH_KEYTYPE_ED25519;
    }
    return false;
}

std::string typeDescription(enum ssh_keytypes_e type) {
    const char* name = ssh_key_type_to_char(type);
    return std::format("key is of type {}", name ? name : "unknown");
}

} // namespace

KeyParser::KeyParser() : KeyParser(&KeyParser::libsshImport, defaultCandidates()) {}

KeyParser::KeyParser(Importer importer, std::vector<Candidate> candidates)
    : importer_(std::move(importer)), candidates_(std::move(candidates)) {}

std::vector<KeyParser::Candidate> KeyParser::defaultCandidates() {
    std::vector<Candidate> candidates;
    for (KeyType type : {KeyType::Rsa, KeyType::Dsa, KeyType::Ecdsa, KeyType::Ed25519}) {
        candidates.push_back({type, [type](enum ssh_keytypes_e actual) { return matchesType(actual, type); }});
    }
    return candidates;
}

std::expected<ImportedKey, std::string> KeyParser::libsshImport(const std::string& keyText,
                                                                const std::string& passphrase) {
    ssh_key key = nullptr;
    int rc = ssh_pki_import_privkey_base64(keyText.c_str(), passphrase.empty() ? nullptr : passphrase.c_str(),
                                           nullptr, nullptr, &key);
    if (rc != SSH_OK || key == nullptr) {
        return std::unexpected("not a readable private key");
    }
    return ImportedKey{ssh_key_type(key), key};
}

std::expected<std::optional<PrivateKey>, WriterError> KeyParser::parse(const std::string& keyText,
                                                                       const std::string& passphrase) const {
    if (keyText.empty()) {
        return std::optional<PrivateKey>{};
    }

    auto imported = importer_(keyText, passphrase);
    ImportedKeyPtr handle(imported ? imported->handle : nullptr);
    const std::string reason = imported ? typeDescription(imported->sshType) : imported.error();

    for (std::size_t i = 0; i < candidates_.size(); ++i) {
        const auto& candidate = candidates_[i];
        if (imported && candidate.accepts(imported->sshType)) {
            Logger::debug("Private key parsed as {}", keyTypeName(candidate.type));
            return std::optional<PrivateKey>(PrivateKey(candidate.type, handle.release()));
        }

        if (i + 1 < candidates_.size()) {
            Logger::warning("{} private key invalid ({}), trying {}.", keyTypeName(candidate.type), reason,
                            keyTypeName(candidates_[i + 1].type));
        } else {
            Logger::warning("{} private key invalid ({}).", keyTypeName(candidate.type), reason);
        }
    }

    Logger::error("Private key is invalid");
    return std::unexpected(WriterError{ErrorKind::InvalidCredential, "Failed to parse private key"});
}
