#include "credential.hpp"

const char* keyTypeName(KeyType type) noexcept {
    switch (type) {
    case KeyType::Rsa:
        return "RSA";
    case KeyType::Dsa:
        return "DSA";
    case KeyType::Ecdsa:
        return "ECDSA";
    case KeyType::Ed25519:
        return "Ed25519";
    }
    return "unknown";
}

PrivateKey::PrivateKey(KeyType type, ssh_key key)
    : type_(type), key_(key) {}
