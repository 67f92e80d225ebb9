#ifndef PWV_CRYPTO_ERROR_HPP
#define PWV_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pwv::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

// Passphrase could not be turned into a key
class ConfigError : public CryptoError {
public:
    enum class Kind {
        Missing,
        Empty
    };

    ConfigError(Kind kind, const std::string& message)
        : CryptoError("Configuration error: " + message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message)
        : CryptoError("Encryption error: " + message) {}
};

class DecryptionError : public CryptoError {
public:
    enum class Kind {
        Malformed,
        AuthFailed,
        NotUtf8
    };

    DecryptionError(Kind kind, const std::string& message)
        : CryptoError("Decryption error: " + message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

// Stored payload is not "<b64 nonce>:<b64 ciphertext>"
class FormatError : public CryptoError {
public:
    explicit FormatError(const std::string& message)
        : CryptoError("Format error: " + message) {}
};

inline const char* to_string(DecryptionError::Kind kind) {
    switch (kind) {
        case DecryptionError::Kind::Malformed:  return "Malformed";
        case DecryptionError::Kind::AuthFailed: return "AuthFailed";
        case DecryptionError::Kind::NotUtf8:    return "NotUtf8";
        default:                                return "Unknown";
    }
}

inline const char* to_string(ConfigError::Kind kind) {
    switch (kind) {
        case ConfigError::Kind::Missing: return "Missing";
        case ConfigError::Kind::Empty:   return "Empty";
        default:                         return "Unknown";
    }
}

} // namespace pwv::crypto

#endif // PWV_CRYPTO_ERROR_HPP
