#ifndef PWV_CRYPTO_CIPHER_ENGINE_HPP
#define PWV_CRYPTO_CIPHER_ENGINE_HPP

#include <memory>
#include <string>
#include <vector>
#include "crypto_error.hpp"
#include "key_deriver.hpp"
#include "payload_codec.hpp"

namespace pwv::crypto {

// Forward declaration for OpenSSL cipher context
struct CipherContext;

// AES-256-GCM over single password values. Each call to encrypt draws a new
// random nonce, so the engine itself keeps no per-message state.
class CipherEngine {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit CipherEngine(const Key& key);
  ~CipherEngine();

  CipherEngine(const CipherEngine&) = delete;
  CipherEngine& operator=(const CipherEngine&) = delete;


  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  // Returns the PayloadCodec encoding of (nonce, ciphertext||tag).
  // Throws EncryptionError if OpenSSL fails.
  std::string encrypt(const std::string& plaintext) const;
  // Throws DecryptionError: Malformed when the payload cannot be decoded,
  // AuthFailed when the tag does not verify, NotUtf8 for non UTF-8 plaintext.
  std::string decrypt(const std::string& payload) const;


  // ---- NONCE GENERATION ----
  Nonce generate_nonce() const;

private:
  // ---- PARAMETERS ----
  Key key_;
  std::unique_ptr<CipherContext> context_;


  // ---- AEAD OPERATIONS ----
  std::vector<uint8_t> seal(const Nonce& nonce, const std::string& plaintext) const;
  std::vector<uint8_t> open(const DecodedPayload& payload) const;
};

} // namespace pwv::crypto

#endif // PWV_CRYPTO_CIPHER_ENGINE_HPP
