#include "crypto/cipher_engine.hpp"
#include "utils/text.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>

namespace pwv::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  // Initialize new cipher context
  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw EncryptionError("Cipher engine: Failed to create cipher context");
    }
  }

  // Free cipher context when object is destroyed
  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  // Access the underlying context, reset for the next operation
  EVP_CIPHER_CTX* get() {
    EVP_CIPHER_CTX_reset(ctx);
    return ctx;
  }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CipherEngine::CipherEngine(const Key& key) : key_(key) {
  BOOST_LOG_TRIVIAL(info) << "Cipher engine: Initializing AES-256-GCM engine";
  context_ = std::make_unique<CipherContext>();
  BOOST_LOG_TRIVIAL(debug) << "Cipher engine: initialization complete";
}

CipherEngine::~CipherEngine() = default;

//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

std::string CipherEngine::encrypt(const std::string& plaintext) const {
  BOOST_LOG_TRIVIAL(debug) << "Cipher engine: Encrypting value of " << plaintext.size() << " bytes";

  Nonce nonce = generate_nonce();
  std::vector<uint8_t> ciphertext = seal(nonce, plaintext);

  return PayloadCodec::encode(nonce, ciphertext);
}

std::string CipherEngine::decrypt(const std::string& payload) const {
  BOOST_LOG_TRIVIAL(debug) << "Cipher engine: Decrypting payload of " << payload.size() << " bytes";

  DecodedPayload decoded;
  try {
    decoded = PayloadCodec::decode(payload);
  }
  catch (const FormatError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Cipher engine: Malformed payload: " << e.what();
    throw DecryptionError(DecryptionError::Kind::Malformed, e.what());
  }

  std::vector<uint8_t> plaintext = open(decoded);

  if (!utils::is_valid_utf8(plaintext)) {
    BOOST_LOG_TRIVIAL(warning) << "Cipher engine: Decrypted value is not valid UTF-8";
    throw DecryptionError(DecryptionError::Kind::NotUtf8, "decrypted password is not valid UTF-8");
  }

  return std::string(plaintext.begin(), plaintext.end());
}

//==============================================
// AEAD OPERATIONS
//==============================================

std::vector<uint8_t> CipherEngine::seal(const Nonce& nonce, const std::string& plaintext) const {
  EVP_CIPHER_CTX* ctx = context_->get();

  if (!EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr)) {
    throw EncryptionError("Cipher engine: Failed to initialize encryption context");
  }
  if (!EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr)) {
    throw EncryptionError("Cipher engine: Failed to set nonce length");
  }
  if (!EVP_EncryptInit_ex(ctx, nullptr, nullptr, key_.data(), nonce.data())) {
    throw EncryptionError("Cipher engine: Failed to set key and nonce");
  }

  std::vector<uint8_t> out(plaintext.size() + TAG_SIZE);
  int len = 0;
  int total = 0;

  if (!plaintext.empty()) {
    if (!EVP_EncryptUpdate(ctx, out.data(), &len,
                           reinterpret_cast<const uint8_t*>(plaintext.data()),
                           static_cast<int>(plaintext.size()))) {
      throw EncryptionError("Cipher engine: Failed to encrypt data");
    }
    total = len;
  }

  if (!EVP_EncryptFinal_ex(ctx, out.data() + total, &len)) {
    throw EncryptionError("Cipher engine: Failed to finalize encryption");
  }
  total += len;

  // Tag goes right after the ciphertext
  if (!EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE), out.data() + total)) {
    throw EncryptionError("Cipher engine: Failed to read authentication tag");
  }

  out.resize(static_cast<size_t>(total) + TAG_SIZE);
  return out;
}

std::vector<uint8_t> CipherEngine::open(const DecodedPayload& payload) const {
  if (payload.ciphertext.size() < TAG_SIZE) {
    BOOST_LOG_TRIVIAL(warning) << "Cipher engine: Ciphertext shorter than authentication tag";
    throw DecryptionError(DecryptionError::Kind::AuthFailed, "failed to decrypt password");
  }

  const size_t body_len = payload.ciphertext.size() - TAG_SIZE;
  std::vector<uint8_t> tag(payload.ciphertext.end() - TAG_SIZE, payload.ciphertext.end());

  EVP_CIPHER_CTX* ctx = context_->get();

  if (!EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) ||
      !EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) ||
      !EVP_DecryptInit_ex(ctx, nullptr, nullptr, key_.data(), payload.nonce.data())) {
    throw DecryptionError(DecryptionError::Kind::AuthFailed, "failed to initialize decryption context");
  }

  std::vector<uint8_t> out(body_len + TAG_SIZE);
  int len = 0;
  int total = 0;

  if (body_len > 0) {
    if (!EVP_DecryptUpdate(ctx, out.data(), &len, payload.ciphertext.data(), static_cast<int>(body_len))) {
      throw DecryptionError(DecryptionError::Kind::AuthFailed, "failed to decrypt password");
    }
    total = len;
  }

  if (!EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE), tag.data())) {
    throw DecryptionError(DecryptionError::Kind::AuthFailed, "failed to set authentication tag");
  }

  // Tag verification happens here; out is discarded on failure
  if (EVP_DecryptFinal_ex(ctx, out.data() + total, &len) <= 0) {
    BOOST_LOG_TRIVIAL(warning) << "Cipher engine: Authentication tag mismatch";
    throw DecryptionError(DecryptionError::Kind::AuthFailed, "failed to decrypt password");
  }
  total += len;

  out.resize(static_cast<size_t>(total));
  return out;
}

//==============================================
// NONCE GENERATION
//==============================================

Nonce CipherEngine::generate_nonce() const {
  BOOST_LOG_TRIVIAL(trace) << "Cipher engine: Generating nonce";

  Nonce nonce;
  if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
    throw EncryptionError("Cipher engine: Failed to generate random nonce");
  }
  return nonce;
}

} // namespace pwv::crypto
