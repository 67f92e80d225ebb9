#ifndef PWV_CRYPTO_PAYLOAD_CODEC_HPP
#define PWV_CRYPTO_PAYLOAD_CODEC_HPP

#include <array>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include "crypto_error.hpp"

namespace pwv::crypto {

static constexpr size_t NONCE_SIZE = 12;   // 96 bits for GCM
static constexpr size_t TAG_SIZE = 16;     // GCM authentication tag

using Nonce = std::array<uint8_t, NONCE_SIZE>;

// Legacy value stored without encryption
struct PlainField {
  std::string value;
};

// Value shaped like "<nonce>:<ciphertext>", not yet decoded
struct EncryptedField {
  std::string payload;
};

using PasswordField = std::variant<PlainField, EncryptedField>;

struct DecodedPayload {
  Nonce nonce;
  std::vector<uint8_t> ciphertext;  // includes trailing tag
};

class PayloadCodec {
public:
  static constexpr char SEPARATOR = ':';

  // ---- CLASSIFICATION ----
  // Encrypted iff raw has a separator with non-empty text on both sides of
  // the first one. Shape check only, nothing is decoded.
  static PasswordField classify(const std::string& raw);
  static bool is_encrypted(const std::string& raw);


  // ---- ENCODING AND DECODING ----
  // Produces "<base64 nonce>:<base64 ciphertext>"
  static std::string encode(const Nonce& nonce, const std::vector<uint8_t>& ciphertext);
  // Splits on the first separator and decodes both halves.
  // Throws FormatError on a missing separator, bad base64 or a nonce that is
  // not NONCE_SIZE bytes.
  static DecodedPayload decode(const std::string& payload);


  // ---- BASE64 ----
  static std::string base64_encode(const uint8_t* data, size_t length);
  // Strict standard alphabet with padding; throws FormatError
  static std::vector<uint8_t> base64_decode(const std::string& encoded);
};

} // namespace pwv::crypto

#endif // PWV_CRYPTO_PAYLOAD_CODEC_HPP
