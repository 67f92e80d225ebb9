#include "crypto/payload_codec.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace pwv::crypto {

namespace {

bool is_base64_char(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '+' || c == '/';
}

} // namespace

//==============================================
// CLASSIFICATION
//==============================================

bool PayloadCodec::is_encrypted(const std::string& raw) {
  auto sep = raw.find(SEPARATOR);
  if (sep == std::string::npos) {
    return false;
  }
  return sep > 0 && sep + 1 < raw.size();
}

PasswordField PayloadCodec::classify(const std::string& raw) {
  if (is_encrypted(raw)) {
    return EncryptedField{raw};
  }
  return PlainField{raw};
}


//==============================================
// ENCODING AND DECODING
//==============================================

std::string PayloadCodec::encode(const Nonce& nonce, const std::vector<uint8_t>& ciphertext) {
  BOOST_LOG_TRIVIAL(trace) << "Payload codec: Encoding nonce and " << ciphertext.size()
                           << " bytes of ciphertext";

  std::string encoded = base64_encode(nonce.data(), nonce.size());
  encoded += SEPARATOR;
  encoded += base64_encode(ciphertext.data(), ciphertext.size());
  return encoded;
}

DecodedPayload PayloadCodec::decode(const std::string& payload) {
  auto sep = payload.find(SEPARATOR);
  if (sep == std::string::npos) {
    BOOST_LOG_TRIVIAL(debug) << "Payload codec: Separator missing in payload";
    throw FormatError("payload has no separator");
  }

  std::vector<uint8_t> nonce_bytes = base64_decode(payload.substr(0, sep));
  if (nonce_bytes.size() != NONCE_SIZE) {
    BOOST_LOG_TRIVIAL(debug) << "Payload codec: Invalid nonce length: " << nonce_bytes.size()
                             << " bytes (expected " << NONCE_SIZE << " bytes)";
    throw FormatError("invalid nonce length");
  }

  DecodedPayload decoded;
  std::copy(nonce_bytes.begin(), nonce_bytes.end(), decoded.nonce.begin());
  decoded.ciphertext = base64_decode(payload.substr(sep + 1));
  return decoded;
}


//==============================================
// BASE64
//==============================================

std::string PayloadCodec::base64_encode(const uint8_t* data, size_t length) {
  if (length == 0) {
    return {};
  }

  // 4 output characters per 3 input bytes plus terminating NUL
  std::vector<unsigned char> out(4 * ((length + 2) / 3) + 1);
  int written = EVP_EncodeBlock(out.data(), data, static_cast<int>(length));
  return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(written));
}

std::vector<uint8_t> PayloadCodec::base64_decode(const std::string& encoded) {
  if (encoded.empty()) {
    return {};
  }

  if (encoded.size() % 4 != 0) {
    throw FormatError("invalid base64 length");
  }

  // EVP_DecodeBlock tolerates whitespace and keeps padding bytes in its
  // output, so the alphabet and padding are checked up front
  size_t padding = 0;
  for (size_t i = 0; i < encoded.size(); ++i) {
    char c = encoded[i];
    if (c == '=') {
      if (i < encoded.size() - 2) {
        throw FormatError("invalid base64 padding");
      }
      ++padding;
    } else if (padding > 0 || !is_base64_char(c)) {
      throw FormatError("invalid base64 character");
    }
  }

  std::vector<uint8_t> out(encoded.size() / 4 * 3);
  int decoded_len = EVP_DecodeBlock(out.data(),
                                    reinterpret_cast<const unsigned char*>(encoded.data()),
                                    static_cast<int>(encoded.size()));
  if (decoded_len < 0 || static_cast<size_t>(decoded_len) < padding) {
    throw FormatError("invalid base64 data");
  }

  out.resize(static_cast<size_t>(decoded_len) - padding);
  return out;
}

} // namespace pwv::crypto
