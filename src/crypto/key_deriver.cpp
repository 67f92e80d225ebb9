#include "crypto/key_deriver.hpp"
#include "utils/text.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace pwv::crypto {

//==============================================
// KEY DERIVATION
//==============================================

Key KeyDeriver::derive(const std::optional<std::string>& passphrase) {
  BOOST_LOG_TRIVIAL(info) << "Key deriver: Deriving key from passphrase";

  if (!passphrase) {
    BOOST_LOG_TRIVIAL(error) << "Key deriver: No passphrase available";
    throw ConfigError(ConfigError::Kind::Missing, "passphrase is not set");
  }

  if (utils::trim(*passphrase).empty()) {
    BOOST_LOG_TRIVIAL(error) << "Key deriver: Passphrase is empty";
    throw ConfigError(ConfigError::Kind::Empty, "passphrase must not be empty");
  }

  Key key{};
  unsigned int digest_len = 0;

  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw CryptoError("Key deriver: Failed to create hash context");
  }

  // Hash the untrimmed passphrase bytes
  if (!EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) ||
      !EVP_DigestUpdate(ctx, passphrase->data(), passphrase->size()) ||
      !EVP_DigestFinal_ex(ctx, key.data(), &digest_len)) {
    EVP_MD_CTX_free(ctx);
    throw CryptoError("Key deriver: Failed to hash passphrase");
  }

  EVP_MD_CTX_free(ctx);

  if (digest_len != KEY_SIZE) {
    throw CryptoError("Key deriver: Unexpected digest length");
  }

  BOOST_LOG_TRIVIAL(debug) << "Key deriver: Key derived successfully";
  return key;
}

} // namespace pwv::crypto
