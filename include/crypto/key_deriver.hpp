#ifndef PWV_CRYPTO_KEY_DERIVER_HPP
#define PWV_CRYPTO_KEY_DERIVER_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include "crypto_error.hpp"

namespace pwv::crypto {

static constexpr size_t KEY_SIZE = 32;     // 256 bits for AES-256

using Key = std::array<uint8_t, KEY_SIZE>;

class KeyDeriver {
public:
  // Hashes the passphrase with SHA-256. No salt and no iterations, so the same
  // passphrase always yields the same key.
  // Throws ConfigError(Missing) for std::nullopt and ConfigError(Empty) for a
  // passphrase that is only whitespace.
  static Key derive(const std::optional<std::string>& passphrase);
};

} // namespace pwv::crypto

#endif // PWV_CRYPTO_KEY_DERIVER_HPP
