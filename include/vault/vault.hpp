#pragma once

#include <string>
#include <vector>
#include <stdexcept>
#include "store/store.hpp"
#include "crypto/cipher_engine.hpp"

namespace pwv {
namespace vault {

class VaultError : public std::runtime_error {
public:
  explicit VaultError(const std::string& message) : std::runtime_error(message) {}
};

// Rejected user input, e.g. an empty account name
class ValidationError : public VaultError {
public:
  explicit ValidationError(const std::string& message) : VaultError(message) {}
};

// Outcome of opening the vault at startup
struct OpenStatus {
  bool load_failed = false;
  bool migrated = false;
  bool save_failed = false;
  std::string message;
};

class Vault {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Vault(store::Store& store, const crypto::CipherEngine& cipher);


  // ---- STARTUP ----
  // Loads the backing file and rewrites it when plaintext entries were
  // migrated. Never throws for I/O problems; a failed load leaves the vault
  // empty and is reported in the returned status.
  OpenStatus open();


  // ---- COLLABORATOR OPERATIONS ----
  const std::vector<store::Entry>& list_entries() const { return entries_; }
  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  // Trims both values, encrypts the password, appends and saves.
  // Throws ValidationError, crypto::EncryptionError or store::StoreError.
  // After a StoreError the entry stays in memory; call save() to retry.
  void add_entry(const std::string& account, const std::string& password);
  // Rewrites the backing file from memory
  void save();
  // Throws VaultError for a bad index and crypto::DecryptionError when the
  // stored payload cannot be decrypted
  std::string reveal_password(std::size_t index) const;

private:
  // ---- PARAMETERS ----
  store::Store& store_;
  const crypto::CipherEngine& cipher_;
  std::vector<store::Entry> entries_;
};

} // namespace vault
} // namespace pwv
