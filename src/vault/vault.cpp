#include "vault/vault.hpp"
#include "utils/text.hpp"
#include <boost/log/trivial.hpp>

namespace pwv {
namespace vault {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Vault::Vault(store::Store& store, const crypto::CipherEngine& cipher)
  : store_(store)
  , cipher_(cipher) {
  BOOST_LOG_TRIVIAL(info) << "Vault: Vault created for file: " << store_.path().string();
}


//==============================================
// STARTUP
//==============================================

OpenStatus Vault::open() {
  BOOST_LOG_TRIVIAL(info) << "Vault: Opening vault";

  OpenStatus status;
  store::LoadResult loaded;

  try {
    loaded = store_.load();
  }
  catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Vault: Failed to load entries: " << e.what();
    entries_.clear();
    status.load_failed = true;
    status.message = std::string("Error loading entries: ") + e.what();
    return status;
  }

  entries_ = std::move(loaded.entries);
  status.migrated = loaded.migrated;

  // Bring the file to its encrypted fixed point right away
  if (status.migrated) {
    BOOST_LOG_TRIVIAL(info) << "Vault: Plaintext entries migrated, rewriting file";
    try {
      store_.save(entries_);
    }
    catch (const store::StoreError& e) {
      BOOST_LOG_TRIVIAL(error) << "Vault: Failed to save migrated entries: " << e.what();
      status.save_failed = true;
      status.message = std::string("Error saving re-encrypted entries: ") + e.what();
      return status;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Vault: Opened with " << entries_.size() << " entries";
  return status;
}


//==============================================
// COLLABORATOR OPERATIONS
//==============================================

void Vault::add_entry(const std::string& account, const std::string& password) {
  std::string trimmed_account = utils::trim(account);
  std::string trimmed_password = utils::trim(password);

  if (trimmed_account.empty() || trimmed_password.empty()) {
    BOOST_LOG_TRIVIAL(warning) << "Vault: Rejected entry with empty account or password";
    throw ValidationError("Account or password must not be empty.");
  }

  BOOST_LOG_TRIVIAL(info) << "Vault: Adding entry for account: " << trimmed_account;

  // Encrypt first so a cipher failure leaves the list untouched
  std::string encrypted = cipher_.encrypt(trimmed_password);
  entries_.push_back(store::Entry{trimmed_account, std::move(encrypted)});

  save();
}

void Vault::save() {
  store_.save(entries_);
}

std::string Vault::reveal_password(std::size_t index) const {
  if (index >= entries_.size()) {
    BOOST_LOG_TRIVIAL(warning) << "Vault: No entry at index " << index;
    throw VaultError("No entry at index " + std::to_string(index));
  }

  const auto& entry = entries_[index];
  BOOST_LOG_TRIVIAL(debug) << "Vault: Revealing password for account: " << entry.account;
  return cipher_.decrypt(entry.password);
}

} // namespace vault
} // namespace pwv
