#pragma once

#include <string>
#include <filesystem>
#include <vector>
#include <stdexcept>
#include "crypto/cipher_engine.hpp"

namespace pwv {
namespace store {

// One stored credential. password always holds an encoded encrypted payload
// once the entry is in memory.
struct Entry {
  std::string account;
  std::string password;
};

struct LoadResult {
  std::vector<Entry> entries;
  // true when at least one legacy plaintext password was encrypted
  bool migrated = false;
};

class Store {
public:
  static constexpr char FIELD_SEPARATOR = ',';

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Store(const std::filesystem::path& file_path, const crypto::CipherEngine& cipher);


  // ---- CORE STORAGE OPERATIONS ----
  // Reads every "account,password" line. Legacy plaintext passwords are
  // encrypted on the way in. A missing file gives an empty result.
  // Throws StoreError on read failure or when the file is not valid UTF-8.
  LoadResult load() const;
  // Truncates the backing file and writes every entry
  void save(const std::vector<Entry>& entries) const;


  // ---- QUERY OPERATIONS ----
  const std::filesystem::path& path() const { return file_path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path file_path_;
  const crypto::CipherEngine& cipher_;


  // ---- LINE PARSING ----
  // Splits on the first separator. Returns false when there is none.
  static bool split_line(const std::string& line, std::string& account, std::string& raw_password);
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace store
} // namespace pwv
