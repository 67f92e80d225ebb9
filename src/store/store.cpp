#include "store/store.hpp"
#include "utils/text.hpp"
#include <fstream>
#include <variant>
#include <boost/log/trivial.hpp>

namespace pwv {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Store::Store(const std::filesystem::path& file_path, const crypto::CipherEngine& cipher)
  : file_path_(file_path)
  , cipher_(cipher) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing Store with file: " << file_path_.string();
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

LoadResult Store::load() const {
  BOOST_LOG_TRIVIAL(info) << "Store: Loading entries from: " << file_path_.string();

  LoadResult result;

  std::error_code ec;
  bool found = std::filesystem::exists(file_path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to check file: " << ec.message();
    throw StoreError("Store: Failed to access file: " + file_path_.string() + ": " + ec.message());
  }
  if (!found) {
    BOOST_LOG_TRIVIAL(info) << "Store: No file at " << file_path_.string() << ", starting empty";
    return result;
  }

  if (std::filesystem::is_directory(file_path_, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Path is a directory: " << file_path_.string();
    throw StoreError("Store: Path is a directory: " + file_path_.string());
  }

  std::ifstream file(file_path_, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to open file: " << file_path_.string();
    throw StoreError("Store: Failed to open file: " + file_path_.string());
  }

  std::string line;
  size_t line_number = 0;
  size_t migrated_count = 0;

  while (std::getline(file, line)) {
    ++line_number;

    // Accept CRLF line endings
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    // A single bad line fails the whole load, before anything is migrated
    if (!utils::is_valid_utf8(line)) {
      BOOST_LOG_TRIVIAL(error) << "Store: Line " << line_number << " is not valid UTF-8";
      throw StoreError("Store: File is not valid UTF-8: " + file_path_.string() +
                       " (line " + std::to_string(line_number) + ")");
    }

    std::string account;
    std::string raw_password;
    if (!split_line(line, account, raw_password)) {
      BOOST_LOG_TRIVIAL(debug) << "Store: Skipping line " << line_number << " without separator";
      continue;
    }

    crypto::PasswordField field = crypto::PayloadCodec::classify(raw_password);

    if (auto* encrypted = std::get_if<crypto::EncryptedField>(&field)) {
      result.entries.push_back(Entry{account, encrypted->payload});
    } else {
      // Legacy plaintext, encrypt before it reaches memory
      const auto& plain = std::get<crypto::PlainField>(field);
      try {
        result.entries.push_back(Entry{account, cipher_.encrypt(plain.value)});
      }
      catch (const crypto::EncryptionError& e) {
        BOOST_LOG_TRIVIAL(error) << "Store: Failed to migrate entry on line " << line_number << ": " << e.what();
        throw StoreError("Store: Failed to migrate entry: " + std::string(e.what()));
      }
      result.migrated = true;
      ++migrated_count;
    }
  }

  // getline stops on eof; anything else is a read failure
  if (file.bad() || (file.fail() && !file.eof())) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed while reading file: " << file_path_.string();
    throw StoreError("Store: Failed to read file: " + file_path_.string());
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Loaded " << result.entries.size() << " entries ("
                          << migrated_count << " migrated from plaintext)";
  return result;
}

void Store::save(const std::vector<Entry>& entries) const {
  BOOST_LOG_TRIVIAL(info) << "Store: Saving " << entries.size() << " entries to: " << file_path_.string();

  // Whole file is rewritten in place
  std::ofstream file(file_path_, std::ios::binary | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to create file: " << file_path_.string();
    throw StoreError("Store: Failed to create file: " + file_path_.string());
  }

  for (const auto& entry : entries) {
    file << entry.account << FIELD_SEPARATOR << entry.password << '\n';
  }

  file.flush();
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to write data to file: " << file_path_.string();
    throw StoreError("Store: Failed to write data to file: " + file_path_.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Save complete";
}


//==============================================
// LINE PARSING
//==============================================

bool Store::split_line(const std::string& line, std::string& account, std::string& raw_password) {
  auto sep = line.find(FIELD_SEPARATOR);
  if (sep == std::string::npos) {
    return false;
  }
  account = line.substr(0, sep);
  raw_password = line.substr(sep + 1);
  return true;
}

} // namespace store
} // namespace pwv
