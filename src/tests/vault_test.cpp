#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <memory>
#include "vault/vault.hpp"
#include "crypto/key_deriver.hpp"
#include "test_utils.hpp"

using namespace pwv::vault;
using pwv::crypto::CipherEngine;
using pwv::crypto::DecryptionError;
using pwv::crypto::KeyDeriver;
using pwv::store::Store;
using pwv::store::StoreError;
using ::testing::MatchesRegex;

class VaultTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::filesystem::path file_path;
  std::unique_ptr<CipherEngine> cipher;
  std::unique_ptr<Store> store;
  std::unique_ptr<Vault> vault;

  void SetUp() override {
    quiet_logging();
    test_dir = make_test_dir("vault_test");
    file_path = test_dir / "passwords.txt";
    cipher = std::make_unique<CipherEngine>(KeyDeriver::derive(std::string("correct-horse")));
    store = std::make_unique<Store>(file_path, *cipher);
    vault = std::make_unique<Vault>(*store, *cipher);
  }

  void TearDown() override {
    vault.reset();
    store.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }
};

// Added entries are stored encrypted and can be revealed
TEST_F(VaultTest, AddAndReveal) {
  ASSERT_FALSE(vault->open().load_failed);
  ASSERT_NO_THROW(vault->add_entry("gmail", "s3cr3t"));

  EXPECT_THAT(read_file(file_path), MatchesRegex("gmail,[A-Za-z0-9+/=]+:[A-Za-z0-9+/=]+\n"));
  ASSERT_EQ(vault->size(), 1u);
  EXPECT_EQ(vault->list_entries()[0].account, "gmail");
  EXPECT_NE(vault->list_entries()[0].password, "s3cr3t");
  EXPECT_EQ(vault->reveal_password(0), "s3cr3t");
}

// Inputs are trimmed before validation and storage
TEST_F(VaultTest, AddTrimsInput) {
  vault->open();
  vault->add_entry("  bank \t", "\xC2\xA0hunter2\xE3\x80\x80");

  EXPECT_EQ(vault->list_entries()[0].account, "bank");
  EXPECT_EQ(vault->reveal_password(0), "hunter2");
}

TEST_F(VaultTest, AddRejectsEmptyValues) {
  vault->open();

  EXPECT_THROW(vault->add_entry("", "pw"), ValidationError);
  EXPECT_THROW(vault->add_entry("acct", ""), ValidationError);
  EXPECT_THROW(vault->add_entry("   ", "pw"), ValidationError);
  EXPECT_THROW(vault->add_entry("acct", " \t "), ValidationError);
  EXPECT_THROW(vault->add_entry("\xC2\xA0", "pw"), ValidationError);
  EXPECT_THROW(vault->add_entry("acct", "\xE3\x80\x80"), ValidationError);

  EXPECT_TRUE(vault->empty());
  EXPECT_FALSE(std::filesystem::exists(file_path)) << "Nothing should be written on rejected input";
}

// Entries keep insertion order and duplicates are allowed
TEST_F(VaultTest, EntriesKeepOrder) {
  vault->open();
  vault->add_entry("a", "1");
  vault->add_entry("b", "2");
  vault->add_entry("a", "3");

  ASSERT_EQ(vault->size(), 3u);
  EXPECT_EQ(vault->list_entries()[2].account, "a");
  EXPECT_EQ(vault->reveal_password(2), "3");
  EXPECT_EQ(vault->reveal_password(0), "1");
}

// Opening a legacy file migrates and rewrites it
TEST_F(VaultTest, OpenMigratesLegacyFile) {
  write_file(file_path, "old,plainpass\n");

  OpenStatus status = vault->open();
  EXPECT_TRUE(status.migrated);
  EXPECT_FALSE(status.load_failed);
  EXPECT_FALSE(status.save_failed);
  EXPECT_EQ(vault->reveal_password(0), "plainpass");

  // File now holds the encrypted form
  EXPECT_EQ(read_file(file_path).find("plainpass"), std::string::npos);

  Vault reopened(*store, *cipher);
  OpenStatus second = reopened.open();
  EXPECT_FALSE(second.migrated);
  EXPECT_EQ(reopened.reveal_password(0), "plainpass");
}

// Free text without a colon is treated as legacy
TEST_F(VaultTest, FreeTextIsMigrated) {
  write_file(file_path, "old,justtext\n");

  OpenStatus status = vault->open();
  EXPECT_TRUE(status.migrated);
  EXPECT_EQ(vault->reveal_password(0), "justtext");
}

TEST_F(VaultTest, RevealWithWrongPassphrase) {
  vault->open();
  vault->add_entry("gmail", "s3cr3t");

  CipherEngine other(KeyDeriver::derive(std::string("wrong-passphrase")));
  Vault foreign(*store, other);
  foreign.open();

  try {
    foreign.reveal_password(0);
    FAIL() << "Expected DecryptionError";
  } catch (const DecryptionError& e) {
    EXPECT_EQ(e.kind(), DecryptionError::Kind::AuthFailed);
  }

  // Failed reveal leaves the entry in place
  EXPECT_EQ(foreign.size(), 1u);
}

TEST_F(VaultTest, RevealMalformedEntry) {
  write_file(file_path, "weird,user:pass\n");
  vault->open();

  try {
    vault->reveal_password(0);
    FAIL() << "Expected DecryptionError";
  } catch (const DecryptionError& e) {
    EXPECT_EQ(e.kind(), DecryptionError::Kind::Malformed);
  }
  EXPECT_EQ(vault->size(), 1u);
}

TEST_F(VaultTest, RevealOutOfRange) {
  vault->open();
  EXPECT_THROW(vault->reveal_password(0), VaultError);

  vault->add_entry("gmail", "s3cr3t");
  EXPECT_THROW(vault->reveal_password(1), VaultError);
}

// Load failures leave an empty vault instead of throwing
TEST_F(VaultTest, OpenFallsBackOnLoadError) {
  std::filesystem::create_directories(file_path);

  OpenStatus status;
  ASSERT_NO_THROW(status = vault->open());
  EXPECT_TRUE(status.load_failed);
  EXPECT_FALSE(status.message.empty());
  EXPECT_TRUE(vault->empty());
}

// A file with invalid UTF-8 is reported and left as it was on disk
TEST_F(VaultTest, OpenRejectsNonUtf8File) {
  const std::string original = "old,pl\xFF" "ain\n";
  write_file(file_path, original);

  OpenStatus status = vault->open();
  EXPECT_TRUE(status.load_failed);
  EXPECT_FALSE(status.migrated);
  EXPECT_NE(status.message.find("not valid UTF-8"), std::string::npos);
  EXPECT_TRUE(vault->empty());
  EXPECT_EQ(read_file(file_path), original);
}

// Save failure keeps the new entry so the caller can retry
TEST_F(VaultTest, SaveFailureKeepsEntry) {
  vault->open();
  std::filesystem::create_directories(file_path);

  EXPECT_THROW(vault->add_entry("gmail", "s3cr3t"), StoreError);
  ASSERT_EQ(vault->size(), 1u);
  EXPECT_EQ(vault->reveal_password(0), "s3cr3t");

  // Retry after the path is fixed
  std::filesystem::remove_all(file_path);
  ASSERT_NO_THROW(vault->save());

  Vault reopened(*store, *cipher);
  reopened.open();
  ASSERT_EQ(reopened.size(), 1u);
  EXPECT_EQ(reopened.reveal_password(0), "s3cr3t");
}
