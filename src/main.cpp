#include "cli/cli.hpp"
#include "config/config.hpp"
#include "crypto/cipher_engine.hpp"
#include "crypto/key_deriver.hpp"
#include "logger/logger.hpp"
#include "store/store.hpp"
#include "vault/vault.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <boost/log/trivial.hpp>

namespace {

std::optional<pwv::crypto::Key> derive_key(const pwv::config::ProgramOptions& options) {
  try {
    pwv::config::load_env_file(options.env_file);
  } catch (const pwv::config::ConfigFileError& e) {
    // A broken .env file is not fatal while the variable may still be set
    std::cerr << "Warning: " << e.what() << '\n';
  }

  try {
    return pwv::crypto::KeyDeriver::derive(pwv::config::read_passphrase());
  } catch (const pwv::crypto::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n'
              << "Set " << pwv::config::PASSPHRASE_VARIABLE
              << " in the environment or in " << options.env_file << '\n';
    return std::nullopt;
  } catch (const pwv::crypto::CryptoError& e) {
    std::cerr << "Error: Failed to initialize cipher: " << e.what() << '\n';
    return std::nullopt;
  }
}

bool run_vault(const pwv::config::ProgramOptions& options) {
  auto key = derive_key(options);
  if (!key) {
    return false;
  }

  try {
    pwv::crypto::CipherEngine cipher(*key);
    pwv::store::Store store(options.data_file, cipher);
    pwv::vault::Vault vault(store, cipher);

    auto status = vault.open();
    if (!status.message.empty()) {
      std::cerr << status.message << '\n';
    }

    pwv::cli::CLI cli(vault);
    cli.run();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Unexpected error: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
}

} // namespace

int main(int argc, char* argv[]) {
  const auto options = pwv::config::parse_command_line(argc, argv, std::cerr);
  if (!options.valid) {
    return 1;
  }
  if (options.show_help) {
    pwv::config::print_usage(argv[0], std::cout);
    return 0;
  }

  try {
    pwv::logging::init_logging(options.log_file);
  } catch (const std::exception&) {
    // init_logging already reported the failure
    return 1;
  }

  return run_vault(options) ? 0 : 1;
}
