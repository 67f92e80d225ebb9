#include "cli/cli.hpp"
#include <algorithm>
#include <sstream>
#include <cctype>
#include <boost/log/trivial.hpp>

namespace pwv {
namespace cli {

std::string mask_password(const std::string& encoded_password) {
  return std::string(std::clamp<std::size_t>(encoded_password.size(), 1, 32), '*');
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(vault::Vault& vault, std::istream& in, std::ostream& out)
  : running_(false)
  , vault_(vault)
  , in_(in)
  , out_(out)
  , selected_(0) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "Password Manager - " << vault_.size() << " entries. Type 'help' for commands." << std::endl;
  out_ << "pwvault> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    std::istringstream iss(line);
    std::string command, argument;

    iss >> command;
    iss >> argument;

    if (command == "quit" || command == "q") {
      running_ = false;
      continue;
    }

    if (!command.empty()) {
      process_command(command, argument);
    }

    if (running_) {
      out_ << "pwvault> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::string& argument) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command;

  if (command == "help") {
    handle_help_command();
  }
  else if (command == "list" || command == "ls") {
    handle_list_command();
  }
  else if (command == "next") {
    next();
    handle_show_command("");
  }
  else if (command == "prev") {
    previous();
    handle_show_command("");
  }
  else if (command == "select") {
    handle_select_command(argument);
  }
  else if (command == "show") {
    handle_show_command(argument);
  }
  else if (command == "reveal" || command == "v") {
    handle_reveal_command(argument);
  }
  else if (command == "add" || command == "a") {
    handle_add_command();
  }
  else if (command == "save") {
    handle_save_command();
  }
  else {
    feedback(FeedbackKind::Error, "Unknown command. Type 'help' for a list of commands.");
  }
}

void CLI::handle_list_command() {
  out_ << "Total entries: " << vault_.size() << std::endl;

  if (vault_.empty()) {
    out_ << "No entries yet. Use 'add' to create one." << std::endl;
    return;
  }

  const auto& entries = vault_.list_entries();
  for (std::size_t i = 0; i < entries.size(); ++i) {
    out_ << (i == selected_ ? ">> " : "   ") << (i + 1) << ". " << entries[i].account << std::endl;
  }
}

void CLI::handle_add_command() {
  std::string account;
  std::string password;

  if (!prompt_line("Account: ", account) || !prompt_line("Password: ", password)) {
    feedback(FeedbackKind::Info, "Add cancelled.");
    return;
  }

  try {
    vault_.add_entry(account, password);
    selected_ = vault_.size() - 1;
    feedback(FeedbackKind::Success, "Entry added and password encrypted.");
  }
  catch (const vault::ValidationError& e) {
    feedback(FeedbackKind::Error, e.what());
  }
  catch (const store::StoreError& e) {
    // Entry is kept in memory, 'save' retries
    selected_ = vault_.size() - 1;
    log_and_display_error("Error saving entry", e.what());
  }
  catch (const crypto::EncryptionError& e) {
    log_and_display_error("Error encrypting password", e.what());
  }
}

void CLI::handle_show_command(const std::string& argument) {
  std::size_t index = 0;
  if (!resolve_index(argument, index)) {
    return;
  }

  const auto& entry = vault_.list_entries()[index];
  out_ << "Account: " << entry.account << std::endl;
  out_ << "Encrypted password (hidden): " << mask_password(entry.password) << std::endl;
  out_ << "Use 'reveal' to show the real password." << std::endl;
}

void CLI::handle_reveal_command(const std::string& argument) {
  std::size_t index = 0;
  if (!resolve_index(argument, index)) {
    return;
  }

  try {
    std::string plain = vault_.reveal_password(index);
    feedback(FeedbackKind::Info, "Password for " + vault_.list_entries()[index].account + ": " + plain);
  }
  catch (const crypto::DecryptionError& e) {
    log_and_display_error("Error revealing password", e.what());
  }
  catch (const vault::VaultError& e) {
    feedback(FeedbackKind::Error, e.what());
  }
}

void CLI::handle_select_command(const std::string& argument) {
  if (argument.empty()) {
    feedback(FeedbackKind::Error, "Usage: select <number>");
    return;
  }

  std::size_t index = 0;
  if (resolve_index(argument, index)) {
    selected_ = index;
    handle_show_command("");
  }
}

void CLI::handle_save_command() {
  try {
    vault_.save();
    feedback(FeedbackKind::Success, "Entries saved.");
  }
  catch (const store::StoreError& e) {
    log_and_display_error("Error saving entries", e.what());
  }
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help              Display this help message" << std::endl;
  out_ << "  list              List all accounts" << std::endl;
  out_ << "  next / prev       Move the selection down / up" << std::endl;
  out_ << "  select <n>        Select entry <n>" << std::endl;
  out_ << "  show [n]          Show entry details with the password hidden" << std::endl;
  out_ << "  reveal [n]        Decrypt and show the password" << std::endl;
  out_ << "  add               Add a new account and password" << std::endl;
  out_ << "  save              Write all entries to the password file" << std::endl;
  out_ << "  quit              Exit" << std::endl << std::endl;
}


//==============================================
// NAVIGATION
//==============================================

void CLI::next() {
  if (vault_.empty()) {
    return;
  }
  selected_ = (selected_ + 1 < vault_.size()) ? selected_ + 1 : 0;
}

void CLI::previous() {
  if (vault_.empty()) {
    return;
  }
  selected_ = (selected_ > 0) ? selected_ - 1 : vault_.size() - 1;
}

bool CLI::resolve_index(const std::string& argument, std::size_t& index) {
  if (vault_.empty()) {
    feedback(FeedbackKind::Info, "No entries yet. Use 'add' to create one.");
    return false;
  }

  if (argument.empty()) {
    index = std::min(selected_, vault_.size() - 1);
    return true;
  }

  const bool numeric = !argument.empty() && argument.size() <= 9 &&
      std::all_of(argument.begin(), argument.end(),
                  [](unsigned char c) { return std::isdigit(c) != 0; });
  if (numeric) {
    unsigned long number = std::stoul(argument);
    if (number >= 1 && number <= vault_.size()) {
      index = static_cast<std::size_t>(number - 1);
      return true;
    }
  }

  feedback(FeedbackKind::Error, "Invalid entry number: " + argument);
  return false;
}


//==============================================
// OUTPUT
//==============================================

bool CLI::prompt_line(const std::string& prompt, std::string& line) {
  out_ << prompt << std::flush;
  return static_cast<bool>(std::getline(in_, line));
}

void CLI::feedback(FeedbackKind kind, const std::string& message) {
  switch (kind) {
    case FeedbackKind::Info:    out_ << "[info] "; break;
    case FeedbackKind::Success: out_ << "[ok] "; break;
    case FeedbackKind::Error:   out_ << "[error] "; break;
  }
  out_ << message << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  feedback(FeedbackKind::Error, message + ": " + error);
}

} // namespace cli
} // namespace pwv
