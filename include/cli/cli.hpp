#pragma once

#include <iostream>
#include <string>
#include "vault/vault.hpp"

namespace pwv {
namespace cli {

enum class FeedbackKind {
  Info,
  Success,
  Error
};

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit CLI(vault::Vault& vault, std::istream& in = std::cin, std::ostream& out = std::cout);


    // ---- STARTUP ----
    void run();


    // ---- GETTERS ----
    std::size_t selected() const { return selected_; }

private:
    // ---- PARAMETERS ----
    bool running_;
    vault::Vault& vault_;
    std::istream& in_;
    std::ostream& out_;
    // Index of the highlighted entry
    std::size_t selected_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::string& argument);
    void handle_list_command();
    void handle_add_command();
    void handle_show_command(const std::string& argument);
    void handle_reveal_command(const std::string& argument);
    void handle_select_command(const std::string& argument);
    void handle_save_command();
    void handle_help_command();


    // ---- NAVIGATION ----
    // Both wrap around and do nothing on an empty vault
    void next();
    void previous();
    // Resolves a 1-based argument, or the selection when argument is empty
    bool resolve_index(const std::string& argument, std::size_t& index);


    // ---- OUTPUT ----
    bool prompt_line(const std::string& prompt, std::string& line);
    void feedback(FeedbackKind kind, const std::string& message);
    void log_and_display_error(const std::string& message, const std::string& error);
};

// Mask shown instead of a password: one '*' per payload character, 1 to 32
std::string mask_password(const std::string& encoded_password);

} // namespace cli
} // namespace pwv
