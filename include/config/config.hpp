#pragma once

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace pwv {
namespace config {

inline constexpr const char* PASSPHRASE_VARIABLE = "PASSWORD_MANAGER_KEY";
inline constexpr const char* DEFAULT_DATA_FILE = "passwords.txt";
inline constexpr const char* DEFAULT_ENV_FILE = ".env";
inline constexpr const char* DEFAULT_LOG_FILE = "pwvault.log";

struct ProgramOptions {
  std::string data_file{DEFAULT_DATA_FILE};
  std::string env_file{DEFAULT_ENV_FILE};
  std::string log_file{DEFAULT_LOG_FILE};
  bool show_help{false};
  bool valid{false};
};

class ConfigFileError : public std::runtime_error {
public:
  explicit ConfigFileError(const std::string& message) : std::runtime_error(message) {}
};


// ---- COMMAND LINE ----
void print_usage(const std::string& program_name, std::ostream& out);
// Errors are written to err together with the usage text; the returned
// options are then not valid
ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err);


// ---- ENVIRONMENT ----
// Reads KEY=VALUE lines into the process environment without overriding
// variables that are already set. A missing file sets nothing.
// Returns the number of variables set; throws ConfigFileError when an
// existing file cannot be read.
std::size_t load_env_file(const std::string& path);
// Returns the passphrase variable, or std::nullopt when it is not set
std::optional<std::string> read_passphrase(const std::string& variable = PASSPHRASE_VARIABLE);

} // namespace config
} // namespace pwv
