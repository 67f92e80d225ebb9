#include "config/config.hpp"
#include "utils/text.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unordered_map>
#include <boost/log/trivial.hpp>

namespace pwv {
namespace config {

//==============================================
// COMMAND LINE
//==============================================

void print_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " [-f <file>] [-e <env-file>] [-l <log-file>]\n"
      << "Optional arguments:\n"
      << "  -f, --file       Password file (default: " << DEFAULT_DATA_FILE << ")\n"
      << "  -e, --env-file   Environment file (default: " << DEFAULT_ENV_FILE << ")\n"
      << "  -l, --log        Log file (default: " << DEFAULT_LOG_FILE << ")\n"
      << "      --help       Show this message\n"
      << "The passphrase is read from the " << PASSPHRASE_VARIABLE << " variable.\n"
      << "Example: " << program_name << " -f vault.txt\n";
}

ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err) {
  ProgramOptions options;
  const std::string program_name = argc > 0 ? argv[0] : "pwvault";

  const std::unordered_map<std::string, std::string*> flag_map = {
    {"-f", &options.data_file},
    {"--file", &options.data_file},
    {"-e", &options.env_file},
    {"--env-file", &options.env_file},
    {"-l", &options.log_file},
    {"--log", &options.log_file}
  };

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "-h" || flag == "--help") {
      options.show_help = true;
      options.valid = true;
      return options;
    }

    auto it = flag_map.find(flag);
    if (it == flag_map.end()) {
      err << "Error: Unknown argument: " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }

    if (i + 1 >= argc) {
      err << "Error: Missing value for " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }

    const std::string value(argv[++i]);
    if (value.empty()) {
      err << "Error: Empty value for " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }
    *it->second = value;
  }

  options.valid = true;
  return options;
}


//==============================================
// ENVIRONMENT
//==============================================

std::size_t load_env_file(const std::string& path) {
  if (!std::filesystem::exists(path)) {
    BOOST_LOG_TRIVIAL(debug) << "Config: No environment file at: " << path;
    return 0;
  }

  std::ifstream file(path);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Config: Failed to open environment file: " << path;
    throw ConfigFileError("Config: Failed to open environment file: " + path);
  }

  std::size_t applied = 0;
  std::string line;
  size_t line_number = 0;

  while (std::getline(file, line)) {
    ++line_number;
    std::string trimmed = utils::trim(line);

    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }

    if (trimmed.rfind("export ", 0) == 0) {
      trimmed = utils::trim(trimmed.substr(7));
    }

    auto eq = trimmed.find('=');
    if (eq == std::string::npos || eq == 0) {
      BOOST_LOG_TRIVIAL(warning) << "Config: Ignoring malformed line " << line_number << " in " << path;
      continue;
    }

    std::string name = utils::trim(trimmed.substr(0, eq));
    std::string value = utils::trim(trimmed.substr(eq + 1));

    // Strip one pair of matching quotes
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }

    // Variables already in the environment win
    if (std::getenv(name.c_str()) != nullptr) {
      BOOST_LOG_TRIVIAL(debug) << "Config: Keeping existing value of " << name;
      continue;
    }

    if (setenv(name.c_str(), value.c_str(), 0) != 0) {
      BOOST_LOG_TRIVIAL(warning) << "Config: Failed to set " << name << " from " << path;
      continue;
    }
    ++applied;
  }

  if (file.bad()) {
    throw ConfigFileError("Config: Failed to read environment file: " + path);
  }

  BOOST_LOG_TRIVIAL(info) << "Config: Loaded " << applied << " variables from " << path;
  return applied;
}

std::optional<std::string> read_passphrase(const std::string& variable) {
  const char* value = std::getenv(variable.c_str());
  if (value == nullptr) {
    BOOST_LOG_TRIVIAL(warning) << "Config: " << variable << " is not set";
    return std::nullopt;
  }
  return std::string(value);
}

} // namespace config
} // namespace pwv
