#include "deck/config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace deck {
namespace {

bool env_flag(const char* name) {
  const char* env = std::getenv(name);
  if (!env) {
    return false;
  }
  std::string value(env);
  return !(value.empty() || value == "0" || value == "false" || value == "FALSE");
}

} // namespace

Config load_config(int argc, const char* const* argv) {
  Config config;

  if (const char* data_file = std::getenv("DECK_DATA_FILE")) {
    if (*data_file != '\0') {
      config.data_file = data_file;
    }
  }
  config.debug = env_flag("DECK_DEBUG");

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--data") {
      if (i + 1 >= argc) {
        throw std::invalid_argument("--data requires a path");
      }
      config.data_file = argv[++i];
    } else if (arg == "--no-clear") {
      config.clear_screen = false;
    } else if (arg == "--debug") {
      config.debug = true;
    } else if (arg == "--help" || arg == "-h") {
      config.show_help = true;
    } else {
      throw std::invalid_argument("Unknown option: " + arg);
    }
  }
  return config;
}

std::string usage(const std::string& program) {
  return "Usage: " + program + " [--data PATH] [--no-clear] [--debug] [--help]\n"
         "  --data PATH   flashcard store (default: flashcards.json, or $DECK_DATA_FILE)\n"
         "  --no-clear    do not clear the screen between menus\n"
         "  --debug       print debug output to stderr (or set DECK_DEBUG=1)\n";
}

} // namespace deck
