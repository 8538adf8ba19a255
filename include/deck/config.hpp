#pragma once

#include <filesystem>
#include <string>

namespace deck {

struct Config {
  std::filesystem::path data_file = "flashcards.json";
  bool clear_screen = true;
  bool debug = false;
  bool show_help = false;
};

// Defaults, then DECK_DATA_FILE / DECK_DEBUG, then command-line flags.
// Throws std::invalid_argument on an unknown flag or a missing value.
Config load_config(int argc, const char* const* argv);

std::string usage(const std::string& program);

} // namespace deck
