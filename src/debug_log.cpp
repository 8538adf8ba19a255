#include "deck/debug_log.hpp"

#include <iostream>

namespace deck {
namespace {

bool& debug_flag() {
  static bool enabled = false;
  return enabled;
}

} // namespace

bool debug_enabled() {
  return debug_flag();
}

void set_debug_enabled(bool enabled) {
  debug_flag() = enabled;
}

void debug_log(const std::string& tag, const std::string& message) {
  if (debug_enabled()) {
    std::cerr << "[" << tag << "] " << message << std::endl;
  }
}

} // namespace deck
