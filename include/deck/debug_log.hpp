#pragma once

#include <string>

namespace deck {

// Debug output goes to stderr. It is off until set_debug_enabled(true);
// load_config() decides that from DECK_DEBUG and --debug.
bool debug_enabled();
void set_debug_enabled(bool enabled);

void debug_log(const std::string& tag, const std::string& message);

} // namespace deck
