#pragma once

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace lingo {

inline bool debug_enabled() {
  static bool enabled = [] {
    const char* env = std::getenv("LINGO_DEBUG_ASSESSMENT");
    if (!env) {
      env = std::getenv("LINGO_DEBUG");
    }
    if (!env) {
      return false;
    }
    std::string value(env);
    return !(value.empty() || value == "0" || value == "false" || value == "FALSE");
  }();
  return enabled;
}

inline void debug_log(std::string_view scope, const std::string& message) {
  if (debug_enabled()) {
    std::cerr << "[" << scope << "] " << message << std::endl;
  }
}

} // namespace lingo
