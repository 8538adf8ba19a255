#pragma once

#include <cctype>
#include <string>

namespace deck::text {

inline bool is_space(char ch) {
  return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

inline std::string trim(const std::string& value) {
  std::size_t begin = 0;
  std::size_t end = value.size();
  while (begin < end && is_space(value[begin])) {
    ++begin;
  }
  while (end > begin && is_space(value[end - 1])) {
    --end;
  }
  return value.substr(begin, end - begin);
}

inline bool is_blank(const std::string& value) {
  for (char ch : value) {
    if (!is_space(ch)) {
      return false;
    }
  }
  return true;
}

// Unicode lowercase over UTF-8 text, the same mapping for every locale.
std::string to_lower(const std::string& value);

} // namespace deck::text
