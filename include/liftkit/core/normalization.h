#pragma once

#include <string>
#include <string_view>

namespace liftkit::core {

// Locale-independent string helpers shared by the codec and the range tooling.

// is_xml_space reports the four XML whitespace characters (space, tab, CR, LF).
constexpr bool is_xml_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

// trim removes leading and trailing XML whitespace.
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_xml_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_xml_space(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// is_blank is true for empty or whitespace-only input.
inline bool is_blank(const std::string_view input) {
  for (const char ch : input) {
    if (!is_xml_space(ch)) {
      return false;
    }
  }
  return true;
}

// is_private_type: LIFT marks application-private relation and field types with a
// leading underscore (e.g. "_component-lexeme").
inline bool is_private_type(const std::string_view type) {
  return !type.empty() && type.front() == '_';
}

}  // namespace liftkit::core
