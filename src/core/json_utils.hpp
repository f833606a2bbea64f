#ifndef CORESIDENCY_CORE_JSON_UTILS_HPP_
#define CORESIDENCY_CORE_JSON_UTILS_HPP_

#include <cstdio>
#include <string>
#include <string_view>

namespace coresidency::core {

// JSON string escaping for the decision stream written by the CLI.
inline std::string EscapeJson(std::string_view input) {
  std::string out;
  out.reserve(input.size() + 2U);
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(as_unsigned));
        out += buffer;
      } else {
        out.push_back(ch);
      }
      break;
    }
    }
  }
  return out;
}

// Formats a double compactly for JSON output (no trailing zeros, no locale).
inline std::string FormatJsonNumber(double value) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.10g", value);
  return buffer;
}

} // namespace coresidency::core

#endif // CORESIDENCY_CORE_JSON_UTILS_HPP_
