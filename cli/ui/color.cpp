#include "color.h"

#include <cctype>

namespace schemediff::cli {

/// Holds the singleton color palette used by CLI rendering.
/// MUST match the declaration in the header and MUST not be redefined elsewhere.
Color kColor;

std::string paint(const std::string& text, const char* code, bool enabled) {
  if (!enabled) return text;
  return std::string(code) + text + kColor.reset;
}

std::optional<std::string> rgb_escape(const std::string& hex, bool background) {
  std::string digits = hex.substr(0, 6);
  if (digits.empty()) return std::nullopt;
  unsigned long value = 0;
  for (char c : digits) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
    value = value * 16 + static_cast<unsigned long>(
                             std::isdigit(static_cast<unsigned char>(c))
                                 ? c - '0'
                                 : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10);
  }
  return std::string("\033[") + (background ? "4" : "3") + "8;2;" +
         std::to_string((value >> 16) & 0xff) + ";" +
         std::to_string((value >> 8) & 0xff) + ";" +
         std::to_string(value & 0xff) + "m";
}

}  // namespace schemediff::cli
