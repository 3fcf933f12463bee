#pragma once

#include <optional>
#include <string>

namespace schemediff::cli {

/// Defines ANSI color codes for headings, highlights and diagnostics.
/// MUST remain valid ANSI sequences and MUST stay ASCII-only for terminal compatibility.
/// Inputs are the constant strings; side effects occur when printed to terminals.
struct Color {
  const char* reset = "\033[0m";
  const char* red = "\033[1;31m";
  const char* green = "\033[1;32m";
  const char* yellow = "\033[1;33m";
  const char* cyan = "\033[1;36m";
};

/// Provides a shared color palette instance to keep output styling consistent.
/// MUST be initialized exactly once and MUST remain immutable in normal usage.
extern Color kColor;

/// Wraps text in a palette color followed by reset; returns text unchanged when disabled.
std::string paint(const std::string& text, const char* code, bool enabled);

/// Builds a 24-bit foreground (or background) escape from a hex color such as "FF8800".
/// MUST only read the first six characters and MUST return nullopt for non-hex input.
/// Inputs are the hex string and target plane; outputs are the escape with no side effects.
std::optional<std::string> rgb_escape(const std::string& hex, bool background = false);

}  // namespace schemediff::cli
