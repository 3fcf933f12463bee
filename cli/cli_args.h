#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace schemediff::cli {

/// Baseline scheme used when --baseline is not given, relative to the working directory.
inline constexpr const char* kDefaultSchemePath = "resources/META-INF/Prplkai.xml";

/// Captures CLI arguments so main can dispatch without re-parsing raw argv.
/// MUST keep defaults consistent with CLI behavior and MUST validate after parsing.
/// Inputs are argv; outputs are populated fields with no side effects by itself.
struct CliOptions {
  std::string baseline = kDefaultSchemePath;
  std::optional<std::string> candidate;
  bool color = true;
  bool show_help = false;
};

/// Prints usage for --help and usage errors.
/// MUST remain accurate to supported flags and MUST not throw on stream failures.
void print_help(std::ostream& os);
/// Parses CLI flags into options and reports a user-facing error string.
/// MUST return false on unknown flags, missing values, or more than one candidate path.
/// Inputs are argc/argv; outputs are options/error with no external side effects.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace schemediff::cli
