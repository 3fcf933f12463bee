#include "cli_args.h"

#include <string>

namespace schemediff::cli {

void print_help(std::ostream& os) {
  os << "Usage: schemediff [--baseline <path>] [--color=disabled] [candidate.xml]\n";
  os << "       schemediff --help\n\n";
  os << "Without a candidate, lists every color and attribute of the baseline scheme.\n";
  os << "With a candidate, shows attributes changed, removed and added relative to the baseline.\n";
  os << "The baseline defaults to " << kDefaultSchemePath << ".\n";
}

bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      options.show_help = true;
    } else if (arg == "--color=disabled") {
      options.color = false;
    } else if (arg == "--baseline") {
      if (i + 1 >= argc) {
        error = "Missing value for --baseline";
        return false;
      }
      options.baseline = argv[++i];
    } else if (arg.size() > 1 && arg[0] == '-') {
      error = "Unknown option: " + arg;
      return false;
    } else if (options.candidate.has_value()) {
      // WHY: only one candidate is compared against the baseline per run.
      error = "Unexpected argument: " + arg;
      return false;
    } else {
      options.candidate = arg;
    }
  }
  return true;
}

}  // namespace schemediff::cli
