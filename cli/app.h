#pragma once

#include <ostream>

#include "cli_args.h"

namespace schemediff::cli {

/// Loads the baseline (and candidate, when given) and writes the listing or diff.
/// MUST return 1 after reporting any failure on err and MUST NOT print partial results.
/// Inputs are parsed options and streams; side effects are file reads and stream writes.
int run_cli(const CliOptions& options, std::ostream& out, std::ostream& err);

/// Parses argv, handles --help and usage errors, and dispatches to run_cli.
/// MUST disable color when stdout is not a terminal and MUST return 1 on usage errors.
/// Inputs are argv, streams and the terminal state of stdout; outputs are the exit code.
int run_main(int argc, char** argv, std::ostream& out, std::ostream& err, bool stdout_is_tty);

}  // namespace schemediff::cli
