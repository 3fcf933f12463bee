#include "app.h"

#include <exception>
#include <string>

#include "schemediff/schemediff.h"
#include "render/scheme_renderer.h"
#include "ui/color.h"

namespace schemediff::cli {

int run_cli(const CliOptions& options, std::ostream& out, std::ostream& err) {
  render::RenderOptions render_options;
  render_options.color = options.color;
  try {
    ColorScheme baseline = parse_color_scheme(options.baseline);
    if (!options.candidate.has_value()) {
      out << render::render_scheme(baseline, options.baseline, render_options);
      return 0;
    }
    ColorScheme candidate = parse_color_scheme(*options.candidate);
    SchemeDiff diff = diff_attributes(baseline.attributes, candidate.attributes);
    out << render::render_diff(diff, options.baseline, *options.candidate, render_options);
    return 0;
  } catch (const std::exception& ex) {
    if (options.color) err << kColor.red;
    err << "Error: " << ex.what() << std::endl;
    if (options.color) err << kColor.reset;
    return 1;
  }
}

int run_main(int argc, char** argv, std::ostream& out, std::ostream& err, bool stdout_is_tty) {
  CliOptions options;
  std::string error;
  if (!parse_cli_args(argc, argv, options, error)) {
    err << "Error: " << error << "\n";
    print_help(err);
    return 1;
  }
  if (options.show_help) {
    print_help(out);
    return 0;
  }
  if (!stdout_is_tty) {
    options.color = false;
  }
  return run_cli(options, out, err);
}

}  // namespace schemediff::cli
