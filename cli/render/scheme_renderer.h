#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "schemediff/schemediff.h"

namespace schemediff::render {

/// Controls how scheme listings and diffs are formatted.
/// MUST keep key_width wide enough for typical attribute names and MUST honor color=false fully.
struct RenderOptions {
  bool color = true;
  size_t key_width = 50;
};

/// Formats one attribute line, previewing its foreground/background when color is on.
/// MUST render nullopt as <null> and MUST render inherit references as "=> target".
/// Inputs are name/mapping/options; outputs are text (possibly two lines) with no side effects.
std::string format_attribute(const std::string& name,
                             const std::optional<PropertyMap>& properties,
                             const RenderOptions& options);
/// Formats one color line with a swatch and the hex value.
std::string format_color(const std::string& name,
                         const std::string& hex,
                         const RenderOptions& options);
/// Renders every color and attribute of a scheme loaded from path.
std::string render_scheme(const ColorScheme& scheme,
                          const std::string& path,
                          const RenderOptions& options);
/// Renders changed/removed/added sections, or the equality notice when the diff is empty.
/// MUST omit empty sections and MUST label baseline values "Current" and candidate "Alternate".
std::string render_diff(const SchemeDiff& diff,
                        const std::string& baseline_path,
                        const std::string& candidate_path,
                        const RenderOptions& options);

}  // namespace schemediff::render
