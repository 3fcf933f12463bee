#include "render/scheme_renderer.h"

#include <set>
#include <sstream>
#include <vector>

#include "ui/color.h"

namespace schemediff::render {

namespace {

constexpr const char* kStripeGlyph = "¯";

/// Counts UTF-8 code points so padding lines up for non-ASCII names.
size_t display_length(const std::string& value) {
  size_t count = 0;
  for (unsigned char c : value) {
    if ((c & 0xC0) != 0x80) ++count;
  }
  return count;
}

std::string pad_key(const std::string& name, size_t width) {
  std::string key = name + ":";
  size_t len = display_length(key);
  if (len < width) key.append(width - len, ' ');
  return key;
}

std::string rgb_or_empty(const PropertyMap& properties, const char* key, bool background) {
  auto it = properties.find(key);
  if (it == properties.end()) return "";
  return cli::rgb_escape(it->second, background).value_or("");
}

std::string join_properties(const PropertyMap& properties) {
  std::string out;
  for (const auto& entry : properties) {
    if (!out.empty()) out += ", ";
    out += entry.first + "=" + entry.second;
  }
  return out;
}

/// Lists map keys in file order, then any keys the order vector does not mention.
template <typename Map>
std::vector<std::string> ordered_keys(const Map& map, const std::vector<std::string>& order) {
  std::vector<std::string> keys;
  std::set<std::string> seen;
  for (const auto& name : order) {
    if (map.count(name) != 0 && seen.insert(name).second) keys.push_back(name);
  }
  for (const auto& entry : map) {
    if (seen.count(entry.first) == 0) keys.push_back(entry.first);
  }
  return keys;
}

}  // namespace

std::string format_attribute(const std::string& name,
                             const std::optional<PropertyMap>& properties,
                             const RenderOptions& options) {
  const bool color = options.color;
  std::string key = pad_key(name, options.key_width);
  if (!properties) {
    return key + " " + cli::paint("<null>", cli::kColor.red, color);
  }
  auto inherit = properties->find(kInheritKey);
  if (inherit != properties->end()) {
    return key + " => " + cli::paint(inherit->second, cli::kColor.cyan, color);
  }

  std::string out;
  if (color) {
    out += rgb_or_empty(*properties, "foreground", false);
    out += rgb_or_empty(*properties, "background", true);
  }
  out += key + " " + join_properties(*properties);
  if (color) out += cli::kColor.reset;

  auto stripe = properties->find("error_stripe_color");
  if (stripe != properties->end()) {
    out += "\n";
    if (color) out += cli::rgb_escape(stripe->second).value_or("");
    for (size_t i = 0; i < display_length(name); ++i) out += kStripeGlyph;
    if (color) out += cli::kColor.reset;
  }
  return out;
}

std::string format_color(const std::string& name,
                         const std::string& hex,
                         const RenderOptions& options) {
  std::string out = pad_key(name, options.key_width) + " ";
  if (hex.empty()) return out;
  if (options.color) {
    out += cli::rgb_escape(hex, true).value_or("");
    out += "  ";
    out += cli::kColor.reset;
  } else {
    out += "  ";
  }
  out += " #" + hex;
  return out;
}

std::string render_scheme(const ColorScheme& scheme,
                          const std::string& path,
                          const RenderOptions& options) {
  const std::string title = cli::paint(path, cli::kColor.cyan, options.color);
  std::ostringstream oss;
  oss << "Displaying colors in " << title << ":\n\n";
  for (const auto& name : ordered_keys(scheme.colors, scheme.color_order)) {
    oss << format_color(name, scheme.colors.at(name), options) << "\n";
  }
  oss << "\n";
  oss << "Displaying attributes in " << title << ":\n\n";
  for (const auto& name : ordered_keys(scheme.attributes, scheme.attribute_order)) {
    oss << format_attribute(name, scheme.attributes.at(name), options) << "\n";
  }
  return oss.str();
}

std::string render_diff(const SchemeDiff& diff,
                        const std::string& baseline_path,
                        const std::string& candidate_path,
                        const RenderOptions& options) {
  const bool color = options.color;
  std::ostringstream oss;
  oss << "Comparing " << cli::paint(baseline_path, cli::kColor.cyan, color) << " with "
      << cli::paint(candidate_path, cli::kColor.cyan, color) << "...\n";

  if (!diff.changed.empty()) {
    oss << cli::paint("Changed:", cli::kColor.yellow, color) << "\n";
    for (const auto& entry : diff.changed) {
      oss << entry.key << "\n";
      oss << "  " << format_attribute("Current", entry.baseline, options) << "\n";
      oss << "  " << format_attribute("Alternate", entry.candidate, options) << "\n";
      oss << "\n";
    }
    oss << "\n";
  }

  if (!diff.removed.empty()) {
    oss << cli::paint("Removed:", cli::kColor.red, color) << "\n";
    for (const auto& entry : diff.removed) {
      oss << format_attribute(entry.key, entry.baseline, options) << "\n";
    }
    oss << "\n";
  }

  if (!diff.added.empty()) {
    oss << cli::paint("Added:", cli::kColor.green, color) << "\n";
    for (const auto& entry : diff.added) {
      oss << format_attribute(entry.key, entry.candidate, options) << "\n";
    }
    oss << "\n";
  }

  if (diff.empty()) oss << "Color schemes are equal!\n";
  return oss.str();
}

}  // namespace schemediff::render
