#include "schemediff/schemediff.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "../xml/xml_document.h"

namespace schemediff {

namespace {

constexpr const char* kAttributeOptionsPath = "/scheme/attributes/option";
constexpr const char* kColorOptionsPath = "/scheme/colors/option";

std::string read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

/// Maps an upper-case code point to lower case for ASCII, Latin-1, Latin Extended-A,
/// Greek and Cyrillic. Other code points are returned unchanged.
uint32_t lower_code_point(uint32_t cp) {
  if (cp >= 0x41 && cp <= 0x5A) return cp + 0x20;
  if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 0x20;
  if (cp >= 0x100 && cp <= 0x137 && cp != 0x130 && cp % 2 == 0) return cp + 1;
  if (cp >= 0x139 && cp <= 0x148 && cp % 2 == 1) return cp + 1;
  if (cp >= 0x14A && cp <= 0x177 && cp % 2 == 0) return cp + 1;
  if (cp == 0x178) return 0xFF;
  if (cp >= 0x179 && cp <= 0x17E && cp % 2 == 1) return cp + 1;
  if (cp >= 0x391 && cp <= 0x3AB && cp != 0x3A2) return cp + 0x20;
  if (cp >= 0x400 && cp <= 0x40F) return cp + 0x50;
  if (cp >= 0x410 && cp <= 0x42F) return cp + 0x20;
  return cp;
}

void append_utf8(std::string& out, uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

/// Lower-cases a UTF-8 property name without consulting the process locale.
/// MUST copy malformed byte sequences through unchanged.
std::string to_lower_utf8(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    unsigned char lead = static_cast<unsigned char>(s[i]);
    size_t len = 1;
    uint32_t cp = lead;
    if (lead >= 0xC0 && lead < 0xE0) {
      len = 2;
      cp = lead & 0x1F;
    } else if (lead >= 0xE0 && lead < 0xF0) {
      len = 3;
      cp = lead & 0x0F;
    } else if (lead >= 0xF0 && lead < 0xF8) {
      len = 4;
      cp = lead & 0x07;
    } else if (lead >= 0x80) {
      out += s[i++];
      continue;
    }
    bool valid = i + len <= s.size();
    for (size_t k = 1; valid && k < len; ++k) {
      unsigned char c = static_cast<unsigned char>(s[i + k]);
      if ((c & 0xC0) != 0x80) {
        valid = false;
      } else {
        cp = (cp << 6) | (c & 0x3F);
      }
    }
    if (!valid) {
      out += s[i++];
      continue;
    }
    append_utf8(out, lower_code_point(cp));
    i += len;
  }
  return out;
}

/// Builds the property mapping of one attribute option.
/// MUST return exactly {"inherit": base} when baseAttributes is present and MUST ignore children then.
/// Inputs are the option node; outputs are the mapping with no side effects.
PropertyMap parse_attribute_properties(const xml::XmlNode& option) {
  PropertyMap properties;
  if (auto base = option.attribute("baseAttributes")) {
    properties[kInheritKey] = *base;
    return properties;
  }
  auto value = option.first_child(xml::is_element_named("value"));
  if (!value) return properties;
  for (const auto& entry : value->children(xml::is_element())) {
    // WHY: later duplicates overwrite earlier ones, matching document order.
    properties[to_lower_utf8(entry.attribute_or_empty("name"))] =
        entry.attribute_or_empty("value");
  }
  return properties;
}

}  // namespace

SchemeNotFoundError::SchemeNotFoundError(const std::string& absolute_path)
    : std::runtime_error("Scheme file \"" + absolute_path + "\" does not exist"),
      absolute_path_(absolute_path) {}

ColorScheme parse_color_scheme_from_document(const std::string& xml,
                                             const std::string& source_name) {
  xml::XmlDocument doc = xml::XmlDocument::parse(xml, source_name);
  ColorScheme scheme;
  for (const auto& option : doc.query(kAttributeOptionsPath)) {
    std::string name = option.attribute_or_empty("name");
    // WHY: a repeated name keeps its first position but takes the later value.
    if (scheme.attributes.insert_or_assign(name, parse_attribute_properties(option)).second) {
      scheme.attribute_order.push_back(name);
    }
  }
  for (const auto& option : doc.query(kColorOptionsPath)) {
    std::string name = option.attribute_or_empty("name");
    if (scheme.colors.insert_or_assign(name, option.attribute_or_empty("value")).second) {
      scheme.color_order.push_back(name);
    }
  }
  return scheme;
}

ColorScheme parse_color_scheme(const std::string& path) {
  std::filesystem::path file_path(path);
  std::error_code ec;
  if (!std::filesystem::exists(file_path, ec)) {
    throw SchemeNotFoundError(std::filesystem::absolute(file_path, ec).lexically_normal().string());
  }
  return parse_color_scheme_from_document(read_file(path), path);
}

}  // namespace schemediff
