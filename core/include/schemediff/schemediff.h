#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace schemediff {

/// Style properties of one scheme attribute, keyed by lower-cased property name.
/// MUST hold either the single reserved "inherit" entry or plain style properties, never both.
/// Inputs/outputs are the map entries; equality is structural and order-independent.
using PropertyMap = std::map<std::string, std::string>;
using AttributeMap = std::map<std::string, PropertyMap>;
using ColorMap = std::map<std::string, std::string>;

/// Reserved property key marking an unresolved reference to another attribute.
inline constexpr const char* kInheritKey = "inherit";

/// Holds everything loaded from one scheme file.
/// MUST be treated as immutable after parsing and MUST be owned by the caller.
/// The order vectors list each name once, at its first position in the file; equality ignores them.
struct ColorScheme {
  AttributeMap attributes;
  ColorMap colors;
  std::vector<std::string> attribute_order;
  std::vector<std::string> color_order;
};

inline bool operator==(const ColorScheme& a, const ColorScheme& b) {
  return a.attributes == b.attributes && a.colors == b.colors;
}

inline bool operator!=(const ColorScheme& a, const ColorScheme& b) {
  return !(a == b);
}

/// One classified attribute key with the value from each side (nullopt when absent).
struct DiffEntry {
  std::string key;
  std::optional<PropertyMap> candidate;
  std::optional<PropertyMap> baseline;
};

/// Carries the three-way classification of a scheme comparison.
/// MUST list each key in at most one sequence and MUST keep sequences ordered by key.
/// Inputs/outputs are the entry vectors; side effects are none.
struct SchemeDiff {
  std::vector<DiffEntry> changed;
  std::vector<DiffEntry> removed;
  std::vector<DiffEntry> added;

  bool empty() const { return changed.empty() && removed.empty() && added.empty(); }
};

/// Raised when a scheme path does not resolve to an existing file.
/// MUST carry the resolved absolute path so callers can report it verbatim.
class SchemeNotFoundError : public std::runtime_error {
 public:
  explicit SchemeNotFoundError(const std::string& absolute_path);

  const std::string& absolute_path() const { return absolute_path_; }

 private:
  std::string absolute_path_;
};

/// Raised when scheme bytes are not well-formed XML. Message carries the libxml2 diagnostic.
class XmlParseError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Raised when a path expression is malformed or does not select a node set.
class XPathError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Parses a scheme file from disk.
/// MUST fail with SchemeNotFoundError for missing files and MUST NOT return partial schemes.
/// Inputs are a path; failures throw and side effects are file reads only.
ColorScheme parse_color_scheme(const std::string& path);
/// Parses scheme XML already held in memory.
/// MUST apply the same rules as parse_color_scheme and MUST treat the input as immutable.
/// Inputs are XML text and a name used in diagnostics; failures throw.
ColorScheme parse_color_scheme_from_document(const std::string& xml,
                                             const std::string& source_name = "<memory>");

/// Classifies every attribute key of two schemes into changed/removed/added.
/// MUST be pure and MUST exclude keys whose mappings are equal on both sides.
/// Inputs are the baseline and candidate mappings; outputs are the classification.
SchemeDiff diff_attributes(const AttributeMap& baseline, const AttributeMap& candidate);

}  // namespace schemediff
