#include "schemediff/schemediff.h"

#include <set>
#include <utility>

namespace schemediff {

namespace {

std::optional<PropertyMap> lookup(const AttributeMap& attributes, const std::string& key) {
  auto it = attributes.find(key);
  if (it == attributes.end()) return std::nullopt;
  return it->second;
}

}  // namespace

/// Classifies the key union of both mappings.
/// MUST keep output ordered by key and MUST leave equal entries out of every sequence.
SchemeDiff diff_attributes(const AttributeMap& baseline, const AttributeMap& candidate) {
  std::set<std::string> keys;
  for (const auto& entry : baseline) keys.insert(entry.first);
  for (const auto& entry : candidate) keys.insert(entry.first);

  SchemeDiff diff;
  for (const auto& key : keys) {
    DiffEntry entry{key, lookup(candidate, key), lookup(baseline, key)};
    if (entry.baseline && entry.candidate) {
      if (*entry.baseline != *entry.candidate) {
        diff.changed.push_back(std::move(entry));
      }
    } else if (entry.baseline) {
      diff.removed.push_back(std::move(entry));
    } else {
      diff.added.push_back(std::move(entry));
    }
  }
  return diff;
}

}  // namespace schemediff
