#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct _xmlDoc;
struct _xmlNode;

namespace schemediff::xml {

enum class XmlNodeKind { Element, Text, Other };

/// Read-only view of one libxml2 node with its attributes copied out eagerly.
/// MUST NOT outlive the XmlDocument it came from and MUST NOT mutate the document.
/// Inputs are the node; outputs are name/kind/attributes/children with no side effects.
class XmlNode {
 public:
  using Predicate = std::function<bool(const XmlNode&)>;

  explicit XmlNode(_xmlNode* node);

  const std::string& name() const { return name_; }
  XmlNodeKind kind() const { return kind_; }
  const std::unordered_map<std::string, std::string>& attributes() const { return attributes_; }

  std::optional<std::string> attribute(const std::string& name) const;
  std::string attribute_or_empty(const std::string& name) const;

  /// Direct children in document order, including text and comment nodes.
  std::vector<XmlNode> children() const;
  std::vector<XmlNode> children(const Predicate& predicate) const;
  std::optional<XmlNode> first_child(const Predicate& predicate) const;

 private:
  _xmlNode* node_;
  std::string name_;
  XmlNodeKind kind_;
  std::unordered_map<std::string, std::string> attributes_;
};

XmlNode::Predicate is_element();
XmlNode::Predicate is_element_named(std::string tag);

/// Owns a parsed libxml2 document and answers XPath queries over it.
/// MUST release the document on destruction and MUST surface malformed input as exceptions.
/// Inputs are XML text and XPath strings; outputs are node views with no side effects.
class XmlDocument {
 public:
  /// Parses XML from memory with network access disabled.
  /// Throws XmlParseError with the libxml2 message when the input is not well-formed.
  static XmlDocument parse(const std::string& xml, const std::string& source_name);

  /// Evaluates an XPath expression and returns matched elements in document order.
  /// Throws XPathError for malformed expressions or non node-set results; no match is not an error.
  std::vector<XmlNode> query(const std::string& xpath) const;

 private:
  struct DocDeleter {
    void operator()(_xmlDoc* doc) const;
  };

  explicit XmlDocument(_xmlDoc* doc);

  std::unique_ptr<_xmlDoc, DocDeleter> doc_;
};

}  // namespace schemediff::xml
