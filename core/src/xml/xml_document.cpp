#include "xml_document.h"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>
#include <libxml/xpath.h>

#include <cctype>
#include <utility>

#include "schemediff/schemediff.h"

namespace schemediff::xml {

namespace {

using ParserCtxtPtr = std::unique_ptr<xmlParserCtxt, decltype(&xmlFreeParserCtxt)>;
using XPathContextPtr = std::unique_ptr<xmlXPathContext, decltype(&xmlXPathFreeContext)>;
using XPathObjectPtr = std::unique_ptr<xmlXPathObject, decltype(&xmlXPathFreeObject)>;

void discard_generic_error(void*, const char*, ...) {}

/// Routes libxml2 generic diagnostics away from stderr for the guard's lifetime.
/// MUST restore the default handler on scope exit, including during unwinding.
class GenericErrorMute {
 public:
  GenericErrorMute() { xmlSetGenericErrorFunc(nullptr, discard_generic_error); }
  ~GenericErrorMute() { xmlSetGenericErrorFunc(nullptr, nullptr); }
  GenericErrorMute(const GenericErrorMute&) = delete;
  GenericErrorMute& operator=(const GenericErrorMute&) = delete;
};

std::string trim_ws(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
    ++start;
  }
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(start, end - start);
}

std::string error_message(const xmlError& error) {
  if (!error.message) return "";
  return trim_ws(error.message);
}

/// Builds the name as written in the source, "prefix:local" when a namespace prefix is bound.
std::string qualified_name(const xmlNs* ns, const xmlChar* local) {
  std::string out;
  if (ns && ns->prefix) {
    out = reinterpret_cast<const char*>(ns->prefix);
    out += ':';
  }
  if (local) out += reinterpret_cast<const char*>(local);
  return out;
}

XmlNodeKind kind_of(const xmlNode* node) {
  switch (node->type) {
    case XML_ELEMENT_NODE:
      return XmlNodeKind::Element;
    case XML_TEXT_NODE:
    case XML_CDATA_SECTION_NODE:
      return XmlNodeKind::Text;
    default:
      return XmlNodeKind::Other;
  }
}

}  // namespace

XmlNode::XmlNode(_xmlNode* node) : node_(node), kind_(kind_of(node)) {
  if (kind_ != XmlNodeKind::Element) {
    if (node_->name) name_ = reinterpret_cast<const char*>(node_->name);
    return;
  }
  name_ = qualified_name(node_->ns, node_->name);
  // WHY: attributes are copied once so the view never reads live document state later.
  for (xmlAttr* attr = node_->properties; attr != nullptr; attr = attr->next) {
    // WHY: prefixed attributes such as x:name must not stand in for the plain name.
    std::string attr_name = qualified_name(attr->ns, attr->name);
    xmlChar* value = xmlNodeListGetString(node_->doc, attr->children, 1);
    if (value) {
      attributes_[attr_name] = reinterpret_cast<const char*>(value);
      xmlFree(value);
    } else {
      attributes_[attr_name] = "";
    }
  }
}

std::optional<std::string> XmlNode::attribute(const std::string& name) const {
  auto it = attributes_.find(name);
  if (it == attributes_.end()) return std::nullopt;
  return it->second;
}

std::string XmlNode::attribute_or_empty(const std::string& name) const {
  return attribute(name).value_or("");
}

std::vector<XmlNode> XmlNode::children() const {
  std::vector<XmlNode> out;
  for (xmlNode* child = node_->children; child != nullptr; child = child->next) {
    out.emplace_back(child);
  }
  return out;
}

std::vector<XmlNode> XmlNode::children(const Predicate& predicate) const {
  std::vector<XmlNode> out;
  for (xmlNode* child = node_->children; child != nullptr; child = child->next) {
    XmlNode view(child);
    if (predicate(view)) {
      out.push_back(std::move(view));
    }
  }
  return out;
}

std::optional<XmlNode> XmlNode::first_child(const Predicate& predicate) const {
  for (xmlNode* child = node_->children; child != nullptr; child = child->next) {
    XmlNode view(child);
    if (predicate(view)) return view;
  }
  return std::nullopt;
}

XmlNode::Predicate is_element() {
  return [](const XmlNode& node) { return node.kind() == XmlNodeKind::Element; };
}

XmlNode::Predicate is_element_named(std::string tag) {
  return [tag = std::move(tag)](const XmlNode& node) {
    return node.kind() == XmlNodeKind::Element && node.name() == tag;
  };
}

void XmlDocument::DocDeleter::operator()(_xmlDoc* doc) const {
  xmlFreeDoc(doc);
}

XmlDocument::XmlDocument(_xmlDoc* doc) : doc_(doc) {}

XmlDocument XmlDocument::parse(const std::string& xml, const std::string& source_name) {
  ParserCtxtPtr ctxt(xmlNewParserCtxt(), xmlFreeParserCtxt);
  if (!ctxt) {
    throw XmlParseError("Failed to allocate XML parser for " + source_name);
  }
  // WHY: NONET keeps scheme loading offline; entity substitution stays off.
  xmlDocPtr doc = xmlCtxtReadMemory(ctxt.get(),
                                    xml.data(),
                                    static_cast<int>(xml.size()),
                                    source_name.c_str(),
                                    nullptr,
                                    XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING);
  if (!doc) {
    std::string message = error_message(ctxt->lastError);
    if (message.empty()) message = "document is empty or not well-formed";
    throw XmlParseError(source_name + ":" + std::to_string(ctxt->lastError.line) +
                        ": " + message);
  }
  return XmlDocument(doc);
}

std::vector<XmlNode> XmlDocument::query(const std::string& xpath) const {
  XPathContextPtr ctx(xmlXPathNewContext(doc_.get()), xmlXPathFreeContext);
  if (!ctx) {
    throw XPathError("Failed to create XPath context");
  }
  GenericErrorMute mute;
  XPathObjectPtr result(
      xmlXPathEvalExpression(reinterpret_cast<const xmlChar*>(xpath.c_str()), ctx.get()),
      xmlXPathFreeObject);
  if (!result) {
    std::string message = "Invalid XPath expression '" + xpath + "'";
    std::string detail = error_message(ctx->lastError);
    if (!detail.empty()) message += ": " + detail;
    throw XPathError(message);
  }
  if (result->type != XPATH_NODESET) {
    throw XPathError("XPath expression '" + xpath + "' does not select nodes");
  }
  std::vector<XmlNode> out;
  xmlNodeSetPtr nodes = result->nodesetval;
  if (!nodes) return out;
  out.reserve(static_cast<size_t>(nodes->nodeNr));
  for (int i = 0; i < nodes->nodeNr; ++i) {
    xmlNode* node = nodes->nodeTab[i];
    if (node && node->type == XML_ELEMENT_NODE) {
      out.emplace_back(node);
    }
  }
  return out;
}

}  // namespace schemediff::xml
