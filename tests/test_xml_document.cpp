#include <exception>

#include "schemediff/schemediff.h"
#include "test_harness.h"
#include "xml/xml_document.h"

namespace {

using schemediff::xml::XmlDocument;
using schemediff::xml::XmlNodeKind;

const char* kSample =
    "<root>"
    "<item id='a' label='first'>text<child/><!-- note --><child name='x'/></item>"
    "<item id='b'/>"
    "<other/>"
    "</root>";

void test_query_document_order() {
  auto doc = XmlDocument::parse(kSample, "sample");
  auto items = doc.query("/root/item");
  expect_eq(items.size(), 2, "two item nodes");
  if (items.size() == 2) {
    expect_true(items[0].attribute("id") == std::string("a"), "first item in document order");
    expect_true(items[1].attribute("id") == std::string("b"), "second item in document order");
  }
}

void test_query_no_match_is_empty() {
  auto doc = XmlDocument::parse(kSample, "sample");
  expect_eq(doc.query("/root/missing").size(), 0, "no match yields empty sequence");
}

void test_attribute_absent() {
  auto doc = XmlDocument::parse(kSample, "sample");
  auto items = doc.query("/root/item");
  expect_true(!items.empty() && !items[0].attribute("missing").has_value(), "absent attribute is nullopt");
  expect_true(!items.empty() && items[0].attribute_or_empty("missing").empty(), "absent attribute defaults to empty");
  expect_eq(items.empty() ? 0 : items[0].attributes().size(), 2, "attributes copied into map");
}

void test_children_include_non_elements() {
  auto doc = XmlDocument::parse(kSample, "sample");
  auto items = doc.query("/root/item");
  if (items.empty()) {
    expect_true(false, "item present");
    return;
  }
  auto all = items[0].children();
  expect_eq(all.size(), 4, "text, element, comment, element");
  if (all.size() == 4) {
    expect_true(all[0].kind() == XmlNodeKind::Text, "text node kind");
    expect_true(all[2].kind() == XmlNodeKind::Other, "comment node kind");
  }
  auto elements = items[0].children(schemediff::xml::is_element());
  expect_eq(elements.size(), 2, "element filter");
  if (elements.size() == 2) {
    expect_true(elements[1].attribute("name") == std::string("x"), "element order preserved");
  }
}

void test_first_child_by_name() {
  auto doc = XmlDocument::parse(kSample, "sample");
  auto items = doc.query("/root/item");
  if (items.size() != 2) {
    expect_true(false, "items present");
    return;
  }
  auto child = items[0].first_child(schemediff::xml::is_element_named("child"));
  expect_true(child.has_value() && child->name() == "child", "first child found");
  expect_true(child.has_value() && !child->attribute("name").has_value(), "first match, not last");
  expect_true(!items[1].first_child(schemediff::xml::is_element_named("child")).has_value(),
              "no child on empty element");
}

void test_malformed_xml_throws() {
  bool threw = false;
  try {
    XmlDocument::parse("<root><unclosed></root>", "broken.xml");
  } catch (const schemediff::XmlParseError& ex) {
    threw = std::string(ex.what()).find("broken.xml") != std::string::npos;
  }
  expect_true(threw, "malformed XML raises XmlParseError naming the source");
}

void test_empty_document_throws() {
  bool threw = false;
  try {
    XmlDocument::parse("", "empty.xml");
  } catch (const schemediff::XmlParseError&) {
    threw = true;
  }
  expect_true(threw, "empty input raises XmlParseError");
}

void test_malformed_xpath_throws() {
  auto doc = XmlDocument::parse(kSample, "sample");
  bool threw = false;
  try {
    doc.query("/root/[");
  } catch (const schemediff::XPathError&) {
    threw = true;
  }
  expect_true(threw, "malformed XPath raises XPathError");
}

void test_non_nodeset_xpath_throws() {
  auto doc = XmlDocument::parse(kSample, "sample");
  bool threw = false;
  try {
    doc.query("count(/root/item)");
  } catch (const schemediff::XPathError&) {
    threw = true;
  }
  expect_true(threw, "numeric XPath result raises XPathError");
}

void test_prefixed_names_qualified() {
  auto doc = XmlDocument::parse(
      "<root xmlns:x='urn:extra'><item name='plain' x:name='shadow'><x:value/><value/></item></root>",
      "ns");
  auto items = doc.query("/root/item");
  if (items.size() != 1) {
    expect_true(false, "item present");
    return;
  }
  expect_true(items[0].attribute("name") == std::string("plain"), "plain attribute untouched");
  expect_true(items[0].attribute("x:name") == std::string("shadow"), "prefixed attribute keyed by qualified name");
  auto children = items[0].children(schemediff::xml::is_element());
  expect_true(children.size() == 2 && children[0].name() == "x:value", "element name carries prefix");
  expect_eq(items[0].children(schemediff::xml::is_element_named("value")).size(), 1,
            "prefixed element does not match plain tag");
}

}  // namespace

void register_xml_document_tests(std::vector<TestCase>& tests) {
  tests.push_back({"xml_query_document_order", test_query_document_order});
  tests.push_back({"xml_query_no_match_is_empty", test_query_no_match_is_empty});
  tests.push_back({"xml_attribute_absent", test_attribute_absent});
  tests.push_back({"xml_children_include_non_elements", test_children_include_non_elements});
  tests.push_back({"xml_first_child_by_name", test_first_child_by_name});
  tests.push_back({"xml_malformed_xml_throws", test_malformed_xml_throws});
  tests.push_back({"xml_empty_document_throws", test_empty_document_throws});
  tests.push_back({"xml_malformed_xpath_throws", test_malformed_xpath_throws});
  tests.push_back({"xml_non_nodeset_xpath_throws", test_non_nodeset_xpath_throws});
  tests.push_back({"xml_prefixed_names_qualified", test_prefixed_names_qualified});
}
