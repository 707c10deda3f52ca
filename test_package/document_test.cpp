//
// Copyright Copyright 2009-2024, AMT – The Association For Manufacturing Technology (“AMT”)
// All rights reserved.
//
//    Licensed under the Apache License, Version 2.0 (the "License");
//    you may not use this file except in compliance with the License.
//    You may obtain a copy of the License at
//
//       http://www.apache.org/licenses/LICENSE-2.0
//
//    Unless required by applicable law or agreed to in writing, software
//    distributed under the License is distributed on an "AS IS" BASIS,
//    WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//    See the License for the specific language governing permissions and
//    limitations under the License.
//

// Ensure that gtest is the first header otherwise Windows raises an error
#include <gtest/gtest.h>
// Keep this comment to keep gtest.h above. (clang-format off/on is not working here!)

#include <string>

#include "nclient/utilities.hpp"
#include "nclient/xml/document.hpp"

using namespace std;
using namespace nclient;
using namespace nclient::xml;

// main
int main(int argc, char *argv[])
{
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

static const string DECL = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>";

class DocumentTest : public testing::Test
{
protected:
  static size_t count(const string &text, const string &pattern)
  {
    size_t n = 0;
    for (auto pos = text.find(pattern); pos != string::npos; pos = text.find(pattern, pos + 1))
      n++;
    return n;
  }
};

TEST_F(DocumentTest, should_serialize_with_one_declaration)
{
  auto get = newElement(qualify("get"));
  auto xml = toXml(get);

  ASSERT_EQ(DECL + "<nc:get xmlns:nc=\"urn:ietf:params:xml:ns:netconf:base:1.0\"/>", xml);
  ASSERT_EQ(1, count(xml, "<?xml"));
}

TEST_F(DocumentTest, should_declare_the_requested_encoding)
{
  auto get = newElement(qualify("get"));
  auto xml = toXml(get, "ISO-8859-1");

  ASSERT_TRUE(starts_with(xml, "<?xml version=\"1.0\" encoding=\"ISO-8859-1\"?><nc:get"));
  ASSERT_EQ(1, count(xml, "<?xml"));
}

TEST_F(DocumentTest, should_reject_an_unknown_encoding)
{
  auto get = newElement(qualify("get"));
  ASSERT_THROW(toXml(get, "NOT-AN-ENCODING"), XmlError);
}

TEST_F(DocumentTest, should_not_add_a_second_declaration_to_text)
{
  string doc = "<?xml version=\"1.0\" encoding=\"UTF-8\"?><a/>";
  ASSERT_EQ(doc, toXml(doc));
  ASSERT_EQ(doc, toXml(toXml(doc)));
  ASSERT_EQ(DECL + "<a/>", toXml(string("<a/>")));
}

TEST_F(DocumentTest, should_serialize_text_tail_and_attributes)
{
  auto root = newElement("config", {{"b", "2"}, {"a", "1 & 2"}});
  root->setText("start");
  auto child = subElement(root, "item");
  child->setText("value");
  child->setTail("after");
  root->setTail("never written");

  ASSERT_EQ(DECL +
                "<config a=\"1 &amp; 2\" b=\"2\">start<item>value</item>after</config>",
            toXml(root));
}

TEST_F(DocumentTest, should_declare_attribute_namespaces)
{
  auto root = newElement(qualify("edit", "http://example.com/ns"),
                         {{qualify("operation"), "merge"}});

  auto xml = toXml(root);
  ASSERT_EQ(DECL +
                "<ns0:edit xmlns:nc=\"urn:ietf:params:xml:ns:netconf:base:1.0\" "
                "xmlns:ns0=\"http://example.com/ns\" nc:operation=\"merge\"/>",
            xml);
}

TEST_F(DocumentTest, should_return_the_same_element)
{
  auto element = newElement("x");
  ASSERT_EQ(element.get(), toElement(element).get());
}

TEST_F(DocumentTest, should_parse_a_document_into_elements)
{
  auto root = toElement(R"DOC(<?xml version="1.0"?>
<rpc-reply xmlns="urn:ietf:params:xml:ns:netconf:base:1.0" message-id="7">
  <!-- comment -->
  <data><top xmlns="http://example.com/top" id="a&amp;b"><![CDATA[<raw>]]></top></data>
</rpc-reply>)DOC");

  ASSERT_EQ(qualify("rpc-reply"), root->getTag());
  ASSERT_EQ("7", *root->getAttribute("message-id"));

  auto data = root->find(qualify("data"));
  ASSERT_TRUE(data);
  // Text on both sides of the comment
  ASSERT_EQ("\n  \n  ", *root->getText());
  ASSERT_EQ("\n", *data->getTail());

  auto top = data->find(qualify("top", "http://example.com/top"));
  ASSERT_TRUE(top);
  ASSERT_EQ("a&b", *top->getAttribute("id"));
  ASSERT_EQ("<raw>", *top->getText());
}

TEST_F(DocumentTest, should_expand_internal_entities_into_text)
{
  auto root = toElement("<!DOCTYPE a [<!ENTITY e \"hello\">]><a>x&e;y<b/>&e;z</a>");

  ASSERT_EQ("xhelloy", *root->getText());
  auto b = root->find("b");
  ASSERT_TRUE(b);
  ASSERT_EQ("helloz", *b->getTail());
}

TEST_F(DocumentTest, should_round_trip_a_tree)
{
  auto root = newElement(qualify("get-config"));
  auto source = subElement(root, qualify("source"));
  subElement(source, qualify("running"));
  auto filter = subElement(root, qualify("filter"), {{"type", "subtree"}});
  auto top = subElement(filter, qualify("top", "http://example.com/top"));
  top->setText("text");
  top->setTail(" ");

  auto parsed = toElement(toXml(root));
  ASSERT_EQ(*root, *parsed);
  ASSERT_EQ(toXml(root), toXml(parsed));
}

TEST_F(DocumentTest, should_raise_error_for_malformed_document)
{
  try
  {
    toElement("<a><b></a>");
    FAIL() << "Expected XmlError";
  }
  catch (XmlError &e)
  {
    ASSERT_TRUE(e.getTag().empty());
    ASSERT_TRUE(starts_with(e.what(), "Cannot parse XML document"));
  }
}

TEST_F(DocumentTest, should_parse_only_the_root)
{
  auto root = parseRoot("<a xmlns=\"NS\" x=\"1\"><b/></a>");
  ASSERT_EQ("{NS}a", root.m_tag);
  ASSERT_EQ(1, root.m_attributes.size());
  ASSERT_EQ("1", root.m_attributes["x"]);
}

TEST_F(DocumentTest, should_parse_root_of_malformed_body)
{
  auto root = parseRoot(
      "<?xml version=\"1.0\"?><rpc-reply xmlns=\"urn:ietf:params:xml:ns:netconf:base:1.0\" "
      "message-id=\"42\"><data><unclosed></data>");
  ASSERT_EQ(qualify("rpc-reply"), root.m_tag);
  ASSERT_EQ("42", root.m_attributes["message-id"]);
}

TEST_F(DocumentTest, should_parse_root_of_a_large_document)
{
  string body;
  for (int i = 0; i < 2000; i++)
    body += "<item>" + to_string(i) + "</item>";
  string padding(5000, ' ');

  auto root = parseRoot("<?xml version=\"1.0\"?>" + padding + "<big a=\"&amp;\">" + body + "</big>");
  ASSERT_EQ("big", root.m_tag);
  ASSERT_EQ("&", root.m_attributes["a"]);
}

TEST_F(DocumentTest, should_qualify_root_attributes)
{
  auto root = parseRoot("<a xmlns:p=\"urn:p\" p:x=\"1\" y=\"2\"/>");
  ASSERT_EQ("a", root.m_tag);
  ASSERT_EQ("1", root.m_attributes["{urn:p}x"]);
  ASSERT_EQ("2", root.m_attributes["y"]);
}

TEST_F(DocumentTest, should_raise_error_without_a_root)
{
  ASSERT_THROW(parseRoot(""), XmlError);
  ASSERT_THROW(parseRoot("<?xml version=\"1.0\"?>"), XmlError);
  ASSERT_THROW(parseRoot("not xml"), XmlError);
}

TEST_F(DocumentTest, should_validate_the_root_tag)
{
  auto reply = newElement("rpc-reply");
  ASSERT_EQ(reply, validatedElement(reply, {"rpc-reply"}));

  auto other = newElement("rpc-error-reply");
  try
  {
    validatedElement(other, {"rpc-reply"});
    FAIL() << "Expected XmlError";
  }
  catch (XmlError &e)
  {
    ASSERT_EQ("rpc-error-reply", e.getTag());
    ASSERT_EQ("rpc-error-reply: Element does not meet requirement", string(e.what()));
  }
}

TEST_F(DocumentTest, should_accept_any_tag_when_no_tags_given)
{
  auto element = newElement("anything");
  ASSERT_EQ(element, validatedElement(element));
}

TEST_F(DocumentTest, should_validate_required_attribute_alternatives)
{
  auto withId = newElement("rpc-reply", {{"message-id", "1"}});
  auto withAlt = newElement("rpc-reply", {{"id", "1"}});
  auto without = newElement("rpc-reply", {{"other", "1"}});

  AttributeRequirements reqs {{"message-id", "id"}};
  ASSERT_NO_THROW(validatedElement(withId, {}, reqs));
  ASSERT_NO_THROW(validatedElement(withAlt, {}, reqs));
  ASSERT_THROW(validatedElement(without, {}, reqs), XmlError);

  AttributeRequirements both {{"message-id"}, {"other"}};
  ASSERT_THROW(validatedElement(withId, {}, both), XmlError);
  auto all = newElement("rpc-reply", {{"message-id", "1"}, {"other", "2"}});
  ASSERT_NO_THROW(validatedElement(all, {}, both));
}

TEST_F(DocumentTest, should_validate_a_document)
{
  auto element = validatedElement(
      string("<rpc-reply xmlns=\"urn:ietf:params:xml:ns:netconf:base:1.0\"><ok/></rpc-reply>"),
      {qualify("rpc-reply")});
  ASSERT_TRUE(element->find(qualify("ok")));

  ASSERT_THROW(validatedElement(string("<rpc-reply><ok/></rpc-reply>"), {qualify("rpc-reply")}),
               XmlError);
  ASSERT_THROW(validatedElement(string("<broken"), {qualify("rpc-reply")}), XmlError);
}
