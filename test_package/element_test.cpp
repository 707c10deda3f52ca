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
#include <vector>

#include "nclient/xml/element.hpp"

using namespace std;
using namespace nclient::xml;

// main
int main(int argc, char *argv[])
{
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

class ElementTest : public testing::Test
{
protected:
  void SetUp() override
  {
    m_root = newElement(qualify("rpc-reply"), {{"message-id", "101"}});
    auto data = subElement(m_root, qualify("data"));
    auto a = subElement(data, "interface", {{"name", "eth0"}});
    a->setText("up");
    subElement(data, "interface", {{"name", "eth1"}});
    subElement(data, "route");
  }

  void TearDown() override { m_root.reset(); }

  ElementPtr m_root;
};

TEST_F(ElementTest, should_build_a_tree_with_sub_elements)
{
  ASSERT_EQ(qualify("rpc-reply"), m_root->getTag());
  ASSERT_EQ("101", *m_root->getAttribute("message-id"));
  ASSERT_FALSE(m_root->getAttribute("other"));
  ASSERT_EQ(1, m_root->size());

  auto data = m_root->getChildren().front();
  ASSERT_EQ(3, data->size());
  ASSERT_EQ(data, data->getptr());
}

TEST_F(ElementTest, should_find_direct_children)
{
  ASSERT_FALSE(m_root->find("interface"));

  auto data = m_root->find(qualify("data"));
  ASSERT_TRUE(data);

  auto first = data->find("interface");
  ASSERT_TRUE(first);
  ASSERT_EQ("eth0", *first->getAttribute("name"));
  ASSERT_EQ("up", *first->getText());

  auto all = data->findAll("interface");
  ASSERT_EQ(2, all.size());
  ASSERT_EQ("eth1", *all.back()->getAttribute("name"));

  ASSERT_TRUE(data->findAll("missing").empty());
}

TEST_F(ElementTest, should_iterate_in_document_order)
{
  vector<string> tags;
  m_root->iterate(nullopt, [&tags](const ElementPtr &e) { tags.emplace_back(e->getTag()); });

  vector<string> expected {qualify("rpc-reply"), qualify("data"), "interface", "interface",
                           "route"};
  ASSERT_EQ(expected, tags);

  int count = 0;
  m_root->iterate(string("interface"), [&count](const ElementPtr &) { count++; });
  ASSERT_EQ(2, count);
}

TEST_F(ElementTest, should_compare_structurally)
{
  auto other = newElement(qualify("rpc-reply"), {{"message-id", "101"}});
  auto data = subElement(other, qualify("data"));
  auto a = subElement(data, "interface", {{"name", "eth0"}});
  a->setText("up");
  subElement(data, "interface", {{"name", "eth1"}});
  auto route = subElement(data, "route");

  ASSERT_EQ(*m_root, *other);

  route->setTail("\n");
  ASSERT_NE(*m_root, *other);
  route->setTail(nullopt);
  ASSERT_EQ(*m_root, *other);

  other->setAttribute("message-id", "102");
  ASSERT_NE(*m_root, *other);
}

TEST_F(ElementTest, should_keep_child_order_significant)
{
  auto a = newElement("a");
  subElement(a, "x");
  subElement(a, "y");

  auto b = newElement("a");
  subElement(b, "y");
  subElement(b, "x");

  ASSERT_NE(*a, *b);
}
