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

#include "element.hpp"

using namespace std;

namespace nclient::xml {
  ElementPtr Element::find(const std::string &tag) const
  {
    for (const auto &child : m_children)
    {
      if (child->getTag() == tag)
        return child;
    }
    return nullptr;
  }

  ElementList Element::findAll(const std::string &tag) const
  {
    ElementList list;
    for (const auto &child : m_children)
    {
      if (child->getTag() == tag)
        list.emplace_back(child);
    }
    return list;
  }

  void Element::iterate(const std::optional<std::string> &tag,
                        const std::function<void(const ElementPtr &)> &fun) const
  {
    if (!tag || m_tag == *tag)
      fun(getptr());

    for (const auto &child : m_children)
      child->iterate(tag, fun);
  }

  bool Element::operator==(const Element &other) const
  {
    if (m_tag != other.m_tag || m_attributes != other.m_attributes || m_text != other.m_text ||
        m_tail != other.m_tail || m_children.size() != other.m_children.size())
      return false;

    auto it = other.m_children.begin();
    for (const auto &child : m_children)
    {
      if (*child != **it)
        return false;
      it++;
    }

    return true;
  }
}  // namespace nclient::xml
