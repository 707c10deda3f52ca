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

#pragma once

#include <functional>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "nclient/config.hpp"
#include "nclient/xml/qname.hpp"

namespace nclient::xml {
  class Element;
  using ElementPtr = std::shared_ptr<Element>;
  using ElementList = std::list<ElementPtr>;
  /// @brief attribute name to value, namespaced attribute names are in `{ns}local` form
  using Attributes = std::map<std::string, std::string>;

  /// @brief A namespace qualified XML element
  ///
  /// Elements form a tree where a parent exclusively owns its children. The order of the
  /// children is preserved through serialization and parsing. The text is the character
  /// content before the first child and the tail is the content following the element's
  /// end tag up to the next sibling.
  class NCLIENT_LIB_API Element : public std::enable_shared_from_this<Element>
  {
  public:
    /// @brief Create an element
    /// @param tag qualified tag of the element
    /// @param attributes the attributes
    Element(const std::string &tag, const Attributes &attributes = {})
      : m_tag(tag), m_attributes(attributes)
    {}
    Element(const Element &) = delete;
    ~Element() = default;

    /// @brief Get a shared pointer
    /// @return shared pointer to the element
    ElementPtr getptr() const { return const_cast<Element *>(this)->shared_from_this(); }

    /// @name Tag and attributes
    ///@{
    const QName &getTag() const { return m_tag; }
    void setTag(const std::string &tag) { m_tag = tag; }

    const Attributes &getAttributes() const { return m_attributes; }
    /// @brief get an attribute value
    /// @param name the attribute name
    /// @return the value or `std::nullopt` if it is not present
    std::optional<std::string> getAttribute(const std::string &name) const
    {
      auto it = m_attributes.find(name);
      if (it != m_attributes.end())
        return it->second;
      else
        return std::nullopt;
    }
    bool hasAttribute(const std::string &name) const { return m_attributes.count(name) > 0; }
    void setAttribute(const std::string &name, const std::string &value)
    {
      m_attributes.insert_or_assign(name, value);
    }
    ///@}

    /// @name Character content
    ///@{
    const std::optional<std::string> &getText() const { return m_text; }
    void setText(const std::optional<std::string> &text) { m_text = text; }
    const std::optional<std::string> &getTail() const { return m_tail; }
    void setTail(const std::optional<std::string> &tail) { m_tail = tail; }
    ///@}

    /// @name Children
    ///@{
    const ElementList &getChildren() const { return m_children; }
    /// @brief append a child to the end of the children
    /// @param child the child element
    void append(ElementPtr child) { m_children.emplace_back(std::move(child)); }
    /// @brief the number of children
    size_t size() const { return m_children.size(); }
    bool empty() const { return m_children.empty(); }

    /// @brief find the first direct child with a tag
    /// @param tag the qualified tag
    /// @return the child or `nullptr`
    ElementPtr find(const std::string &tag) const;
    /// @brief find all the direct children with a tag
    /// @param tag the qualified tag
    /// @return the children in document order
    ElementList findAll(const std::string &tag) const;
    /// @brief visit this element and all descendants in document order
    /// @param tag only visit elements with this tag, all elements if `std::nullopt`
    /// @param fun called for each matching element
    void iterate(const std::optional<std::string> &tag,
                 const std::function<void(const ElementPtr &)> &fun) const;
    ///@}

    /// @brief structural equality
    ///
    /// Compares the tag, attributes, text, tail and the children in order.
    bool operator==(const Element &other) const;
    bool operator!=(const Element &other) const { return !(*this == other); }

  protected:
    QName m_tag;
    Attributes m_attributes;
    std::optional<std::string> m_text;
    std::optional<std::string> m_tail;
    ElementList m_children;
  };

  /// @brief Create a new element
  /// @param tag the qualified tag
  /// @param attributes the attributes
  /// @return shared pointer to the element
  inline ElementPtr newElement(const std::string &tag, const Attributes &attributes = {})
  {
    return std::make_shared<Element>(tag, attributes);
  }

  /// @brief Create an element and append it to a parent
  /// @param parent the parent element
  /// @param tag the qualified tag
  /// @param attributes the attributes
  /// @return the new child
  inline ElementPtr subElement(const ElementPtr &parent, const std::string &tag,
                               const Attributes &attributes = {})
  {
    auto child = newElement(tag, attributes);
    parent->append(child);
    return child;
  }
}  // namespace nclient::xml
