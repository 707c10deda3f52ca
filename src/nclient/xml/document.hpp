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

/// @file document.hpp
/// @brief Methods for creating, parsing, and validating XML documents and elements

#pragma once

#include <list>
#include <set>
#include <string>

#include "nclient/config.hpp"
#include "nclient/xml/element.hpp"
#include "nclient/xml/namespaces.hpp"
#include "nclient/xml/qname.hpp"
#include "nclient/xml/xml_helper.hpp"

namespace nclient::xml {
  /// @brief The qualified tag and attributes of a document's root element
  struct NCLIENT_LIB_API RootDescriptor
  {
    QName m_tag;
    Attributes m_attributes;
  };

  /// @brief acceptable alternatives for a root tag
  using TagSet = std::set<std::string>;
  /// @brief a required attribute given as a set of acceptable alternative names
  using AttributeAlternatives = std::set<std::string>;
  /// @brief required attributes, every group must be satisfied by one of its alternatives
  using AttributeRequirements = std::list<AttributeAlternatives>;

  /// @brief Convert an element to an XML document
  ///
  /// Namespaces are declared on the root using the registry's prefix for the uri, or a
  /// generated `ns0`, `ns1`, ... prefix when there is none. The result always starts with
  /// exactly one XML declaration.
  ///
  /// @param element the element
  /// @param encoding character encoding
  /// @param pretty `true` to indent the output
  /// @param registry the namespace prefixes to use
  /// @return the document
  NCLIENT_LIB_API std::string toXml(const ElementPtr &element,
                                    const std::string &encoding = "UTF-8", bool pretty = false,
                                    const NamespaceRegistry &registry = NamespaceRegistry::defaults());

  /// @brief Make sure serialized XML starts with an XML declaration
  /// @param document the serialized XML
  /// @param encoding character encoding to declare if there is no declaration
  /// @return the document unchanged if it already has a declaration, otherwise prefixed
  NCLIENT_LIB_API std::string toXml(const std::string &document,
                                    const std::string &encoding = "UTF-8");

  /// @brief Convert an element to an element, returns the same element
  /// @param element the element
  /// @return `element`
  inline const ElementPtr &toElement(const ElementPtr &element) { return element; }

  /// @brief Parse an XML document to an element tree
  /// @param document the XML document
  /// @return the root element
  /// @throws XmlError if the document is not well formed
  NCLIENT_LIB_API ElementPtr toElement(const std::string &document);

  /// @brief Parse only the root element of an XML document
  ///
  /// Parsing stops as soon as the root element's open tag is read, the body of the document
  /// is neither read nor checked.
  ///
  /// @param raw the XML document
  /// @return the qualified tag and attributes of the root
  /// @throws XmlError if no root element open tag can be read
  NCLIENT_LIB_API RootDescriptor parseRoot(const std::string &raw);

  /// @brief Check that the root element of a document meets the supplied criteria
  /// @param element the element
  /// @param tags acceptable root tags, not checked if empty
  /// @param attrs required attributes, each a set of allowable alternatives
  /// @return the element
  /// @throws XmlError if the requirements are not met
  NCLIENT_LIB_API ElementPtr validatedElement(const ElementPtr &element, const TagSet &tags = {},
                                              const AttributeRequirements &attrs = {});

  /// @brief Parse a document and check that its root element meets the supplied criteria
  /// @param document the XML document
  /// @param tags acceptable root tags, not checked if empty
  /// @param attrs required attributes, each a set of allowable alternatives
  /// @return the root element
  /// @throws XmlError if the document cannot be parsed or the requirements are not met
  NCLIENT_LIB_API ElementPtr validatedElement(const std::string &document,
                                              const TagSet &tags = {},
                                              const AttributeRequirements &attrs = {});
}  // namespace nclient::xml
