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
#include <string>
#include <variant>

#include "nclient/config.hpp"
#include "nclient/operations/errors.hpp"
#include "nclient/xml/element.hpp"

namespace nclient::operations {
  /// @brief Called with a capability the operation requires, throws if it is missing
  using CapabilityCheck = std::function<void(const std::string &)>;

  /// @brief A filter given as a type and its criteria
  ///
  /// A `subtree` filter takes an element or XML text, an `xpath` filter takes the
  /// select expression.
  struct NCLIENT_LIB_API FilterCriteria
  {
    std::string m_type;
    std::variant<std::string, xml::ElementPtr> m_criteria;
  };

  /// @brief A filter as criteria, a prebuilt `filter` element, or its XML text
  using FilterSpec = std::variant<FilterCriteria, xml::ElementPtr, std::string>;

  /// @brief Build a `filter` element
  /// @param spec the filter
  /// @param capcheck called for capabilities the filter requires
  /// @return the `filter` element
  /// @throws OperationError if the filter type is not `subtree` or `xpath`
  /// @throws xml::XmlError if a prebuilt filter is not a valid `filter` element
  NCLIENT_LIB_API xml::ElementPtr buildFilter(const FilterSpec &spec,
                                              const CapabilityCheck &capcheck = nullptr);

  /// @brief Build the element naming a datastore or url source or target
  /// @param name the element name, for example `source`
  /// @param location a datastore name such as `running` or a url
  /// @param capcheck called with `:url` when the location is a url
  /// @return the element
  NCLIENT_LIB_API xml::ElementPtr datastoreOrUrl(const std::string &name,
                                                 const std::string &location,
                                                 const CapabilityCheck &capcheck = nullptr);
}  // namespace nclient::operations
