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

#include "util.hpp"

#include "nclient/logging.hpp"
#include "nclient/utilities.hpp"
#include "nclient/xml/document.hpp"

using namespace std;

namespace nclient::operations {
  using namespace xml;

  static ElementPtr criteriaFilter(const FilterCriteria &filter, const CapabilityCheck &capcheck)
  {
    auto node = newElement(qualify("filter"), {{"type", filter.m_type}});
    if (filter.m_type == "subtree")
    {
      visit(overloaded {[&node](const string &text) { node->append(toElement(text)); },
                        [&node](const ElementPtr &element) {
                          if (!element)
                            throw OperationError("Subtree filter requires criteria");
                          node->append(element);
                        }},
            filter.m_criteria);
    }
    else if (filter.m_type == "xpath")
    {
      if (!holds_alternative<string>(filter.m_criteria))
        throw OperationError("XPath filter criteria must be an expression");
      if (capcheck)
        capcheck(":xpath");
      node->setAttribute("select", get<string>(filter.m_criteria));
    }
    else
    {
      LOG(debug) << "Invalid filter type: " << filter.m_type;
      throw OperationError("Invalid filter type");
    }

    return node;
  }

  ElementPtr buildFilter(const FilterSpec &spec, const CapabilityCheck &capcheck)
  {
    NAMED_SCOPE("operations.util");

    static const TagSet tags {"filter", qualify("filter")};
    static const AttributeRequirements required {{"type"}};

    return visit(overloaded {[&capcheck](const FilterCriteria &filter) {
                               return criteriaFilter(filter, capcheck);
                             },
                             [](const ElementPtr &element) {
                               return validatedElement(element, tags, required);
                             },
                             [](const string &text) {
                               return validatedElement(text, tags, required);
                             }},
                 spec);
  }

  ElementPtr datastoreOrUrl(const string &name, const string &location,
                            const CapabilityCheck &capcheck)
  {
    auto node = newElement(qualify(name));
    if (location.find("://") != string::npos)
    {
      if (capcheck)
        capcheck(":url");
      auto url = subElement(node, qualify("url"));
      url->setText(location);
    }
    else
    {
      subElement(node, qualify(location));
    }

    return node;
  }
}  // namespace nclient::operations
