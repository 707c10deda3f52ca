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

#include "retrieve.hpp"

#include "nclient/xml/document.hpp"

using namespace std;

namespace nclient::operations {
  using namespace xml;

  void GetReply::parsingHook(const ElementPtr &root)
  {
    if (m_errors.empty())
      m_data = root->find(qualify("data"));
    else
      m_data.reset();
  }

  string GetReply::getDataXml()
  {
    auto &data = getDataElement();
    if (!data)
      return "";
    return toXml(data);
  }

  ElementPtr Get::buildRequest(const optional<FilterSpec> &filter) const
  {
    auto node = newElement(qualify("get"));
    if (filter)
      node->append(buildFilter(*filter, [this](const string &cap) { assertCapability(cap); }));
    return node;
  }

  GetReplyPtr Get::request(const optional<FilterSpec> &filter)
  {
    return dynamic_pointer_cast<GetReply>(RPC::request(buildRequest(filter)));
  }

  ElementPtr GetConfig::buildRequest(const string &source, const optional<FilterSpec> &filter) const
  {
    auto capcheck = [this](const string &cap) { assertCapability(cap); };
    auto node = newElement(qualify("get-config"));
    node->append(datastoreOrUrl("source", source, capcheck));
    if (filter)
      node->append(buildFilter(*filter, capcheck));
    return node;
  }

  GetReplyPtr GetConfig::request(const string &source, const optional<FilterSpec> &filter)
  {
    return dynamic_pointer_cast<GetReply>(RPC::request(buildRequest(source, filter)));
  }
}  // namespace nclient::operations
