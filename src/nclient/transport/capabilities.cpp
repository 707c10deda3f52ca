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

#include "capabilities.hpp"

#include <boost/algorithm/string.hpp>

#include <vector>

using namespace std;

namespace nclient::transport {
  StringList Capabilities::abbreviate(const std::string &uri)
  {
    StringList list;
    string base = uri.substr(0, uri.find('?'));
    if (!starts_with(base, "urn:ietf:params:netconf:"))
      return list;

    vector<string> parts;
    boost::split(parts, base, boost::is_any_of(":"));
    if (parts.size() == 7 && parts[4] == "capability")
    {
      list.emplace_back(":" + parts[5]);
      list.emplace_back(":" + parts[5] + ":" + parts[6]);
    }
    else if (parts.size() == 6 && parts[4] == "base")
    {
      list.emplace_back(":base");
      list.emplace_back(":base:" + parts[5]);
    }

    return list;
  }

  void Capabilities::add(const std::string &uri) { m_capabilities[uri] = abbreviate(uri); }

  bool Capabilities::has(const std::string &key) const
  {
    if (m_capabilities.count(key) > 0)
      return true;

    for (const auto &cap : m_capabilities)
    {
      for (const auto &abbr : cap.second)
      {
        if (abbr == key)
          return true;
      }
    }

    return false;
  }

  StringList Capabilities::getUris() const
  {
    StringList uris;
    for (const auto &cap : m_capabilities)
      uris.emplace_back(cap.first);
    return uris;
  }
}  // namespace nclient::transport
