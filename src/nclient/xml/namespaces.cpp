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

#include "namespaces.hpp"

#include "nclient/logging.hpp"

using namespace std;

namespace nclient::xml {
  void NamespaceRegistry::registerNamespace(const std::string &prefix, const std::string &uri)
  {
    for (auto it = m_namespaces.begin(); it != m_namespaces.end();)
    {
      if (it->first != uri && it->second == prefix)
      {
        LOG(debug) << "Prefix " << prefix << " moved from " << it->first << " to " << uri;
        it = m_namespaces.erase(it);
      }
      else
      {
        it++;
      }
    }

    auto [it, inserted] = m_namespaces.try_emplace(uri, prefix);
    if (!inserted && it->second != prefix)
    {
      LOG(debug) << "Namespace " << uri << " prefix changed from " << it->second << " to "
                 << prefix;
      it->second = prefix;
    }
  }

  std::optional<std::string> NamespaceRegistry::prefixFor(const std::string &uri) const
  {
    auto it = m_namespaces.find(uri);
    if (it != m_namespaces.end())
      return it->second;
    else
      return nullopt;
  }

  bool NamespaceRegistry::hasPrefix(const std::string &prefix) const
  {
    for (const auto &ns : m_namespaces)
    {
      if (ns.second == prefix)
        return true;
    }
    return false;
  }

  const NamespaceRegistry &NamespaceRegistry::defaults()
  {
    static const NamespaceRegistry registry = [] {
      NamespaceRegistry r;
      r.registerNamespace("nc", BASE_NS_1_0);
      r.registerNamespace("aaa", TAILF_AAA_1_1);
      r.registerNamespace("execd", TAILF_EXECD_1_1);
      r.registerNamespace("cpi", CISCO_CPI_1_0);
      r.registerNamespace("fm", FLOWMON_1_0);
      return r;
    }();

    return registry;
  }
}  // namespace nclient::xml
