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

#include <map>
#include <string>

#include "nclient/config.hpp"
#include "nclient/utilities.hpp"

namespace nclient::transport {
  /// @brief A set of capability uris
  ///
  /// Membership can be checked with the full uri or an abbreviation. The capability
  /// `urn:ietf:params:netconf:capability:url:1.0` can be checked as `:url` or `:url:1.0`
  /// and `urn:ietf:params:netconf:base:1.1` as `:base` or `:base:1.1`.
  class NCLIENT_LIB_API Capabilities
  {
  public:
    Capabilities() = default;
    /// @brief Create a capability set from a list of uris
    /// @param uris the capability uris
    Capabilities(const StringList &uris)
    {
      for (const auto &uri : uris)
        add(uri);
    }

    /// @brief add a capability
    /// @param uri the capability uri
    void add(const std::string &uri);
    /// @brief remove a capability
    /// @param uri the capability uri
    void remove(const std::string &uri) { m_capabilities.erase(uri); }
    /// @brief check for a capability
    /// @param key the uri or one of its abbreviations
    /// @return `true` if the capability is in the set
    bool has(const std::string &key) const;

    size_t size() const { return m_capabilities.size(); }
    bool empty() const { return m_capabilities.empty(); }
    /// @brief get the capability uris
    StringList getUris() const;

    /// @brief get the abbreviations for a capability uri
    /// @param uri the uri
    /// @return the abbreviations, empty if the uri is not a NETCONF capability
    static StringList abbreviate(const std::string &uri);

  protected:
    std::map<std::string, StringList> m_capabilities;
  };
}  // namespace nclient::transport
