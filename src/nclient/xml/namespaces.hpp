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
#include <optional>
#include <string>

#include "nclient/config.hpp"

namespace nclient::xml {
  /// @name Well known namespaces
  ///@{

  /// @brief Base NETCONF namespace
  inline const std::string BASE_NS_1_0 = "urn:ietf:params:xml:ns:netconf:base:1.0";
  /// @brief Namespace for Tail-f core data model
  inline const std::string TAILF_AAA_1_1 = "http://tail-f.com/ns/aaa/1.1";
  /// @brief Namespace for Tail-f execd data model
  inline const std::string TAILF_EXECD_1_1 = "http://tail-f.com/ns/execd/1.1";
  /// @brief Namespace for Cisco data model
  inline const std::string CISCO_CPI_1_0 = "http://www.cisco.com/cpi_10/schema";
  /// @brief Namespace for Flowmon data model
  inline const std::string FLOWMON_1_0 = "http://www.liberouter.org/ns/netopeer/flowmon/1.0";
  ///@}

  /// @brief Preferred prefixes for namespace uris
  ///
  /// Only used when serializing so documents are readable. The prefixes have no
  /// effect on parsing or element equality.
  class NCLIENT_LIB_API NamespaceRegistry
  {
  public:
    NamespaceRegistry() = default;
    NamespaceRegistry(const NamespaceRegistry &) = default;
    ~NamespaceRegistry() = default;

    /// @brief Associate a prefix with a namespace uri
    ///
    /// The last registration for a uri wins. A prefix is only ever mapped to one uri, so
    /// registering a prefix again moves it to the new uri.
    ///
    /// @param prefix the prefix
    /// @param uri the namespace uri
    void registerNamespace(const std::string &prefix, const std::string &uri);

    /// @brief Get the registered prefix for a uri
    /// @param uri the namespace uri
    /// @return the prefix or `std::nullopt`
    std::optional<std::string> prefixFor(const std::string &uri) const;

    /// @brief check if a prefix is in use
    /// @param prefix the prefix
    /// @return `true` if some uri is registered with the prefix
    bool hasPrefix(const std::string &prefix) const;

    /// @brief get the uri to prefix map
    const auto &getNamespaces() const { return m_namespaces; }

    /// @brief The registry holding the well known namespaces
    /// @return a reference to the process wide, immutable registry
    static const NamespaceRegistry &defaults();

  protected:
    std::map<std::string, std::string> m_namespaces;
  };
}  // namespace nclient::xml
