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

#include <memory>
#include <optional>
#include <string>

#include "nclient/config.hpp"
#include "nclient/operations/rpc.hpp"
#include "nclient/operations/util.hpp"
#include "nclient/xml/element.hpp"

namespace nclient::operations {
  /// @brief Reply to `get` and `get-config` requests
  ///
  /// The `data` element is found when the reply is parsed. It is not set if the reply
  /// contains errors.
  class NCLIENT_LIB_API GetReply : public RPCReply
  {
  public:
    using RPCReply::RPCReply;

    /// @brief get the `data` element
    /// @return the element or `nullptr` if there is no data
    const xml::ElementPtr &getDataElement()
    {
      parse();
      return m_data;
    }
    /// @brief get the `data` element serialized as XML
    /// @return the document or an empty string if there is no data
    std::string getDataXml();
    /// @brief same as `getDataElement()`
    const xml::ElementPtr &getData() { return getDataElement(); }

  protected:
    void parsingHook(const xml::ElementPtr &root) override;

  protected:
    xml::ElementPtr m_data;
  };

  using GetReplyPtr = std::shared_ptr<GetReply>;

  /// @brief Retrieve running configuration and device state information
  class NCLIENT_LIB_API Get : public RPC
  {
  public:
    using RPC::RPC;

    /// @brief Build the `get` element
    /// @param filter portion of the data to retrieve, everything if not given
    /// @return the element
    xml::ElementPtr buildRequest(const std::optional<FilterSpec> &filter = std::nullopt) const;
    /// @brief Send the `get` request and wait for the reply
    /// @param filter portion of the data to retrieve, everything if not given
    /// @return the reply
    GetReplyPtr request(const std::optional<FilterSpec> &filter = std::nullopt);

  protected:
    RPCReplyPtr makeReply(const std::string &raw) override
    {
      return std::make_shared<GetReply>(raw);
    }
  };

  /// @brief Retrieve all or part of a configuration datastore
  class NCLIENT_LIB_API GetConfig : public RPC
  {
  public:
    using RPC::RPC;

    /// @brief Build the `get-config` element
    /// @param source the datastore name or a url if the server supports `:url`
    /// @param filter portion of the configuration to retrieve, everything if not given
    /// @return the element
    /// @throws MissingCapabilityError if the source is a url and `:url` is not supported
    xml::ElementPtr buildRequest(const std::string &source,
                                 const std::optional<FilterSpec> &filter = std::nullopt) const;
    /// @brief Send the `get-config` request and wait for the reply
    /// @param source the datastore name or url
    /// @param filter portion of the configuration to retrieve, everything if not given
    /// @return the reply
    GetReplyPtr request(const std::string &source,
                        const std::optional<FilterSpec> &filter = std::nullopt);

  protected:
    RPCReplyPtr makeReply(const std::string &raw) override
    {
      return std::make_shared<GetReply>(raw);
    }
  };
}  // namespace nclient::operations
