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

#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>

#include "nclient/config.hpp"
#include "nclient/transport/capabilities.hpp"
#include "nclient/transport/error_code.hpp"

namespace nclient::transport {
  /// @brief Receives documents and failures from a session
  class NCLIENT_LIB_API SessionListener
  {
  public:
    virtual ~SessionListener() = default;

    /// @brief Called for every document received by the session
    /// @param raw the XML document
    virtual void received(const std::string &raw) = 0;
    /// @brief Called when the session fails
    /// @param ec the error code
    virtual void failed(const std::error_code &ec) = 0;
  };
  using SessionListenerPtr = std::shared_ptr<SessionListener>;

  /// @brief Abstract interface for a NETCONF session
  ///
  /// A concrete session sends documents over its transport and calls `dispatch()` with every
  /// document it receives and `failed()` when the transport fails.
  class NCLIENT_LIB_API Session : public std::enable_shared_from_this<Session>
  {
  public:
    Session() = default;
    /// @brief Create a session
    /// @param capabilities the capabilities of the server
    Session(const Capabilities &capabilities) : m_serverCapabilities(capabilities) {}
    virtual ~Session() = default;

    /// @name Session interface
    ///@{

    /// @brief Is the session connected
    /// @return `true` if it is connected
    virtual bool isConnected() const = 0;
    /// @brief Send a document to the server
    /// @param document the XML document
    /// @return an error code if the document could not be sent
    virtual std::error_code send(const std::string &document) = 0;
    /// @brief close the session
    virtual void close() = 0;
    ///@}

    /// @brief get the capabilities of the server
    const Capabilities &getServerCapabilities() const { return m_serverCapabilities; }
    /// @brief set the capabilities of the server
    void setServerCapabilities(const Capabilities &caps) { m_serverCapabilities = caps; }

    /// @name Listeners
    ///@{
    void addListener(SessionListenerPtr listener);
    void removeListener(const SessionListenerPtr &listener);

    /// @brief get the first listener of a type
    /// @tparam T the listener type
    /// @return the listener or `nullptr`
    template <typename T>
    std::shared_ptr<T> getListener()
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      for (auto &listener : m_listeners)
      {
        auto l = std::dynamic_pointer_cast<T>(listener);
        if (l)
          return l;
      }
      return nullptr;
    }
    ///@}

    /// @brief Deliver a received document to the listeners
    /// @param raw the XML document
    void dispatch(const std::string &raw);
    /// @brief Deliver a failure to the listeners
    /// @param ec the error code
    void failed(const std::error_code &ec);

  protected:
    std::list<SessionListenerPtr> listeners();

  protected:
    std::mutex m_mutex;
    std::list<SessionListenerPtr> m_listeners;
    Capabilities m_serverCapabilities;
  };

  using SessionPtr = std::shared_ptr<Session>;
}  // namespace nclient::transport
