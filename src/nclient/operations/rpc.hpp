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

#include <atomic>
#include <condition_variable>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>

#include "nclient/config.hpp"
#include "nclient/operations/errors.hpp"
#include "nclient/transport/session.hpp"
#include "nclient/utilities.hpp"
#include "nclient/xml/element.hpp"

/// @brief Operations sent to the server as RPC requests and the replies to them
namespace nclient::operations {
  /// @brief An `rpc-error` reported in a reply
  class NCLIENT_LIB_API RPCError : public OperationError
  {
  public:
    /// @brief Create an error from an `rpc-error` element
    /// @param error the element
    explicit RPCError(const xml::ElementPtr &error);

    const std::string &getType() const { return m_type; }
    const std::string &getTag() const { return m_tag; }
    const std::string &getSeverity() const { return m_severity; }
    const std::string &getMessage() const { return m_message; }
    const xml::ElementPtr &getElement() const { return m_element; }

  protected:
    xml::ElementPtr m_element;
    std::string m_type;
    std::string m_tag;
    std::string m_severity;
    std::string m_message;
  };

  using RPCErrorPtr = std::shared_ptr<RPCError>;
  using RPCErrorList = std::list<RPCErrorPtr>;

  /// @brief A reply to an RPC request
  ///
  /// The raw document is kept and parsed the first time any view of the reply is requested.
  /// Subclasses extract operation specific content in `parsingHook()`.
  class NCLIENT_LIB_API RPCReply
  {
  public:
    /// @brief Create a reply
    /// @param raw the XML document received from the server
    RPCReply(const std::string &raw) : m_raw(raw) {}
    virtual ~RPCReply() = default;

    /// @brief Parse the reply if it has not been parsed
    /// @throws xml::XmlError if the document is not an `rpc-reply`
    void parse();
    bool isParsed() const { return m_parsed; }

    /// @brief `true` if the reply is `<ok/>`
    bool isOk()
    {
      parse();
      return m_ok;
    }
    /// @brief get all the errors in the reply
    const RPCErrorList &getErrors()
    {
      parse();
      return m_errors;
    }
    /// @brief get the first error
    /// @return the first error or `nullptr`
    RPCErrorPtr getError()
    {
      parse();
      if (m_errors.empty())
        return nullptr;
      return m_errors.front();
    }
    /// @brief get the parsed root element
    const xml::ElementPtr &getRoot()
    {
      parse();
      return m_root;
    }
    /// @brief get the raw document
    const std::string &getXml() const { return m_raw; }

  protected:
    /// @brief Called once after the reply is parsed
    /// @param root the `rpc-reply` element
    virtual void parsingHook(const xml::ElementPtr &root) {}

  protected:
    const std::string m_raw;
    std::mutex m_mutex;
    std::atomic_bool m_parsed {false};
    bool m_ok {false};
    RPCErrorList m_errors;
    xml::ElementPtr m_root;
  };

  using RPCReplyPtr = std::shared_ptr<RPCReply>;

  class ReplyListener;

  /// @brief Base class for operations
  ///
  /// An operation builds its request element, wraps it in an `rpc` element with a unique
  /// `message-id` and sends it over the session. The calling thread blocks until the reply
  /// with the same `message-id` is received, the session fails, or the timeout expires.
  class NCLIENT_LIB_API RPC
  {
  public:
    /// @brief Which `rpc-error`s in a reply are thrown
    enum class RaiseMode
    {
      NONE,    ///< never throw
      ERRORS,  ///< throw errors with severity `error`
      ALL      ///< throw errors with any severity
    };

    /// @brief Create an operation for a session
    /// @param session the session
    /// @param options configuration options: `Timeout`, `RaiseMode`, `Encoding`, and `Pretty`
    RPC(transport::SessionPtr session, const ConfigOptions &options = {});
    virtual ~RPC() = default;

    /// @brief get the message id of the current or next request
    ///
    /// A new id is generated for every request after the first.
    const std::string &getId() const { return m_id; }
    /// @brief get the reply to the last request
    /// @return the reply or `nullptr` if no reply was received
    RPCReplyPtr getReply();

    /// @brief Throws if the server does not have a capability
    /// @param capability the capability uri or abbreviation
    /// @throws MissingCapabilityError if the capability is not present
    void assertCapability(const std::string &capability) const;

    RaiseMode getRaiseMode() const { return m_raiseMode; }
    void setRaiseMode(RaiseMode mode) { m_raiseMode = mode; }
    Milliseconds getTimeout() const { return m_timeout; }
    void setTimeout(Milliseconds timeout) { m_timeout = timeout; }

    /// @name Reply delivery
    ///@{
    /// @brief Called by the reply listener with the reply document
    void deliverReply(const std::string &raw);
    /// @brief Called by the reply listener when the session fails
    void deliverError(const std::error_code &ec);
    ///@}

    /// @brief convert a raise mode string to the enumeration
    /// @param mode `none`, `errors`, or `all`
    /// @return the raise mode, `NONE` if the mode is not known
    static RaiseMode raiseModeFor(const std::string &mode);

  protected:
    /// @brief Create the reply for the received document
    /// @param raw the document
    /// @return the reply
    virtual RPCReplyPtr makeReply(const std::string &raw)
    {
      return std::make_shared<RPCReply>(raw);
    }

    /// @brief Wrap the operation in an `rpc` element
    xml::ElementPtr wrap(const xml::ElementPtr &operation) const;
    /// @brief Send the operation and wait for the reply
    /// @param operation the operation element
    /// @return the parsed reply
    /// @throws TimeoutExpiredError if no reply arrives within the timeout
    /// @throws SessionError if the session fails
    /// @throws RPCError depending on the raise mode
    RPCReplyPtr request(const xml::ElementPtr &operation);

  protected:
    transport::SessionPtr m_session;
    std::shared_ptr<ReplyListener> m_listener;
    std::string m_id;
    RaiseMode m_raiseMode;
    Milliseconds m_timeout;
    std::string m_encoding;
    bool m_pretty;

    std::mutex m_mutex;
    std::condition_variable m_event;
    RPCReplyPtr m_reply;
    std::optional<std::error_code> m_error;
    bool m_requested {false};
  };

  /// @brief Delivers replies received on a session to the waiting RPC
  ///
  /// Only the root element of each received document is parsed to find the `message-id`.
  class NCLIENT_LIB_API ReplyListener : public transport::SessionListener
  {
  public:
    ReplyListener() = default;
    ~ReplyListener() override = default;

    /// @brief get the listener for a session, creating it if there is none
    static std::shared_ptr<ReplyListener> forSession(const transport::SessionPtr &session);

    /// @brief Register an RPC waiting for a reply
    void registerRPC(RPC *rpc);
    /// @brief Remove an RPC that is no longer waiting
    void unregisterRPC(const std::string &id);
    /// @brief number of RPCs waiting for a reply
    size_t pending()
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      return m_pending.size();
    }

    void received(const std::string &raw) override;
    void failed(const std::error_code &ec) override;

  protected:
    std::mutex m_mutex;
    std::map<std::string, RPC *> m_pending;
  };
}  // namespace nclient::operations
