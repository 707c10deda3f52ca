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

#include "rpc.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <boost/algorithm/string.hpp>

#include "nclient/configuration/config_options.hpp"
#include "nclient/logging.hpp"
#include "nclient/xml/document.hpp"

using namespace std;

namespace nclient::operations {
  using namespace xml;
  namespace config = ::nclient::configuration;

  static string childText(const ElementPtr &element, const string &name)
  {
    auto child = element->find(qualify(name));
    if (child && child->getText())
      return trim(*child->getText());
    else
      return "";
  }

  static string errorMessage(const ElementPtr &error)
  {
    auto message = childText(error, "error-message");
    if (message.empty())
      return childText(error, "error-tag");
    return message;
  }

  RPCError::RPCError(const ElementPtr &error)
    : OperationError(errorMessage(error)),
      m_element(error),
      m_type(childText(error, "error-type")),
      m_tag(childText(error, "error-tag")),
      m_severity(childText(error, "error-severity")),
      m_message(childText(error, "error-message"))
  {}

  void RPCReply::parse()
  {
    NAMED_SCOPE("operations.reply");

    lock_guard<mutex> lock(m_mutex);
    if (m_parsed)
      return;

    auto root = validatedElement(m_raw, {qualify("rpc-reply")});
    if (root->find(qualify("ok")))
    {
      m_ok = true;
    }
    else
    {
      root->iterate(qualify("rpc-error"), [this](const ElementPtr &error) {
        m_errors.emplace_back(make_shared<RPCError>(error));
      });
      if (!m_errors.empty())
        LOG(debug) << "Reply has " << m_errors.size() << " error(s), first: "
                   << m_errors.front()->what();
    }

    parsingHook(root);
    m_root = root;
    m_parsed = true;
  }

  RPC::RaiseMode RPC::raiseModeFor(const string &mode)
  {
    auto m = boost::algorithm::to_lower_copy(mode);
    if (m == "all")
      return RaiseMode::ALL;
    else if (m == "errors")
      return RaiseMode::ERRORS;
    else if (m != "none")
      LOG(warning) << "Unknown raise mode: " << mode << ", using none";
    return RaiseMode::NONE;
  }

  static string newMessageId()
  {
    boost::uuids::random_generator gen;
    return "urn:uuid:" + boost::uuids::to_string(gen());
  }

  RPC::RPC(transport::SessionPtr session, const ConfigOptions &options)
    : m_session(std::move(session)),
      m_raiseMode(RaiseMode::NONE),
      m_timeout(Seconds(30)),
      m_encoding("UTF-8"),
      m_pretty(IsOptionSet(options, config::Pretty))
  {
    if (!m_session)
      throw OperationError("An RPC requires a session");
    m_listener = ReplyListener::forSession(m_session);

    m_id = newMessageId();

    auto mode = GetOption<string>(options, config::RaiseMode);
    if (mode)
      m_raiseMode = raiseModeFor(*mode);
    auto encoding = GetOption<string>(options, config::Encoding);
    if (encoding)
      m_encoding = *encoding;

    auto timeout = options.find(config::Timeout);
    if (timeout != options.end())
    {
      visit(overloaded {[this](const Seconds &s) { m_timeout = s; },
                        [this](const Milliseconds &ms) { m_timeout = ms; },
                        [this](const int &s) { m_timeout = Seconds(s); },
                        [](const auto &) { LOG(warning) << "Invalid type for Timeout option"; }},
            timeout->second);
    }
  }

  RPCReplyPtr RPC::getReply()
  {
    lock_guard<mutex> lock(m_mutex);
    return m_reply;
  }

  void RPC::assertCapability(const string &capability) const
  {
    if (!m_session->getServerCapabilities().has(capability))
      throw MissingCapabilityError(capability);
  }

  void RPC::deliverReply(const string &raw)
  {
    {
      lock_guard<mutex> lock(m_mutex);
      m_reply = makeReply(raw);
    }
    m_event.notify_all();
  }

  void RPC::deliverError(const error_code &ec)
  {
    {
      lock_guard<mutex> lock(m_mutex);
      m_error = ec;
    }
    m_event.notify_all();
  }

  ElementPtr RPC::wrap(const ElementPtr &operation) const
  {
    auto node = newElement(qualify("rpc"), {{"message-id", m_id}});
    node->append(operation);
    return node;
  }

  namespace {
    /// @brief Removes the RPC from the listener when the request completes
    class PendingRequest
    {
    public:
      PendingRequest(shared_ptr<ReplyListener> &listener, RPC *rpc)
        : m_listener(listener), m_id(rpc->getId())
      {
        m_listener->registerRPC(rpc);
      }
      ~PendingRequest() { m_listener->unregisterRPC(m_id); }

    protected:
      shared_ptr<ReplyListener> &m_listener;
      string m_id;
    };
  }  // namespace

  RPCReplyPtr RPC::request(const ElementPtr &operation)
  {
    NAMED_SCOPE("operations.rpc");

    // A late reply to an earlier request must not match this one
    {
      lock_guard<mutex> lock(m_mutex);
      if (m_requested)
        m_id = newMessageId();
      m_requested = true;
      m_reply.reset();
      m_error.reset();
    }
    auto document = toXml(wrap(operation), m_encoding, m_pretty);

    PendingRequest pending(m_listener, this);
    LOG(debug) << "Sending request " << m_id;
    LOG(trace) << document;
    if (auto ec = m_session->send(document))
    {
      LOG(error) << "Failed to send request " << m_id << ": " << ec.message();
      throw SessionError(ec);
    }

    RPCReplyPtr reply;
    {
      unique_lock<mutex> lock(m_mutex);
      if (!m_event.wait_for(lock, m_timeout, [this] { return m_reply || m_error; }))
      {
        LOG(warning) << "Timed out waiting for reply to " << m_id;
        throw TimeoutExpiredError("Timed out waiting for reply to " + m_id);
      }
      if (m_error && !m_reply)
      {
        LOG(error) << "Session failed waiting for reply to " << m_id << ": "
                   << m_error->message();
        throw SessionError(*m_error);
      }
      reply = m_reply;
    }

    LOG(debug) << "Received reply to " << m_id;
    reply->parse();
    if (m_raiseMode != RaiseMode::NONE)
    {
      for (auto &error : reply->getErrors())
      {
        if (m_raiseMode == RaiseMode::ALL || error->getSeverity() == "error")
          throw *error;
      }
    }

    return reply;
  }

  shared_ptr<ReplyListener> ReplyListener::forSession(const transport::SessionPtr &session)
  {
    auto listener = session->getListener<ReplyListener>();
    if (!listener)
    {
      listener = make_shared<ReplyListener>();
      session->addListener(listener);
    }
    return listener;
  }

  void ReplyListener::registerRPC(RPC *rpc)
  {
    lock_guard<mutex> lock(m_mutex);
    m_pending.insert_or_assign(rpc->getId(), rpc);
  }

  void ReplyListener::unregisterRPC(const string &id)
  {
    lock_guard<mutex> lock(m_mutex);
    m_pending.erase(id);
  }

  void ReplyListener::received(const string &raw)
  {
    NAMED_SCOPE("operations.listener");

    RootDescriptor root;
    try
    {
      root = parseRoot(raw);
    }
    catch (XmlError &e)
    {
      LOG(warning) << "Cannot parse received document: " << e.what();
      return;
    }

    if (root.m_tag != qualify("rpc-reply"))
    {
      LOG(debug) << "Ignoring document with root " << root.m_tag;
      return;
    }

    auto id = root.m_attributes.find("message-id");
    if (id == root.m_attributes.end())
    {
      LOG(warning) << "Received rpc-reply without a message-id";
      return;
    }

    // Deliver while holding the lock so the RPC cannot stop waiting and unregister
    lock_guard<mutex> lock(m_mutex);
    auto it = m_pending.find(id->second);
    if (it == m_pending.end())
    {
      LOG(warning) << "Received rpc-reply with unknown message-id: " << id->second;
      return;
    }
    auto rpc = it->second;
    m_pending.erase(it);
    rpc->deliverReply(raw);
  }

  void ReplyListener::failed(const error_code &ec)
  {
    NAMED_SCOPE("operations.listener");

    lock_guard<mutex> lock(m_mutex);
    for (auto &rpc : m_pending)
    {
      LOG(debug) << "Delivering session failure to " << rpc.first;
      rpc.second->deliverError(ec);
    }
    m_pending.clear();
  }
}  // namespace nclient::operations
