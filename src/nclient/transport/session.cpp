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

#include "session.hpp"

#include <algorithm>
#include <stdexcept>

#include "nclient/logging.hpp"

using namespace std;

namespace nclient::transport {
  void Session::addListener(SessionListenerPtr listener)
  {
    lock_guard<mutex> lock(m_mutex);
    if (std::find(m_listeners.begin(), m_listeners.end(), listener) == m_listeners.end())
      m_listeners.emplace_back(std::move(listener));
  }

  void Session::removeListener(const SessionListenerPtr &listener)
  {
    lock_guard<mutex> lock(m_mutex);
    m_listeners.remove(listener);
  }

  std::list<SessionListenerPtr> Session::listeners()
  {
    lock_guard<mutex> lock(m_mutex);
    return m_listeners;
  }

  void Session::dispatch(const std::string &raw)
  {
    NAMED_SCOPE("transport.session");
    for (auto &listener : listeners())
    {
      try
      {
        listener->received(raw);
      }
      catch (std::exception &e)
      {
        LOG(error) << "Listener failed to handle received document: " << e.what();
      }
    }
  }

  void Session::failed(const std::error_code &ec)
  {
    NAMED_SCOPE("transport.session");
    LOG(warning) << "Session failed: " << ec.message();
    for (auto &listener : listeners())
      listener->failed(ec);
  }
}  // namespace nclient::transport
