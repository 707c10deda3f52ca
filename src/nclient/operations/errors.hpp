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

#include <stdexcept>
#include <string>
#include <system_error>

#include "nclient/config.hpp"

namespace nclient::operations {
  /// @brief Base class for errors raised by operations
  class NCLIENT_LIB_API OperationError : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  /// @brief The server does not have a capability required by the operation
  class NCLIENT_LIB_API MissingCapabilityError : public OperationError
  {
  public:
    explicit MissingCapabilityError(const std::string &capability)
      : OperationError("Server does not support [" + capability + "]"), m_capability(capability)
    {}

    const std::string &getCapability() const { return m_capability; }

  protected:
    std::string m_capability;
  };

  /// @brief No reply arrived before the timeout expired
  class NCLIENT_LIB_API TimeoutExpiredError : public OperationError
  {
  public:
    using OperationError::OperationError;
  };

  /// @brief The session failed to send a request or failed while waiting for a reply
  class NCLIENT_LIB_API SessionError : public OperationError
  {
  public:
    explicit SessionError(const std::error_code &ec)
      : OperationError("Session error: " + ec.message()), m_code(ec)
    {}

    const std::error_code &getCode() const { return m_code; }

  protected:
    std::error_code m_code;
  };
}  // namespace nclient::operations
