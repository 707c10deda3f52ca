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

#include <iostream>
#include <string>
#include <system_error>

#include "nclient/config.hpp"

namespace nclient::transport {
  /// @brief Reasons why a session operation failed
  enum class ErrorCode
  {
    OK = 0,
    NOT_CONNECTED,    ///< The session is not connected
    SESSION_CLOSED,   ///< The session closed while a reply was pending
    SEND_FAILED,      ///< The document could not be sent
    TRANSPORT_ERROR   ///< The underlying transport failed
  };
}  // namespace nclient::transport

namespace std {
  template <>
  struct is_error_code_enum<nclient::transport::ErrorCode> : true_type
  {};

  template <>
  struct is_error_condition_enum<nclient::transport::ErrorCode> : true_type
  {};
}  // namespace std

namespace nclient::transport {
  /// @brief Error categories for error reporting using std:error_code and std::error_condition
  struct ErrorCategory : std::error_category
  {
    const char *name() const noexcept override { return "NETCONF::Session"; }
    std::string message(int ec) const override
    {
      switch (static_cast<ErrorCode>(ec))
      {
        case ErrorCode::OK:
          return "No error";

        case ErrorCode::NOT_CONNECTED:
          return "The session is not connected";

        case ErrorCode::SESSION_CLOSED:
          return "The session was closed";

        case ErrorCode::SEND_FAILED:
          return "The request could not be sent";

        case ErrorCode::TRANSPORT_ERROR:
          return "The transport failed";

        default:
          return "Unknown session error";
      }
    }
  };

  NCLIENT_SYMBOL_VISIBLE inline const std::error_category &TheErrorCategory()
  {
    static const ErrorCategory theErrorCategory {};
    return theErrorCategory;
  }

  inline std::error_code make_error_code(ErrorCode ec)
  {
    return {static_cast<int>(ec), TheErrorCategory()};
  }

  inline std::error_condition make_error_condition(ErrorCode ec)
  {
    return {static_cast<int>(ec), TheErrorCategory()};
  }
}  // namespace nclient::transport
