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

#include <boost/log/trivial.hpp>
#include <boost/property_tree/ptree.hpp>

#include <string>

#include "nclient/config.hpp"

namespace nclient::configuration {
  /// @brief Convert a logging level name to a severity level
  ///
  /// Accepts `trace`, `debug`, `info`, `warn`, `warning`, `error`, `fatal`, `all`, and
  /// `none` in any case, optionally prefixed with `L`.
  ///
  /// @param level the level name
  /// @return the severity, `info` if the name is not known
  NCLIENT_LIB_API boost::log::trivial::severity_level StringToLogLevel(const std::string &level);

  /// @brief Only log messages at or above a severity
  NCLIENT_LIB_API void SetLoggingLevel(boost::log::trivial::severity_level level);

  /// @brief Set up console logging from the `logger_config` section of a configuration
  ///
  /// The section may contain `output` (`cout` or `cerr`) and `level`.
  ///
  /// @param config the configuration
  /// @return the severity level that was set
  NCLIENT_LIB_API boost::log::trivial::severity_level ConfigureLogger(
      const boost::property_tree::ptree &config);
}  // namespace nclient::configuration
