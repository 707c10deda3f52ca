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

/// @file config_options.hpp
/// @brief Contains all the known configuration options

#include "nclient/config.hpp"

namespace nclient {
  namespace configuration {

/// @brief creates an const char * from the name as a string
///
///   stringizes `name`
///
/// @param name name of configuration parameter
#define DECLARE_CONFIGURATION(name) inline const char *name = #name;

    /// @name RPC Configuration
    ///@{
    DECLARE_CONFIGURATION(Timeout);
    DECLARE_CONFIGURATION(RaiseMode);
    DECLARE_CONFIGURATION(Encoding);
    DECLARE_CONFIGURATION(Pretty);
    ///@}
  }  // namespace configuration
}  // namespace nclient
