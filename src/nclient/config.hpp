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

/// @file config.hpp
/// @brief common includes and cross platform requirements

#pragma once

#include <boost/config.hpp>

#include <chrono>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <unordered_map>
#include <variant>

#if defined(_WIN32) || defined(_WIN64)
#ifndef _WINDOWS
#define _WINDOWS 1
#endif
#ifndef NOMINMAX
#define NOMINMAX 1
#endif
#else
#include <cstdint>
#include <unistd.h>
#endif

#ifdef _WINDOWS
#define NCLIENT_SYMBOL_EXPORT __declspec(dllexport)
#define NCLIENT_SYMBOL_IMPORT __declspec(dllimport)
#else  // _WINDOWS
#define NCLIENT_SYMBOL_EXPORT __attribute__((visibility("default")))
#define NCLIENT_SYMBOL_IMPORT __attribute__((visibility("default")))
#endif  // _WINDOWS

#ifdef SHARED_NCLIENT_LIB

#ifdef NCLIENT_BUILD_SHARED_LIB
#define NCLIENT_LIB_API NCLIENT_SYMBOL_EXPORT
#else
#define NCLIENT_LIB_API NCLIENT_SYMBOL_IMPORT
#endif

#define NCLIENT_SYMBOL_VISIBLE NCLIENT_LIB_API

#else  // SHARED_NCLIENT_LIB

#define NCLIENT_LIB_API
#define NCLIENT_SYMBOL_VISIBLE

#endif
