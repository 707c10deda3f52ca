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

/// @file utilities.hpp
/// @brief Common utility functions

#pragma once

#include <boost/algorithm/string.hpp>
#include <boost/property_tree/ptree.hpp>

#include <algorithm>
#include <chrono>
#include <list>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

#include "nclient/config.hpp"
#include "nclient/logging.hpp"

/// @brief nclient namespace
///
/// Top level NETCONF client namespace
namespace nclient {
  /// @brief determines of a string starts with a beginning
  /// @param[in] value the string to check
  /// @param[in] beginning the beginning to verify
  /// @return `true` if the string begins with beginning
  inline bool starts_with(const std::string &value, const std::string_view &beginning)
  {
    if (beginning.size() > value.size())
      return false;
    return std::equal(beginning.begin(), beginning.end(), value.begin());
  }

  /// @brief removes spaces from the beginning and end of a string
  /// @param[in] s the string
  /// @return string with spaces removed
  inline std::string trim(std::string s)
  {
    boost::algorithm::trim(s);
    return s;
  }

  /// @brief overloaded pattern for variant visitors using list of lambdas
  /// @tparam ...Ts list of lambda classes
  template <class... Ts>
  struct overloaded : Ts...
  {
    using Ts::operator()...;
  };
  template <class... Ts>
  overloaded(Ts...) -> overloaded<Ts...>;

  using Milliseconds = std::chrono::milliseconds;
  using Seconds = std::chrono::seconds;
  using StringList = std::list<std::string>;

  /// @name Configuration related methods
  ///@{

  /// @brief Variant for configuration options
  using ConfigOption =
      std::variant<std::monostate, bool, int, std::string, double, Seconds, Milliseconds>;
  /// @brief A map of name to option value
  using ConfigOptions = std::map<std::string, ConfigOption>;

  /// @brief Get an option if available
  /// @tparam T the option type
  /// @param options the set of options
  /// @param name the name to get
  /// @return the value of the option otherwise std::nullopt
  template <typename T>
  inline const std::optional<T> GetOption(const ConfigOptions &options, const std::string &name)
  {
    auto v = options.find(name);
    if (v != options.end())
      return std::get<T>(v->second);
    else
      return std::nullopt;
  }

  /// @brief checks if a boolean option is set
  /// @param options the set of options
  /// @param name the name of the option
  /// @return `true` if the option exists and has a bool type
  inline bool IsOptionSet(const ConfigOptions &options, const std::string &name)
  {
    auto v = options.find(name);
    if (v != options.end())
      return std::get<bool>(v->second);
    else
      return false;
  }

  /// @brief checks if there is an option
  /// @param[in] options the set of options
  /// @param[in] name the name of the option
  /// @return `true` if the option exists
  inline bool HasOption(const ConfigOptions &options, const std::string &name)
  {
    auto v = options.find(name);
    return v != options.end();
  }

  /// @brief convert an option from a string to a typed option
  /// @param[in] s the
  /// @param[in] def template for the option
  /// @return a typed option matching `def`
  inline auto ConvertOption(const std::string &s, const ConfigOption &def)
  {
    ConfigOption option {s};
    std::string sv = s;
    visit(overloaded {[&option, &sv](const std::string &) {
                        if (sv.empty())
                          option = std::monostate();
                        else
                          option = sv;
                      },
                      [&option, &sv](const int &) { option = stoi(sv); },
                      [&option, &sv](const Milliseconds &) { option = Milliseconds {stoi(sv)}; },
                      [&option, &sv](const Seconds &) { option = Seconds {stoi(sv)}; },
                      [&option, &sv](const double &) { option = stod(sv); },
                      [&option, &sv](const bool &) { option = sv == "yes" || sv == "true"; },
                      [](const auto &) {}},
          def);
    return option;
  }

  /// @brief add options from a property tree if they are present
  /// @param[in] tree the property tree
  /// @param[in,out] options the options to update
  /// @param[in] entries the names and types of the options
  inline void AddOptions(const boost::property_tree::ptree &tree, ConfigOptions &options,
                         const ConfigOptions &entries)
  {
    for (auto &e : entries)
    {
      auto val = tree.get_optional<std::string>(e.first);
      if (val)
      {
        try
        {
          auto v = ConvertOption(*val, e.second);
          if (v.index() != 0)
            options.insert_or_assign(e.first, v);
        }
        catch (std::logic_error &ex)
        {
          LOG(error) << "Invalid value for option " << e.first << ": " << *val << " (" << ex.what()
                     << ")";
        }
      }
    }
  }

  /// @brief set options from the defaults and then override them from a property tree
  /// @param[in] tree the property tree
  /// @param[in,out] options the options to update
  /// @param[in] entries the names and default values of the options
  inline void GetOptions(const boost::property_tree::ptree &tree, ConfigOptions &options,
                         const ConfigOptions &entries)
  {
    for (auto &e : entries)
    {
      if (!std::holds_alternative<std::string>(e.second) ||
          !std::get<std::string>(e.second).empty())
      {
        options.emplace(e.first, e.second);
      }
    }
    AddOptions(tree, options, entries);
  }
  ///@}
}  // namespace nclient
