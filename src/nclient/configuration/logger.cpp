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

#include "logger.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/log/attributes.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

#include <iostream>
#include <map>
#include <string_view>

#include "nclient/logging.hpp"
#include "nclient/utilities.hpp"

using namespace std;

namespace nclient::configuration {
  namespace logr = boost::log;

  logr::trivial::severity_level StringToLogLevel(const std::string &level)
  {
    using namespace logr::trivial;
    string_view lev(level);
    if (!lev.empty() && (lev[0] == 'L' || lev[0] == 'l'))
      lev.remove_prefix(1);

    struct compare
    {
      bool operator()(const string_view &s1, const string_view &s2) const
      {
        return boost::ilexicographical_compare(s1, s2);
      }
    };

    static const map<string_view, severity_level, compare> levels = {
        {"ALL", severity_level::trace},       {"NONE", severity_level::fatal},
        {"TRACE", severity_level::trace},     {"DEBUG", severity_level::debug},
        {"INFO", severity_level::info},       {"WARN", severity_level::warning},
        {"WARNING", severity_level::warning}, {"ERROR", severity_level::error},
        {"FATAL", severity_level::fatal}};

    auto res = levels.find(lev);
    if (res == levels.end())
      return severity_level::info;
    else
      return res->second;
  }

  void SetLoggingLevel(logr::trivial::severity_level level)
  {
    using namespace logr::trivial;
    logr::core::get()->set_filter(severity >= level);
  }

  logr::trivial::severity_level ConfigureLogger(const boost::property_tree::ptree &config)
  {
    using namespace logr::trivial;
    namespace kw = logr::keywords;
    namespace expr = logr::expressions;

    logr::core::get()->remove_all_sinks();
    logr::add_common_attributes();
    logr::core::get()->add_global_attribute("Scope", logr::attributes::named_scope());
    logr::core::get()->add_global_attribute("Timestamp", logr::attributes::utc_clock());

    boost::property_tree::ptree empty;
    auto logger = config.get_child_optional("logger_config").value_or(empty);

    ConfigOptions options;
    AddOptions(logger, options, {{"output", string()}, {"level", string()}});

    auto level = StringToLogLevel(GetOption<string>(options, "level").value_or("info"));
    SetLoggingLevel(level);

    auto formatter =
        expr::stream << expr::format_date_time<boost::posix_time::ptime>("Timestamp",
                                                                         "%Y-%m-%dT%H:%M:%S.%fZ ")
                     << "("
                     << expr::attr<logr::attributes::current_thread_id::value_type>("ThreadID")
                     << ") [" << severity << "] " << expr::format_named_scope("Scope")
                     << ": " << expr::smessage;

    auto output = GetOption<string>(options, "output");
    if (output && *output == "cerr")
      logr::add_console_log(std::cerr, kw::format = formatter);
    else
    {
      if (output && *output != "cout")
        LOG(warning) << "Unknown logger output: " << *output << ", using cout";
      logr::add_console_log(std::cout, kw::format = formatter);
    }

    return level;
  }
}  // namespace nclient::configuration
