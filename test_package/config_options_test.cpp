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

// Ensure that gtest is the first header otherwise Windows raises an error
#include <gtest/gtest.h>
// Keep this comment to keep gtest.h above. (clang-format off/on is not working here!)

#include <boost/property_tree/ptree.hpp>

#include <chrono>
#include <memory>
#include <string>

#include "nclient/configuration/config_options.hpp"
#include "nclient/configuration/logger.hpp"
#include "nclient/operations/rpc.hpp"
#include "nclient/utilities.hpp"
#include "test_utilities.hpp"

using namespace std;
using namespace std::literals;
using namespace nclient;
using namespace nclient::operations;
namespace config = nclient::configuration;
namespace pt = boost::property_tree;

// main
int main(int argc, char *argv[])
{
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

class ConfigOptionsTest : public testing::Test
{
protected:
  ConfigOptions defaults()
  {
    return {{config::Timeout, 30s},
            {config::RaiseMode, "none"s},
            {config::Encoding, "UTF-8"s},
            {config::Pretty, false}};
  }
};

TEST_F(ConfigOptionsTest, should_use_defaults_when_not_configured)
{
  pt::ptree tree;
  ConfigOptions options;
  GetOptions(tree, options, defaults());

  ASSERT_EQ(30s, *GetOption<Seconds>(options, config::Timeout));
  ASSERT_EQ("none", *GetOption<string>(options, config::RaiseMode));
  ASSERT_EQ("UTF-8", *GetOption<string>(options, config::Encoding));
  ASSERT_FALSE(IsOptionSet(options, config::Pretty));
}

TEST_F(ConfigOptionsTest, should_convert_options_from_a_property_tree)
{
  pt::ptree tree;
  tree.put("Timeout", "10");
  tree.put("RaiseMode", "errors");
  tree.put("Pretty", "yes");

  ConfigOptions options;
  GetOptions(tree, options, defaults());

  ASSERT_EQ(10s, *GetOption<Seconds>(options, config::Timeout));
  ASSERT_EQ("errors", *GetOption<string>(options, config::RaiseMode));
  ASSERT_TRUE(IsOptionSet(options, config::Pretty));
  ASSERT_TRUE(HasOption(options, config::Encoding));
  ASSERT_FALSE(HasOption(options, "Other"));
}

TEST_F(ConfigOptionsTest, should_keep_default_for_invalid_values)
{
  pt::ptree tree;
  tree.put("Timeout", "soon");

  ConfigOptions options;
  GetOptions(tree, options, defaults());

  ASSERT_EQ(30s, *GetOption<Seconds>(options, config::Timeout));
}

TEST_F(ConfigOptionsTest, should_configure_an_rpc)
{
  pt::ptree tree;
  tree.put("Timeout", "2");
  tree.put("RaiseMode", "all");

  ConfigOptions options;
  GetOptions(tree, options, defaults());

  RPC rpc(make_shared<MockSession>(), options);
  ASSERT_EQ(2000ms, rpc.getTimeout());
  ASSERT_EQ(RPC::RaiseMode::ALL, rpc.getRaiseMode());
}

TEST_F(ConfigOptionsTest, should_require_a_session)
{
  ASSERT_THROW(RPC(nullptr), OperationError);
}

TEST_F(ConfigOptionsTest, should_convert_logging_levels)
{
  using namespace boost::log::trivial;
  ASSERT_EQ(severity_level::debug, config::StringToLogLevel("debug"));
  ASSERT_EQ(severity_level::warning, config::StringToLogLevel("WARN"));
  ASSERT_EQ(severity_level::error, config::StringToLogLevel("LERROR"));
  ASSERT_EQ(severity_level::trace, config::StringToLogLevel("all"));
  ASSERT_EQ(severity_level::info, config::StringToLogLevel("chatty"));
  ASSERT_EQ(severity_level::info, config::StringToLogLevel(""));
}

TEST_F(ConfigOptionsTest, should_configure_the_logger)
{
  pt::ptree tree;
  tree.put("logger_config.output", "cerr");
  tree.put("logger_config.level", "warning");

  ASSERT_EQ(boost::log::trivial::warning, config::ConfigureLogger(tree));
  config::SetLoggingLevel(boost::log::trivial::info);
}
