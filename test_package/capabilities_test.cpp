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

#include <string>

#include "nclient/transport/capabilities.hpp"
#include "nclient/transport/error_code.hpp"

using namespace std;
using namespace nclient;
using namespace nclient::transport;

// main
int main(int argc, char *argv[])
{
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

TEST(CapabilitiesTest, should_abbreviate_capability_uris)
{
  StringList expected {":url", ":url:1.0"};
  ASSERT_EQ(expected, Capabilities::abbreviate("urn:ietf:params:netconf:capability:url:1.0"));

  StringList base {":base", ":base:1.1"};
  ASSERT_EQ(base, Capabilities::abbreviate("urn:ietf:params:netconf:base:1.1"));
}

TEST(CapabilitiesTest, should_ignore_query_when_abbreviating)
{
  StringList expected {":url", ":url:1.0"};
  ASSERT_EQ(expected, Capabilities::abbreviate(
                          "urn:ietf:params:netconf:capability:url:1.0?scheme=http,ftp,file"));
}

TEST(CapabilitiesTest, should_not_abbreviate_other_uris)
{
  ASSERT_TRUE(Capabilities::abbreviate("http://example.com/ns/yang?module=example").empty());
  ASSERT_TRUE(Capabilities::abbreviate("urn:ietf:params:netconf:other").empty());
}

TEST(CapabilitiesTest, should_check_by_uri_or_abbreviation)
{
  Capabilities caps({"urn:ietf:params:netconf:base:1.0",
                     "urn:ietf:params:netconf:capability:xpath:1.0",
                     "http://example.com/ns/yang?module=example"});

  ASSERT_EQ(3, caps.size());
  ASSERT_TRUE(caps.has(":base"));
  ASSERT_TRUE(caps.has(":base:1.0"));
  ASSERT_TRUE(caps.has(":xpath"));
  ASSERT_TRUE(caps.has("urn:ietf:params:netconf:capability:xpath:1.0"));
  ASSERT_TRUE(caps.has("http://example.com/ns/yang?module=example"));
  ASSERT_FALSE(caps.has(":url"));
  ASSERT_FALSE(caps.has(":xpath:2.0"));

  caps.remove("urn:ietf:params:netconf:capability:xpath:1.0");
  ASSERT_FALSE(caps.has(":xpath"));
  ASSERT_EQ(2, caps.getUris().size());
}

TEST(CapabilitiesTest, should_describe_session_errors)
{
  error_code ec = make_error_code(ErrorCode::SESSION_CLOSED);
  ASSERT_TRUE(ec);
  ASSERT_EQ(string("NETCONF::Session"), ec.category().name());
  ASSERT_EQ("The session was closed", ec.message());
  ASSERT_EQ(make_error_code(ErrorCode::SESSION_CLOSED), ec);
  ASSERT_FALSE(make_error_code(ErrorCode::OK));
}
