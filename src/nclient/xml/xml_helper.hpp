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

#include "nclient/config.hpp"

#define xml_strfy(line) #line
/// @brief macro to throw an error from XML parsing based on the result of a libxml2 function
/// returning an int
/// @param expr the expression
#define THROW_IF_XML2_ERROR(expr)                                                 \
  if ((expr) < 0)                                                                 \
  {                                                                               \
    throw XmlError("XML Error at " __FILE__ "(" xml_strfy(__LINE__) "): " #expr); \
  }
/// @brief macro to throw an error from XML parsing based on the result of a libxml2 function
/// returning a pointer
/// @param expr the expression
#define THROW_IF_XML2_NULL(expr)                                                  \
  if (!(expr))                                                                    \
  {                                                                               \
    throw XmlError("XML Error at " __FILE__ "(" xml_strfy(__LINE__) "): " #expr); \
  }

namespace nclient::xml {
  /// @brief Malformed XML structure
  ///
  /// Raised when a document cannot be parsed or when a root element does not meet
  /// the structural requirements. Carries the tag of the offending element when
  /// there is one.
  class NCLIENT_LIB_API XmlError : public std::logic_error
  {
  public:
    explicit XmlError(const std::string &s, const std::string &tag = "")
      : std::logic_error(s), m_tag(tag)
    {}
    explicit XmlError(const char *s, const std::string &tag = "") : std::logic_error(s), m_tag(tag)
    {}
    XmlError(const XmlError &o) noexcept : std::logic_error(o), m_tag(o.m_tag) {}
    ~XmlError() override = default;

    /// @brief the message prefixed with the offending tag
    /// @return the error text
    const char *what() const noexcept override
    {
      if (m_tag.empty())
        return std::logic_error::what();

      if (m_text.empty())
      {
        auto *t = const_cast<XmlError *>(this);
        t->m_text = m_tag + ": " + std::logic_error::what();
      }
      return m_text.c_str();
    }

    /// @brief the tag of the element that caused the error
    /// @return the qualified tag or an empty string
    const std::string &getTag() const { return m_tag; }

  protected:
    std::string m_text;
    std::string m_tag;
  };
}  // namespace nclient::xml
