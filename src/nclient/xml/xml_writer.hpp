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

#include <boost/algorithm/string/predicate.hpp>

#include <string>

#include <libxml/encoding.h>
#include <libxml/xmlwriter.h>

#include "nclient/config.hpp"
#include "nclient/xml/xml_helper.hpp"

namespace nclient::xml {
  /// @brief Helper class for XML document generation. Wraps some common libxml2 functions
  ///
  /// The writer never emits an XML declaration, the caller decides how the document starts.
  class NCLIENT_LIB_API XmlWriter
  {
  public:
    /// @brief Construct an XmlWriter creating setting up the buffer for writing.
    /// @param pretty `true` if output is formatted with indentation
    /// @param encoding character encoding of the output
    XmlWriter(bool pretty, const std::string &encoding = "UTF-8")
      : m_writer(nullptr), m_buf(nullptr)
    {
      xmlCharEncodingHandlerPtr handler = nullptr;
      if (!boost::iequals(encoding, "UTF-8"))
      {
        handler = xmlFindCharEncodingHandler(encoding.c_str());
        if (handler == nullptr)
          throw XmlError("Unsupported encoding: " + encoding);
      }

      THROW_IF_XML2_NULL(m_buf = xmlBufferCreate());
      xmlOutputBufferPtr out = xmlOutputBufferCreateBuffer(m_buf, handler);
      if (out == nullptr)
      {
        xmlBufferFree(m_buf);
        m_buf = nullptr;
        throw XmlError("Cannot create output buffer for encoding: " + encoding);
      }
      m_writer = xmlNewTextWriter(out);
      if (m_writer == nullptr)
      {
        xmlOutputBufferClose(out);
        xmlBufferFree(m_buf);
        m_buf = nullptr;
        throw XmlError("Cannot create XML text writer");
      }
      if (pretty)
      {
        THROW_IF_XML2_ERROR(xmlTextWriterSetIndent(m_writer, 1));
        THROW_IF_XML2_ERROR(xmlTextWriterSetIndentString(m_writer, BAD_CAST "  "));
      }
    }

    ~XmlWriter()
    {
      if (m_writer != nullptr)
      {
        xmlFreeTextWriter(m_writer);
        m_writer = nullptr;
      }
      if (m_buf != nullptr)
      {
        xmlBufferFree(m_buf);
        m_buf = nullptr;
      }
    }

    /// @brief cast this object as a xmlTextWriterPtr
    /// @return the xmlTextWriterPtr
    operator xmlTextWriterPtr() { return m_writer; }

    /// @brief Get the content of the buffer as a string. Free the writer if it is allocated.
    /// @return content as a string
    std::string getContent()
    {
      if (m_writer != nullptr)
      {
        THROW_IF_XML2_ERROR(xmlTextWriterFlush(m_writer));
        xmlFreeTextWriter(m_writer);
        m_writer = nullptr;
      }
      return std::string((const char *)xmlBufferContent(m_buf), xmlBufferLength(m_buf));
    }

  protected:
    xmlTextWriterPtr m_writer;
    xmlBufferPtr m_buf;
  };

  /// @brief Wrapper to create an XML open element
  /// @param writer the writer
  /// @param name the name of the element
  static inline void openElement(xmlTextWriterPtr writer, const char *name)
  {
    THROW_IF_XML2_ERROR(xmlTextWriterStartElement(writer, BAD_CAST name));
  }

  /// @brief Close the last open element
  /// @param writer the writer
  static inline void closeElement(xmlTextWriterPtr writer)
  {
    THROW_IF_XML2_ERROR(xmlTextWriterEndElement(writer));
  }

  /// @brief Helper class to automatically close an element when the object goes out of scope
  class NCLIENT_LIB_API AutoElement
  {
  public:
    /// @brief Constor where the element is opened
    /// @param writer the writer
    /// @param name name of the element
    AutoElement(xmlTextWriterPtr writer, const std::string &name) : m_writer(writer), m_name(name)
    {
      openElement(writer, name.c_str());
    }
    /// @brief Destructor closes the element if it is open
    ~AutoElement()
    {
      if (!m_name.empty())
        xmlTextWriterEndElement(m_writer);
    }

    /// @brief close the element before the object goes out of scope
    void close()
    {
      if (!m_name.empty())
      {
        m_name.clear();
        closeElement(m_writer);
      }
    }

    /// @brief return the name
    /// @return the name
    const std::string &name() const { return m_name; }

  protected:
    xmlTextWriterPtr m_writer;
    std::string m_name;
  };
}  // namespace nclient::xml
