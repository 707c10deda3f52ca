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

#include "document.hpp"

#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <functional>
#include <memory>

#include <libxml/parser.h>
#include <libxml/parserInternals.h>
#include <libxml/tree.h>
#include <libxml/xmlIO.h>

#include "nclient/logging.hpp"
#include "nclient/utilities.hpp"
#include "nclient/xml/xml_writer.hpp"

using namespace std;

namespace nclient::xml {
  extern "C" void XMLCDECL nclientXMLErrorFunc(void *ctx ATTRIBUTE_UNUSED, const char *msg, ...)
  {
    va_list args;

    char buffer[2048] = {0};
    va_start(args, msg);
    vsnprintf(buffer, 2046u, msg, args);
    buffer[2047] = '\0';
    va_end(args);

    LOG(error) << "XML: " << buffer;
  }

  static const char *XML_NAMESPACE = "http://www.w3.org/XML/1998/namespace";
  static const size_t ROOT_CHUNK_SIZE = 4096;

  /// @brief Namespace uri to prefix for a single document
  class DocumentNamespaces
  {
  public:
    DocumentNamespaces(const NamespaceRegistry &registry) : m_registry(registry) {}

    void collect(const Element &element)
    {
      add(element.getTag());
      for (const auto &attr : element.getAttributes())
        add(QName(attr.first));
      for (const auto &child : element.getChildren())
        collect(*child);
    }

    /// @brief the name of the element or attribute with the uri replaced by its prefix
    string name(const QName &qname) const
    {
      if (!qname.hasNs())
        return qname.str();

      auto ns = string(qname.getNs());
      if (ns == XML_NAMESPACE)
        return "xml:" + string(qname.getName());

      return m_prefixes.at(ns) + ":" + string(qname.getName());
    }

    /// @brief write the xmlns declarations in prefix order
    void declare(xmlTextWriterPtr writer) const
    {
      for (const auto &decl : m_declarations)
      {
        string attr = "xmlns:" + decl.first;
        THROW_IF_XML2_ERROR(xmlTextWriterWriteAttribute(writer, BAD_CAST attr.c_str(),
                                                        BAD_CAST decl.second.c_str()));
      }
    }

  protected:
    void add(const QName &qname)
    {
      if (!qname.hasNs())
        return;

      string ns(qname.getNs());
      if (ns == XML_NAMESPACE || m_prefixes.count(ns) > 0)
        return;

      auto prefix = m_registry.prefixFor(ns);
      if (!prefix || prefix->empty() || m_declarations.count(*prefix) > 0)
      {
        do
        {
          prefix = "ns" + to_string(m_generated++);
        } while (m_declarations.count(*prefix) > 0 || m_registry.hasPrefix(*prefix));
      }

      m_prefixes.emplace(ns, *prefix);
      m_declarations.emplace(*prefix, ns);
    }

    const NamespaceRegistry &m_registry;
    map<string, string> m_prefixes;
    map<string, string> m_declarations;
    int m_generated {0};
  };

  static void writeText(xmlTextWriterPtr writer, const optional<string> &text)
  {
    if (text && !text->empty())
      THROW_IF_XML2_ERROR(xmlTextWriterWriteString(writer, BAD_CAST text->c_str()));
  }

  static void writeElement(xmlTextWriterPtr writer, const Element &element,
                           const DocumentNamespaces &namespaces, bool root)
  {
    AutoElement ele(writer, namespaces.name(element.getTag()));
    if (root)
      namespaces.declare(writer);

    for (const auto &attr : element.getAttributes())
    {
      auto name = namespaces.name(QName(attr.first));
      THROW_IF_XML2_ERROR(xmlTextWriterWriteAttribute(writer, BAD_CAST name.c_str(),
                                                      BAD_CAST attr.second.c_str()));
    }

    writeText(writer, element.getText());

    for (const auto &child : element.getChildren())
      writeElement(writer, *child, namespaces, false);

    ele.close();

    if (!root)
      writeText(writer, element.getTail());
  }

  static string declaration(const string &encoding)
  {
    return "<?xml version=\"1.0\" encoding=\"" + encoding + "\"?>";
  }

  std::string toXml(const ElementPtr &element, const std::string &encoding, bool pretty,
                    const NamespaceRegistry &registry)
  {
    if (!element)
      throw XmlError("No element to convert to XML");

    DocumentNamespaces namespaces(registry);
    namespaces.collect(*element);

    XmlWriter writer(pretty, encoding);
    writeElement(writer, *element, namespaces, true);
    auto xml = writer.getContent();

    if (starts_with(xml, "<?xml"))
      return xml;
    else
      return declaration(encoding) + xml;
  }

  std::string toXml(const std::string &document, const std::string &encoding)
  {
    if (starts_with(document, "<?xml"))
      return document;
    else
      return declaration(encoding) + document;
  }

  static inline string nodeName(const xmlChar *name, const xmlChar *href)
  {
    if (href != nullptr)
      return qualify((const char *)name, string((const char *)href));
    else
      return (const char *)name;
  }

  static inline void appendText(ElementPtr &element, bool tail, const xmlChar *content)
  {
    if (content == nullptr)
      return;

    auto &text = tail ? element->getTail() : element->getText();
    string s = text ? *text + (const char *)content : string((const char *)content);
    if (tail)
      element->setTail(s);
    else
      element->setText(s);
  }

  static ElementPtr convertNode(xmlNodePtr node)
  {
    auto element = newElement(nodeName(node->name, node->ns ? node->ns->href : nullptr));

    for (xmlAttrPtr attr = node->properties; attr; attr = attr->next)
    {
      if (attr->type == XML_ATTRIBUTE_NODE)
      {
        string value;
        auto content = xmlNodeListGetString(node->doc, attr->children, 1);
        if (content)
        {
          value = (const char *)content;
          xmlFree(content);
        }
        element->setAttribute(nodeName(attr->name, attr->ns ? attr->ns->href : nullptr), value);
      }
    }

    ElementPtr last;
    for (xmlNodePtr child = node->children; child; child = child->next)
    {
      switch (child->type)
      {
        case XML_ELEMENT_NODE:
          last = convertNode(child);
          element->append(last);
          break;

        case XML_TEXT_NODE:
        case XML_CDATA_SECTION_NODE:
          if (last)
            appendText(last, true, child->content);
          else
            appendText(element, false, child->content);
          break;

        case XML_ENTITY_REF_NODE:
        {
          auto content = xmlNodeGetContent(child);
          if (content)
          {
            if (last)
              appendText(last, true, content);
            else
              appendText(element, false, content);
            xmlFree(content);
          }
          break;
        }

        default:
          break;
      }
    }

    return element;
  }

  ElementPtr toElement(const std::string &document)
  {
    NAMED_SCOPE("xml.document");

    xmlInitParser();
    xmlSetGenericErrorFunc(nullptr, nclientXMLErrorFunc);

    unique_ptr<xmlParserCtxt, function<void(xmlParserCtxtPtr)>> ctxt(
        xmlNewParserCtxt(), [](xmlParserCtxtPtr c) { xmlFreeParserCtxt(c); });
    if (!ctxt)
      throw XmlError("Cannot create XML parser context");

    unique_ptr<xmlDoc, function<void(xmlDocPtr)>> doc(
        xmlCtxtReadMemory(ctxt.get(), document.c_str(), int32_t(document.length()),
                          "document.xml", nullptr, XML_PARSE_NONET),
        [](xmlDocPtr d) { xmlFreeDoc(d); });
    if (!doc)
    {
      string message = "unknown error";
      auto error = xmlCtxtGetLastError(ctxt.get());
      if (error != nullptr && error->message != nullptr)
        message = trim(error->message);

      LOG(debug) << "Cannot parse XML document: " << message;
      throw XmlError("Cannot parse XML document: " + message);
    }

    xmlNodePtr root = xmlDocGetRootElement(doc.get());
    if (root == nullptr)
      throw XmlError("XML document has no root element");

    return convertNode(root);
  }

  namespace {
    struct RootCapture
    {
      xmlParserCtxtPtr m_ctxt {nullptr};
      std::optional<RootDescriptor> m_root;
    };
  }  // namespace

  extern "C" void nclientRootStartElement(void *ctx, const xmlChar *localname,
                                          const xmlChar *prefix ATTRIBUTE_UNUSED,
                                          const xmlChar *uri, int nbNamespaces ATTRIBUTE_UNUSED,
                                          const xmlChar **namespaces ATTRIBUTE_UNUSED,
                                          int nbAttributes, int nbDefaulted ATTRIBUTE_UNUSED,
                                          const xmlChar **attributes)
  {
    auto capture = static_cast<RootCapture *>(ctx);
    if (capture->m_root)
      return;

    RootDescriptor root;
    root.m_tag = nodeName(localname, uri);

    // Each attribute is localname, prefix, URI, value and end of value
    for (int i = 0; i < nbAttributes; i++)
    {
      auto attr = attributes + i * 5;
      string value((const char *)attr[3], size_t(attr[4] - attr[3]));
      // The parser keeps literal ampersands as character references in SAX2 values
      boost::replace_all(value, "&#38;", "&");
      root.m_attributes.insert_or_assign(nodeName(attr[0], attr[2]), value);
    }

    capture->m_root.emplace(std::move(root));
    xmlStopParser(capture->m_ctxt);
  }

  RootDescriptor parseRoot(const std::string &raw)
  {
    NAMED_SCOPE("xml.document");

    xmlInitParser();
    xmlSetGenericErrorFunc(nullptr, nclientXMLErrorFunc);

    xmlSAXHandler sax;
    memset(&sax, 0, sizeof(sax));
    sax.initialized = XML_SAX2_MAGIC;
    sax.startElementNs = nclientRootStartElement;

    RootCapture capture;
    unique_ptr<xmlParserCtxt, function<void(xmlParserCtxtPtr)>> ctxt(
        xmlCreatePushParserCtxt(&sax, &capture, nullptr, 0, "root.xml"),
        [](xmlParserCtxtPtr c) { xmlFreeParserCtxt(c); });
    if (!ctxt)
      throw XmlError("Cannot create XML push parser context");
    xmlCtxtUseOptions(ctxt.get(), XML_PARSE_NONET);
    capture.m_ctxt = ctxt.get();

    size_t pos = 0;
    while (!capture.m_root && pos < raw.size())
    {
      size_t len = std::min(ROOT_CHUNK_SIZE, raw.size() - pos);
      bool last = pos + len >= raw.size();
      int res = xmlParseChunk(ctxt.get(), raw.data() + pos, int(len), last ? 1 : 0);
      pos += len;
      if (res != 0 && !capture.m_root)
        break;
    }

    if (!capture.m_root)
    {
      LOG(debug) << "Cannot find the root element of the document";
      throw XmlError("Cannot find root element of XML document");
    }

    return *capture.m_root;
  }

  ElementPtr validatedElement(const ElementPtr &element, const TagSet &tags,
                              const AttributeRequirements &attrs)
  {
    if (!element)
      throw XmlError("No element to validate");

    const auto &tag = element->getTag();
    if (!tags.empty() && tags.count(tag) == 0)
    {
      LOG(debug) << "Element " << tag << " is not one of " << boost::join(tags, ", ");
      throw XmlError("Element does not meet requirement", tag);
    }

    for (const auto &req : attrs)
    {
      bool found = false;
      for (const auto &alt : req)
      {
        if (element->hasAttribute(alt))
        {
          found = true;
          break;
        }
      }
      if (!found)
      {
        LOG(debug) << "Element " << tag << " is missing one of " << boost::join(req, ", ");
        throw XmlError("Element does not have required attributes", tag);
      }
    }

    return element;
  }

  ElementPtr validatedElement(const std::string &document, const TagSet &tags,
                              const AttributeRequirements &attrs)
  {
    return validatedElement(toElement(document), tags, attrs);
  }
}  // namespace nclient::xml
