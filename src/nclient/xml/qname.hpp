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

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "nclient/config.hpp"
#include "nclient/xml/namespaces.hpp"

namespace nclient {
  namespace xml {
    /// @brief Qualified name in `{namespace}local` notation
    ///
    /// The qname uses the underlying string for storage and keeps the length of
    /// the namespace so the parts can be returned as views.
    class NCLIENT_LIB_API QName : public std::string
    {
    public:
      QName() = default;
      /// @brief Create a qualified name from name and ns
      /// @param name the local name
      /// @param ns the namespace uri
      QName(const std::string &name, const std::optional<std::string> &ns) { set(name, ns); }

      /// @brief Create a qualified name from a string
      /// @param qname the name, `{ns}local` or `local`
      QName(const std::string &qname) { setQName(qname); }
      QName(const char *qname) { setQName(qname); }

      QName(const QName &other) = default;
      ~QName() = default;

      QName &operator=(const QName &other) = default;
      /// @brief operator =
      /// @param name the source
      /// @return this qname
      QName &operator=(const std::string &name)
      {
        setQName(name);
        return *this;
      }
      QName &operator=(const char *name)
      {
        setQName(name);
        return *this;
      }

      /// @brief Set the qualified name. Splits `{ns}local` into the namespace and the name.
      /// @param qname the name
      void setQName(const std::string &qname)
      {
        assign(qname);
        m_nsLen = 0;
        m_hasNs = false;
        if (!empty() && front() == '{')
        {
          if (auto pos = find('}'); pos != npos)
          {
            m_nsLen = pos - 1;
            m_hasNs = true;
          }
        }
      }

      /// @brief set the local name and namespace
      /// @param name the local name
      /// @param ns the namespace or `std::nullopt` for an unqualified name
      void set(const std::string &name, const std::optional<std::string> &ns)
      {
        if (ns)
        {
          assign("{" + *ns + "}" + name);
          m_nsLen = ns->length();
          m_hasNs = true;
        }
        else
        {
          assign(name);
          m_nsLen = 0;
          m_hasNs = false;
        }
      }

      /// @brief is there a namespace
      /// @return `true` if there is a namespace
      bool hasNs() const { return m_hasNs; }

      /// @brief get a string view to the local name portion of the qname
      /// @return string view of the name
      std::string_view getName() const
      {
        if (!hasNs())
          return std::string_view(*this);
        else
          return std::string_view(c_str() + m_nsLen + 2);
      }
      /// @brief get a string view to the namespace portion
      /// @return string view of the namespace or an empty string view
      std::string_view getNs() const
      {
        if (!hasNs())
          return std::string_view();
        else
          return std::string_view(c_str() + 1, m_nsLen);
      }
      /// @brief get the namespace as an optional
      /// @return the namespace or `std::nullopt` if unqualified
      std::optional<std::string> getOptionalNs() const
      {
        if (hasNs())
          return std::string(getNs());
        else
          return std::nullopt;
      }
      /// @brief get a pair of strings with the namespace and the name
      /// @return namespace and the name
      std::pair<std::string, std::string> getPair() const
      {
        return {std::string(getNs()), std::string(getName())};
      }

      /// @brief get the qname as a string
      /// @return this
      const std::string &str() const { return *this; }

    protected:
      size_t m_nsLen {0};
      bool m_hasNs {false};
    };

    /// @brief Qualify a tag name with a namespace in `{namespace}tagname` form
    /// @param tag the local tag name
    /// @param ns the namespace to qualify with, `std::nullopt` leaves the tag unqualified
    /// @return the qualified tag
    inline std::string qualify(const std::string &tag,
                               const std::optional<std::string> &ns = BASE_NS_1_0)
    {
      if (ns)
        return "{" + *ns + "}" + tag;
      else
        return tag;
    }
  }  // namespace xml
}  // namespace nclient
