// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <climits>
#include <map>
#include <set>
#include <string>
#include <vector>

#include <mdguard/security/url_validator.hpp>

#ifdef MDGUARD_USE_LIBXML2
#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/tree.h>
#endif

namespace mdguard
{
namespace security
{

struct SanitizeResult
{
  bool ok = false;
  std::string html;
  std::string error;
};

/// \brief Hook used by the HTML collector at finalize time.
class HtmlSanitizer
{
public:
  virtual ~HtmlSanitizer() = default;

  /// \brief False when the implementation cannot sanitize in this build.
  virtual bool available() const = 0;

  virtual SanitizeResult sanitize(const std::string &fragment) const = 0;
};

/// \brief Minimal allowlist sanitizer on top of the libxml2 HTML parser.
///
/// Allowed elements keep only allowlisted attributes; URL attributes must
/// pass validateUrl(). Script-like elements are dropped with their content,
/// every other element is unwrapped to its children. Comments and processing
/// instructions are removed.
class AllowlistSanitizer : public HtmlSanitizer
{
public:
  AllowlistSanitizer()
    : _tags{"a", "b", "em", "i", "img", "li", "ol", "p", "strong", "u", "ul"},
      _attributes{{"a", {"href", "title"}}, {"img", {"src", "alt"}}},
      _dropWithContent{"script", "style", "iframe",   "object", "embed",
                       "noscript", "template", "title", "textarea", "svg", "math"}
  {
    _urlPolicy.allowRelative = true;
  }

  bool available() const override
  {
#ifdef MDGUARD_USE_LIBXML2
    return true;
#else
    return false;
#endif
  }

  SanitizeResult sanitize(const std::string &fragment) const override
  {
    SanitizeResult result;
#ifdef MDGUARD_USE_LIBXML2
    // The wrapper keeps bare text out of implied <p> elements. It is not
    // allowlisted, so it unwraps away.
    const std::string wrapped = "<div>" + fragment + "</div>";
    if (wrapped.size() > static_cast<std::size_t>(INT_MAX))
    {
      result.error = "fragment too large";
      return result;
    }
    htmlDocPtr doc = htmlReadMemory(wrapped.data(), static_cast<int>(wrapped.size()), nullptr,
                                    "UTF-8",
                                    HTML_PARSE_RECOVER | HTML_PARSE_NOERROR |
                                      HTML_PARSE_NOWARNING | HTML_PARSE_NONET);
    if (!doc)
    {
      result.error = "libxml2 could not parse fragment";
      return result;
    }
    xmlNode *root = xmlDocGetRootElement(doc);
    for (xmlNode *section = root ? root->children : nullptr; section; section = section->next)
    {
      if (section->type == XML_ELEMENT_NODE &&
          std::string(reinterpret_cast<const char *>(section->name)) == "body")
      {
        emitChildren(section, result.html);
      }
    }
    xmlFreeDoc(doc);
    result.ok = true;
#else
    (void)fragment;
    result.error = "built without libxml2";
#endif
    return result;
  }

private:
  std::set<std::string> _tags;
  std::map<std::string, std::set<std::string>> _attributes;
  std::set<std::string> _dropWithContent;
  UrlPolicy _urlPolicy;

  static void escapeInto(const char *text, std::string &out, bool attribute)
  {
    for (const char *p = text; p && *p; ++p)
    {
      switch (*p)
      {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += attribute ? "&quot;" : "\"";
        break;
      default:
        out += *p;
      }
    }
  }

#ifdef MDGUARD_USE_LIBXML2
  void emitChildren(xmlNode *parent, std::string &out) const
  {
    for (xmlNode *cur = parent->children; cur; cur = cur->next)
    {
      if (cur->type == XML_TEXT_NODE || cur->type == XML_CDATA_SECTION_NODE)
      {
        escapeInto(reinterpret_cast<const char *>(cur->content), out, false);
      }
      else if (cur->type == XML_ELEMENT_NODE)
      {
        emitElement(cur, out);
      }
    }
  }

  void emitElement(xmlNode *node, std::string &out) const
  {
    std::string tag = detail::toLowerAscii(reinterpret_cast<const char *>(node->name));
    if (_dropWithContent.count(tag))
      return;
    if (!_tags.count(tag))
    {
      emitChildren(node, out);
      return;
    }

    out += "<" + tag;
    auto allowed = _attributes.find(tag);
    for (xmlAttr *attr = node->properties; attr && allowed != _attributes.end(); attr = attr->next)
    {
      std::string name = detail::toLowerAscii(reinterpret_cast<const char *>(attr->name));
      if (!allowed->second.count(name))
        continue;
      xmlChar *raw = xmlNodeListGetString(node->doc, attr->children, 1);
      std::string value = raw ? reinterpret_cast<const char *>(raw) : "";
      if (raw)
        xmlFree(raw);
      if (name == "href" || name == "src")
      {
        UrlValidation url = validateUrl(value, _urlPolicy);
        if (!url.valid)
          continue;
        value = url.normalized;
      }
      out += " " + name + "=\"";
      escapeInto(value.c_str(), out, true);
      out += "\"";
    }
    out += ">";
    if (tag == "img")
      return;
    emitChildren(node, out);
    out += "</" + tag + ">";
  }
#endif
};

} // namespace security
} // namespace mdguard
