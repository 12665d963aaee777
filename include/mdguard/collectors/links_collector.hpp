// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <mdguard/core/json.hpp>
#include <mdguard/dispatch/collector.hpp>
#include <mdguard/security/template_detector.hpp>
#include <mdguard/security/url_validator.hpp>

namespace mdguard
{
namespace collectors
{

/// \brief Extracts links from link_open / text / link_close runs, either as
/// top-level tokens or as children of inline tokens.
///
/// Every href goes through security::validateUrl(). Rejected links are kept
/// in the output with allowed=false and a reason, and raise a
/// URLValidationFailure warning.
class LinksCollector : public dispatch::Collector
{
public:
  explicit LinksCollector(security::UrlPolicy policy = defaultPolicy(), bool allowHtml = false)
    : dispatch::Collector("links", dispatch::Interest{{"link_open", "text", "code_inline",
                                                        "softbreak", "hardbreak", "html_inline",
                                                        "link_close", "inline"},
                                                       {}}),
      _policy(std::move(policy)),
      _allowHtml(allowHtml)
  {
  }

  static security::UrlPolicy defaultPolicy()
  {
    security::UrlPolicy policy;
    policy.allowRelative = true;
    return policy;
  }

  void onToken(std::size_t tokenIndex, const tokens::CanonicalToken &token,
               const dispatch::DispatchContext &ctx, const index::DocumentView &view) override
  {
    if (token.type() == "inline" && !token.children().empty())
    {
      for (const auto &child : token.children())
      {
        feed(tokenIndex, child, ctx.line(), view);
      }
      return;
    }
    feed(tokenIndex, token, ctx.line(), view);
  }

  core::Json finalize(const index::DocumentView &) override
  {
    core::Json out = core::Json::array();
    for (const auto &link : _links)
    {
      out.push_back(link);
    }
    return out;
  }

private:
  security::UrlPolicy _policy;
  bool _allowHtml;
  std::vector<core::Json> _links;
  std::optional<core::Json> _current;
  std::string _text;
  int _depth = 0;

  void feed(std::size_t tokenIndex, const tokens::CanonicalToken &token,
            std::optional<std::size_t> ctxLine, const index::DocumentView &view)
  {
    const auto &type = token.type();
    if (type == "link_open")
    {
      if (++_depth == 1)
      {
        startLink(tokenIndex, token, ctxLine, view);
      }
    }
    else if (type == "link_close")
    {
      if (_depth > 0 && --_depth == 0)
      {
        finishLink();
      }
    }
    else if (_current)
    {
      if (type == "text" || type == "code_inline" || type == "inline")
        _text += token.content();
      else if (type == "softbreak" || type == "hardbreak")
        _text += ' ';
      else if (type == "html_inline" && _allowHtml)
        _text += token.content();
    }
  }

  void startLink(std::size_t tokenIndex, const tokens::CanonicalToken &token,
                 std::optional<std::size_t> ctxLine, const index::DocumentView &view)
  {
    const std::string href = token.attrGet("href").value_or("");
    std::optional<std::size_t> line = token.map() ? std::optional<std::size_t>(token.map()->start)
                                                  : ctxLine;
    auto validation = security::validateUrl(href, _policy);

    core::Json link;
    link["id"] = "link_" + std::to_string(_links.size());
    link["url"] = href;
    link["normalized"] = validation.valid ? core::Json(validation.normalized) : core::Json();
    link["allowed"] = validation.valid;
    link["reason"] = validation.reason;
    link["warnings"] = validation.warnings;
    link["token_index"] = tokenIndex;
    link["line"] = line ? core::Json(*line) : core::Json();
    auto section = line ? view.sectionOf(*line) : std::nullopt;
    link["section_id"] = section ? core::Json(*section) : core::Json();
    _current = std::move(link);
    _text.clear();

    if (!validation.valid)
    {
      addWarning("URLValidationFailure", href + ": " + validation.reason,
                 static_cast<std::int64_t>(tokenIndex));
    }
  }

  void finishLink()
  {
    if (!_current)
      return;
    (*_current)["text"] = _text;
    (*_current)["contains_template_syntax"] = security::containsTemplateSyntax(_text);
    _links.push_back(std::move(*_current));
    _current.reset();
    _text.clear();
  }
};

} // namespace collectors
} // namespace mdguard
