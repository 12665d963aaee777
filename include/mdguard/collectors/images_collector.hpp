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

#include <mdguard/core/json.hpp>
#include <mdguard/dispatch/collector.hpp>
#include <mdguard/security/url_validator.hpp>

namespace mdguard
{
namespace collectors
{

/// \brief Extracts image tokens, top-level or inline children.
class ImagesCollector : public dispatch::Collector
{
public:
  explicit ImagesCollector(security::UrlPolicy policy = defaultPolicy())
    : dispatch::Collector("images",
                          dispatch::Interest{{"image", "inline"}, {}}),
      _policy(std::move(policy)),
      _images(core::Json::array())
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
    if (token.type() == "image")
    {
      add(tokenIndex, token, ctx.line(), view);
      return;
    }
    for (const auto &child : token.children())
    {
      if (child.type() == "image")
        add(tokenIndex, child, ctx.line(), view);
    }
  }

  core::Json finalize(const index::DocumentView &) override { return _images; }

private:
  security::UrlPolicy _policy;
  core::Json _images;

  void add(std::size_t tokenIndex, const tokens::CanonicalToken &image,
           std::optional<std::size_t> ctxLine, const index::DocumentView &view)
  {
    const std::string src = image.attrGet("src").value_or("");
    std::optional<std::size_t> line = image.map() ? std::optional<std::size_t>(image.map()->start)
                                                  : ctxLine;
    auto validation = security::validateUrl(src, _policy);

    // markdown-it keeps alt text in content; some producers only set the attr.
    std::string alt = image.content();
    if (alt.empty())
      alt = image.attrGet("alt").value_or("");

    core::Json record;
    record["src"] = src;
    record["normalized"] = validation.valid ? core::Json(validation.normalized) : core::Json();
    record["alt"] = alt;
    record["title"] = image.attrGet("title").value_or("");
    record["allowed"] = validation.valid;
    record["reason"] = validation.reason;
    record["token_index"] = tokenIndex;
    record["line"] = line ? core::Json(*line) : core::Json();
    auto section = line ? view.sectionOf(*line) : std::nullopt;
    record["section_id"] = section ? core::Json(*section) : core::Json();
    _images.push_back(std::move(record));

    if (!validation.valid)
    {
      addWarning("URLValidationFailure", src + ": " + validation.reason,
                 static_cast<std::int64_t>(tokenIndex));
    }
  }
};

} // namespace collectors
} // namespace mdguard
