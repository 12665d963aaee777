// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <mdguard/core/json.hpp>
#include <mdguard/core/logger.hpp>
#include <mdguard/dispatch/collector.hpp>
#include <mdguard/security/html_sanitizer.hpp>

namespace mdguard
{
namespace collectors
{

struct HtmlCollectorOptions
{
  /// Off by default: raw HTML is never collected unless asked for.
  bool allowHtml = false;
  bool sanitizeOnFinalize = false;
};

/// \brief Collects html_block and html_inline fragments when enabled.
///
/// Every fragment starts with needs_sanitization=true. Only a successful
/// sanitizer pass clears it; an unavailable or failing sanitizer leaves the
/// content as-is and records a warning.
class HtmlCollector : public dispatch::Collector
{
public:
  explicit HtmlCollector(HtmlCollectorOptions options = HtmlCollectorOptions(),
                         std::shared_ptr<const security::HtmlSanitizer> sanitizer =
                           std::make_shared<security::AllowlistSanitizer>())
    : dispatch::Collector("html",
                          dispatch::Interest{{"html_block", "html_inline", "inline"}, {}}),
      _options(options),
      _sanitizer(std::move(sanitizer)),
      _fragments(core::Json::array())
  {
  }

  bool shouldProcess(const tokens::CanonicalToken &, const dispatch::DispatchContext &,
                     const index::DocumentView &) const override
  {
    return _options.allowHtml;
  }

  void onToken(std::size_t tokenIndex, const tokens::CanonicalToken &token,
               const dispatch::DispatchContext &, const index::DocumentView &view) override
  {
    if (token.type() == "inline")
    {
      for (const auto &child : token.children())
      {
        if (child.type() == "html_inline")
          add(tokenIndex, child, token, view);
      }
      return;
    }
    add(tokenIndex, token, token, view);
  }

  core::Json finalize(const index::DocumentView &) override
  {
    if (!_options.sanitizeOnFinalize || _fragments.empty())
    {
      return _fragments;
    }
    if (!_sanitizer || !_sanitizer->available())
    {
      MDGUARD_LOG_WARN("HTML sanitizer unavailable, " << _fragments.size()
                                                      << " fragment(s) left unsanitized");
      addWarning("SanitizerUnavailable", "HTML fragments returned unsanitized");
      return _fragments;
    }

    for (auto &fragment : _fragments)
    {
      auto cleaned = _sanitizer->sanitize(fragment["content"].get<std::string>());
      if (!cleaned.ok)
      {
        addWarning("SanitizerFailed", cleaned.error,
                   fragment["token_index"].get<std::int64_t>());
        continue;
      }
      fragment["content"] = cleaned.html;
      fragment["needs_sanitization"] = false;
      fragment["was_sanitized"] = true;
    }
    return _fragments;
  }

private:
  HtmlCollectorOptions _options;
  std::shared_ptr<const security::HtmlSanitizer> _sanitizer;
  core::Json _fragments;

  /// Lines come from the fragment, or the enclosing inline token for
  /// html_inline children which carry no map.
  void add(std::size_t tokenIndex, const tokens::CanonicalToken &fragment,
           const tokens::CanonicalToken &owner, const index::DocumentView &view)
  {
    const auto &map = fragment.map() ? fragment.map() : owner.map();
    core::Json record;
    record["token_index"] = tokenIndex;
    record["kind"] = fragment.type();
    record["content"] = fragment.content();
    record["start_line"] = map ? core::Json(map->start) : core::Json();
    record["end_line"] = map ? core::Json(map->end) : core::Json();
    auto section = map ? view.sectionOf(map->start) : std::nullopt;
    record["section_id"] = section ? core::Json(*section) : core::Json();
    record["needs_sanitization"] = true;
    record["was_sanitized"] = false;
    _fragments.push_back(std::move(record));
  }
};

} // namespace collectors
} // namespace mdguard
