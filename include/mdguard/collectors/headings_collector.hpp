// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <optional>
#include <string>

#include <mdguard/core/json.hpp>
#include <mdguard/dispatch/collector.hpp>
#include <mdguard/index/index_builder.hpp>
#include <mdguard/security/template_detector.hpp>
#include <mdguard/tokens/inline_text.hpp>

namespace mdguard
{
namespace collectors
{

/// \brief One record per heading_open ... heading_close run.
///
/// needs_escaping is set when the text carries HTML metacharacters or
/// template delimiters; renderers must escape such text.
class HeadingsCollector : public dispatch::Collector
{
public:
  /// \param allowHtml keep inline HTML in heading text.
  explicit HeadingsCollector(bool allowHtml = false)
    : dispatch::Collector("headings",
                          dispatch::Interest{{"heading_open", "inline", "heading_close"}, {}}),
      _allowHtml(allowHtml),
      _headings(core::Json::array())
  {
  }

  void onToken(std::size_t tokenIndex, const tokens::CanonicalToken &token,
               const dispatch::DispatchContext &, const index::DocumentView &view) override
  {
    const auto &type = token.type();
    if (type == "heading_open")
    {
      _open = tokenIndex;
      _level = index::IndexBuilder::headingLevel(token.tag());
      _line = token.map() ? std::optional<std::size_t>(token.map()->start) : std::nullopt;
      _text.clear();
    }
    else if (type == "inline" && _open)
    {
      _text += tokens::inlineText(token, _allowHtml);
    }
    else if (type == "heading_close" && _open)
    {
      const bool templated = security::containsTemplateSyntax(_text);
      core::Json record;
      record["level"] = _level;
      record["text"] = _text;
      record["line"] = _line ? core::Json(*_line) : core::Json();
      record["token_index"] = *_open;
      auto section = _line ? view.sectionOf(*_line) : std::nullopt;
      record["section_id"] = section ? core::Json(*section) : core::Json();
      record["contains_template_syntax"] = templated;
      record["needs_escaping"] =
        templated || _text.find_first_of("<>&\"'") != std::string::npos;
      _headings.push_back(std::move(record));
      _open.reset();
    }
  }

  core::Json finalize(const index::DocumentView &) override { return _headings; }

private:
  bool _allowHtml;
  core::Json _headings;
  std::optional<std::size_t> _open;
  int _level = 1;
  std::optional<std::size_t> _line;
  std::string _text;
};

} // namespace collectors
} // namespace mdguard
