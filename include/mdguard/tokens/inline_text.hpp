// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <string>

#include <mdguard/tokens/canonical_token.hpp>

namespace mdguard
{
namespace tokens
{

namespace detail
{
  /// Removes tag-like runs: '<' followed by a letter, '/', '!' or '?', up to
  /// the next '>'. A '<' that never closes is kept as text.
  inline std::string stripTags(const std::string &text)
  {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i)
    {
      if (text[i] == '<' && i + 1 < text.size())
      {
        const unsigned char next = static_cast<unsigned char>(text[i + 1]);
        if (std::isalpha(next) || next == '/' || next == '!' || next == '?')
        {
          std::size_t close = text.find('>', i + 1);
          if (close != std::string::npos)
          {
            i = close;
            continue;
          }
        }
      }
      out += text[i];
    }
    return out;
  }
} // namespace detail

/// \brief Plain text of an inline token.
///
/// Built from the children: text, code_inline and image alt text are joined,
/// breaks become a space, html_inline only counts when \p allowHtml is set.
/// An inline token without children falls back to its content, with markup
/// removed unless \p allowHtml is set.
inline std::string inlineText(const CanonicalToken &token, bool allowHtml = false)
{
  if (token.children().empty())
  {
    return allowHtml ? token.content() : detail::stripTags(token.content());
  }

  std::string text;
  for (const auto &child : token.children())
  {
    const auto &type = child.type();
    if (type == "text" || type == "code_inline" || type == "image")
      text += child.content();
    else if (type == "softbreak" || type == "hardbreak")
      text += ' ';
    else if (type == "html_inline" && allowHtml)
      text += child.content();
  }
  return text;
}

} // namespace tokens
} // namespace mdguard
