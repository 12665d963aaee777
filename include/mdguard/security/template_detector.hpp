// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <array>
#include <cctype>
#include <optional>
#include <string>

namespace mdguard
{
namespace security
{

namespace detail
{

struct TemplateMarker
{
  const char *text;
  bool caseInsensitive;
};

/// Jinja/Handlebars/Mustache, Jinja statements, ERB/EJS, PHP, shell and
/// JS template literals, Ruby interpolation.
constexpr std::array<TemplateMarker, 6> TEMPLATE_MARKERS{{
  {"{{", false},
  {"{%", false},
  {"<%=", false},
  {"<?php", true},
  {"${", false},
  {"#{", false},
}};

inline bool matchesAt(const std::string &text, std::size_t pos, const TemplateMarker &marker)
{
  for (std::size_t i = 0; marker.text[i] != '\0'; ++i)
  {
    if (pos + i >= text.size())
      return false;
    char a = text[pos + i];
    char b = marker.text[i];
    if (marker.caseInsensitive)
    {
      a = static_cast<char>(std::tolower(static_cast<unsigned char>(a)));
      b = static_cast<char>(std::tolower(static_cast<unsigned char>(b)));
    }
    if (a != b)
      return false;
  }
  return true;
}

} // namespace detail

/// \brief First template delimiter found in text, scanning left to right.
inline std::optional<std::string> findTemplateMarker(const std::string &text)
{
  for (std::size_t pos = 0; pos < text.size(); ++pos)
  {
    const char c = text[pos];
    if (c != '{' && c != '<' && c != '$' && c != '#')
      continue;
    for (const auto &marker : detail::TEMPLATE_MARKERS)
    {
      if (detail::matchesAt(text, pos, marker))
        return text.substr(pos, std::char_traits<char>::length(marker.text));
    }
  }
  return std::nullopt;
}

/// \brief Flags text carrying template delimiters. Never rewrites it.
inline bool containsTemplateSyntax(const std::string &text)
{
  return findTemplateMarker(text).has_value();
}

} // namespace security
} // namespace mdguard
