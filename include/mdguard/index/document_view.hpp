// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <mdguard/index/index_builder.hpp>
#include <mdguard/tokens/canonical_token.hpp>

namespace mdguard
{
namespace index
{

/// \brief Immutable tokens plus indices. Collectors only ever see this, so a
/// view may outlive the warehouse that built it.
class DocumentView
{
public:
  DocumentView(std::vector<tokens::CanonicalToken> tokens, DocumentIndex index)
    : _tokens(std::move(tokens)), _index(std::move(index))
  {
  }

  const std::vector<tokens::CanonicalToken> &tokens() const { return _tokens; }
  std::size_t size() const { return _tokens.size(); }
  const tokens::CanonicalToken &token(std::size_t idx) const { return _tokens.at(idx); }

  /// \brief Token indices of one type, in document order.
  const std::vector<std::size_t> &byType(const std::string &type) const
  {
    static const std::vector<std::size_t> none;
    auto it = _index.byType.find(type);
    return it == _index.byType.end() ? none : it->second;
  }

  std::optional<std::size_t> parent(std::size_t idx) const
  {
    if (idx >= _index.parents.size() || _index.parents[idx] < 0)
      return std::nullopt;
    return static_cast<std::size_t>(_index.parents[idx]);
  }

  /// \brief Close token matching an open token.
  std::optional<std::size_t> rangeFor(std::size_t openIdx) const
  {
    auto it = _index.pairs.find(openIdx);
    if (it == _index.pairs.end())
      return std::nullopt;
    return it->second;
  }

  const std::vector<Section> &sections() const { return _index.sections; }
  const std::vector<Fence> &fences() const { return _index.fences; }
  std::size_t lineCount() const { return _index.lineCount; }

  /// \brief Fence entry recorded for a token, if any.
  const Fence *fenceFor(std::size_t tokenIndex) const
  {
    const auto &fences = _index.fences;
    auto it = std::lower_bound(fences.begin(), fences.end(), tokenIndex,
                               [](const Fence &fence, std::size_t value)
                               { return fence.tokenIndex < value; });
    if (it == fences.end() || it->tokenIndex != tokenIndex)
      return nullptr;
    return &*it;
  }
  const IndexStats &stats() const { return _index.stats; }

  /// \brief Id of the innermost section containing line, by binary search on
  /// section start lines.
  std::optional<std::string> sectionOf(std::size_t line) const
  {
    const auto &sections = _index.sections;
    auto it = std::upper_bound(sections.begin(), sections.end(), line,
                               [](std::size_t value, const Section &section)
                               { return value < section.startLine; });
    while (it != sections.begin())
    {
      --it;
      if (it->startLine <= line && line <= it->endLine)
        return it->id;
    }
    return std::nullopt;
  }

  /// \brief sectionOf() for a token's start line.
  std::optional<std::string> sectionOfToken(const tokens::CanonicalToken &token) const
  {
    if (!token.map())
      return std::nullopt;
    return sectionOf(token.map()->start);
  }

private:
  std::vector<tokens::CanonicalToken> _tokens;
  DocumentIndex _index;
};

using DocumentViewPtr = std::shared_ptr<const DocumentView>;

} // namespace index
} // namespace mdguard
