// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include <mdguard/core/errors.hpp>
#include <mdguard/core/logger.hpp>
#include <mdguard/core/resource_limits.hpp>
#include <mdguard/tokens/canonical_token.hpp>
#include <mdguard/tokens/inline_text.hpp>

namespace mdguard
{
namespace index
{

/// \brief Heading-delimited range of source lines.
struct Section
{
  std::string id;
  std::size_t headingToken = 0;
  int level = 1;
  std::string text;
  std::size_t startLine = 0;
  std::size_t endLine = 0;
};

/// \brief Fenced code block location. lang is the first word of info.
struct Fence
{
  std::size_t tokenIndex = 0;
  std::size_t startLine = 0;
  std::size_t endLine = 0;
  std::string info;
  std::string lang;
};

struct IndexStats
{
  std::size_t sectionPushes = 0;
  std::size_t sectionPops = 0;
  std::size_t maxSectionDepth = 0;
  std::size_t maxNestingDepth = 0;
  std::size_t unmatchedCloses = 0;
};

/// \brief Derived lookups over one canonical token list.
struct DocumentIndex
{
  std::unordered_map<std::string, std::vector<std::size_t>> byType;
  /// Nearest enclosing open token per token, -1 at top level.
  std::vector<std::int64_t> parents;
  /// Open token index -> matching close token index.
  std::unordered_map<std::size_t, std::size_t> pairs;
  /// Ordered by start line.
  std::vector<Section> sections;
  std::vector<Fence> fences;
  /// Largest map end seen (exclusive). Sections still open at the end close
  /// on the line before it.
  std::size_t lineCount = 0;
  IndexStats stats;
};

/// \brief Builds every index in a single forward pass plus a heading pass.
/// No recursion anywhere, so hostile nesting cannot exhaust the stack.
class IndexBuilder
{
public:
  /// \throws core::NestingTooDeep at the first open token that would exceed
  /// limits.maxNesting.
  static DocumentIndex build(const std::vector<tokens::CanonicalToken> &tokens,
                             const core::ResourceLimits &limits)
  {
    DocumentIndex index;
    index.parents.assign(tokens.size(), -1);

    std::vector<std::size_t> openStack;
    for (std::size_t i = 0; i < tokens.size(); ++i)
    {
      const auto &token = tokens[i];
      index.byType[token.type()].push_back(i);

      if (token.map())
      {
        index.lineCount = std::max(index.lineCount, token.map()->end);
      }

      if (!openStack.empty())
      {
        index.parents[i] = static_cast<std::int64_t>(openStack.back());
      }

      if (token.nesting() == 1)
      {
        if (openStack.size() + 1 > limits.maxNesting)
        {
          MDGUARD_LOG_WARN("Nesting limit " << limits.maxNesting << " exceeded at token " << i
                                            << " (" << token.type() << ")");
          throw core::NestingTooDeep(i, openStack.size() + 1, limits.maxNesting, token.type());
        }
        openStack.push_back(i);
        index.stats.maxNestingDepth = std::max(index.stats.maxNestingDepth, openStack.size());
      }
      else if (token.nesting() == -1)
      {
        if (openStack.empty())
        {
          ++index.stats.unmatchedCloses;
        }
        else
        {
          index.pairs[openStack.back()] = i;
          openStack.pop_back();
        }
      }

      if (token.type() == "fence" && token.map())
      {
        Fence fence;
        fence.tokenIndex = i;
        fence.startLine = token.map()->start;
        fence.endLine = token.map()->end;
        fence.info = trim(token.info());
        fence.lang = fence.info.substr(0, fence.info.find_first_of(" \t"));
        index.fences.push_back(std::move(fence));
      }
    }

    buildSections(tokens, index);
    MDGUARD_LOG_DEBUG("Indexed " << tokens.size() << " tokens, " << index.sections.size()
                                 << " sections, max depth " << index.stats.maxNestingDepth);
    return index;
  }

  /// \brief "h1".."h6" -> 1..6, anything else -> 1.
  static int headingLevel(const std::string &tag)
  {
    if (tag.size() == 2 && (tag[0] == 'h' || tag[0] == 'H') && tag[1] >= '1' && tag[1] <= '6')
    {
      return tag[1] - '0';
    }
    return 1;
  }

private:
  struct OpenSection
  {
    std::size_t headingToken;
    int level;
    std::size_t startLine;
    std::string text;
  };

  static std::string trim(const std::string &s)
  {
    const char *ws = " \t\r\n";
    std::size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos)
      return std::string();
    return s.substr(first, s.find_last_not_of(ws) - first + 1);
  }

  /// Each heading is pushed once and popped once, so the pass is O(H).
  static void buildSections(const std::vector<tokens::CanonicalToken> &tokens,
                            DocumentIndex &index)
  {
    auto headings = index.byType.find("heading_open");
    if (headings == index.byType.end())
      return;

    std::vector<OpenSection> stack;
    std::vector<Section> closed;
    auto close = [&](const OpenSection &frame, std::size_t endLine)
    {
      Section section;
      section.headingToken = frame.headingToken;
      section.level = frame.level;
      section.text = frame.text;
      section.startLine = frame.startLine;
      section.endLine = std::max(endLine, frame.startLine);
      closed.push_back(std::move(section));
      ++index.stats.sectionPops;
    };

    for (std::size_t h : headings->second)
    {
      const auto &heading = tokens[h];
      const int level = headingLevel(heading.tag());
      const std::size_t start = heading.map() ? heading.map()->start : 0;

      while (!stack.empty() && stack.back().level >= level)
      {
        close(stack.back(), start == 0 ? 0 : start - 1);
        stack.pop_back();
      }

      std::string text;
      if (h + 1 < tokens.size() && tokens[h + 1].type() == "inline")
      {
        text = tokens::inlineText(tokens[h + 1]);
      }
      stack.push_back(OpenSection{h, level, start, std::move(text)});
      ++index.stats.sectionPushes;
      index.stats.maxSectionDepth = std::max(index.stats.maxSectionDepth, stack.size());
    }

    while (!stack.empty())
    {
      close(stack.back(), index.lineCount == 0 ? 0 : index.lineCount - 1);
      stack.pop_back();
    }

    std::stable_sort(closed.begin(), closed.end(),
                     [](const Section &a, const Section &b)
                     {
                       return a.startLine != b.startLine ? a.startLine < b.startLine
                                                         : a.headingToken < b.headingToken;
                     });
    for (std::size_t i = 0; i < closed.size(); ++i)
    {
      closed[i].id = "section_" + std::to_string(i);
    }
    index.sections = std::move(closed);
  }
};

} // namespace index
} // namespace mdguard
