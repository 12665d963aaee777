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
#include <mdguard/core/logger.hpp>
#include <mdguard/dispatch/collector.hpp>

namespace mdguard
{
namespace collectors
{

/// \brief Fenced and indented code blocks, capped per document.
///
/// Fence info and language come from the fence index; indented blocks have
/// neither. Blocks past the cap are skipped and the result is marked
/// truncated.
class CodeBlocksCollector : public dispatch::Collector
{
public:
  static constexpr std::size_t DEFAULT_MAX_BLOCKS = 2000;

  explicit CodeBlocksCollector(std::size_t maxBlocks = DEFAULT_MAX_BLOCKS)
    : dispatch::Collector("codeblocks", dispatch::Interest{{"fence", "code_block"}, {}}),
      _maxBlocks(maxBlocks),
      _blocks(core::Json::array())
  {
  }

  void onToken(std::size_t tokenIndex, const tokens::CanonicalToken &token,
               const dispatch::DispatchContext &, const index::DocumentView &view) override
  {
    if (_blocks.size() >= _maxBlocks)
    {
      if (!_truncated)
      {
        MDGUARD_LOG_WARN("Code block limit of " << _maxBlocks << " reached at token "
                                                << tokenIndex);
        addWarning("CodeBlockLimitReached",
                   "more than " + std::to_string(_maxBlocks) + " code blocks, rest skipped",
                   static_cast<std::int64_t>(tokenIndex));
      }
      _truncated = true;
      return;
    }

    std::string info;
    std::string lang;
    if (const auto *fence = view.fenceFor(tokenIndex))
    {
      info = fence->info;
      lang = fence->lang;
    }

    const auto &map = token.map();
    core::Json record;
    record["id"] = "code_" + std::to_string(_blocks.size());
    record["kind"] = token.type();
    record["token_index"] = tokenIndex;
    record["lang"] = lang;
    record["info"] = info;
    record["code"] = token.content();
    record["start_line"] = map ? core::Json(map->start) : core::Json();
    record["end_line"] = map ? core::Json(map->end) : core::Json();
    auto section = map ? view.sectionOf(map->start) : std::nullopt;
    record["section_id"] = section ? core::Json(*section) : core::Json();
    _blocks.push_back(std::move(record));
  }

  core::Json finalize(const index::DocumentView &) override
  {
    return core::Json{{"codeblocks", _blocks},
                      {"count", _blocks.size()},
                      {"truncated", _truncated},
                      {"max_allowed", _maxBlocks}};
  }

  bool truncated() const { return _truncated; }

private:
  std::size_t _maxBlocks;
  core::Json _blocks;
  bool _truncated = false;
};

} // namespace collectors
} // namespace mdguard
