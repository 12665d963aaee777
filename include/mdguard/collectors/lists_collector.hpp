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
#include <mdguard/core/logger.hpp>
#include <mdguard/dispatch/collector.hpp>
#include <mdguard/tokens/inline_text.hpp>

namespace mdguard
{
namespace collectors
{

/// \brief Bullet and ordered lists with the plain text of each item.
///
/// Lists are reported in the order they open, so a nested list follows its
/// parent. The item cap counts items across every list in the document.
class ListsCollector : public dispatch::Collector
{
public:
  static constexpr std::size_t DEFAULT_MAX_ITEMS = 50000;

  explicit ListsCollector(std::size_t maxItems = DEFAULT_MAX_ITEMS, bool allowHtml = false)
    : dispatch::Collector("lists",
                          dispatch::Interest{{"bullet_list_open", "bullet_list_close",
                                              "ordered_list_open", "ordered_list_close",
                                              "list_item_open", "list_item_close", "inline"},
                                             {}}),
      _maxItems(maxItems),
      _allowHtml(allowHtml),
      _lists(core::Json::array())
  {
  }

  void onToken(std::size_t tokenIndex, const tokens::CanonicalToken &token,
               const dispatch::DispatchContext &, const index::DocumentView &view) override
  {
    const auto &type = token.type();
    if (type == "bullet_list_open" || type == "ordered_list_open")
    {
      const auto &map = token.map();
      core::Json list;
      list["id"] = "list_" + std::to_string(_lists.size());
      list["kind"] = type == "ordered_list_open" ? "ordered" : "bullet";
      list["token_index"] = tokenIndex;
      list["depth"] = _open.size();
      list["start_line"] = map ? core::Json(map->start) : core::Json();
      auto section = map ? view.sectionOf(map->start) : std::nullopt;
      list["section_id"] = section ? core::Json(*section) : core::Json();
      list["items"] = core::Json::array();
      _open.push_back(_lists.size());
      _lists.push_back(std::move(list));
    }
    else if (type == "bullet_list_close" || type == "ordered_list_close")
    {
      if (!_open.empty())
        _open.pop_back();
    }
    else if (type == "list_item_open")
    {
      _items.emplace_back();
    }
    else if (type == "inline")
    {
      if (_items.empty())
        return;
      const std::string text = tokens::inlineText(token, _allowHtml);
      auto &buffer = _items.back();
      if (!buffer.empty() && !text.empty())
        buffer += ' ';
      buffer += text;
    }
    else if (type == "list_item_close")
    {
      if (_items.empty())
        return;
      std::string text = trim(_items.back());
      _items.pop_back();
      if (_open.empty())
        return;
      if (_itemCount >= _maxItems)
      {
        if (!_truncated)
        {
          MDGUARD_LOG_WARN("List item limit of " << _maxItems << " reached at token "
                                                 << tokenIndex);
          addWarning("ListItemLimitReached",
                     "more than " + std::to_string(_maxItems) + " list items, rest skipped",
                     static_cast<std::int64_t>(tokenIndex));
        }
        _truncated = true;
        return;
      }
      _lists[_open.back()]["items"].push_back(std::move(text));
      ++_itemCount;
    }
  }

  core::Json finalize(const index::DocumentView &) override
  {
    return core::Json{{"lists", _lists},
                      {"count", _itemCount},
                      {"truncated", _truncated},
                      {"max_allowed", _maxItems}};
  }

  bool truncated() const { return _truncated; }

private:
  std::size_t _maxItems;
  bool _allowHtml;
  core::Json _lists;
  /// Positions in _lists of the lists currently open, innermost last.
  std::vector<std::size_t> _open;
  /// Text of the list items currently open, innermost last.
  std::vector<std::string> _items;
  std::size_t _itemCount = 0;
  bool _truncated = false;

  static std::string trim(const std::string &s)
  {
    std::size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
      return std::string();
    return s.substr(first, s.find_last_not_of(" \t\r\n") - first + 1);
  }
};

} // namespace collectors
} // namespace mdguard
