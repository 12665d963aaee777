// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <mdguard/core/json.hpp>
#include <mdguard/dispatch/collector.hpp>
#include <mdguard/tokens/inline_text.hpp>

namespace mdguard
{
namespace collectors
{

/// \brief GFM task items: list items whose first inline starts with
/// "[ ]", "[x]" or "[X]" followed by a space or the end of the text.
class TaskListsCollector : public dispatch::Collector
{
public:
  explicit TaskListsCollector(bool allowHtml = false)
    : dispatch::Collector("tasklists", dispatch::Interest{{"list_item_open", "list_item_close",
                                                           "inline"},
                                                          {}}),
      _allowHtml(allowHtml),
      _tasks(core::Json::array())
  {
  }

  void onToken(std::size_t tokenIndex, const tokens::CanonicalToken &token,
               const dispatch::DispatchContext &ctx, const index::DocumentView &view) override
  {
    const auto &type = token.type();
    if (type == "list_item_open")
    {
      _firstInline.push_back(true);
      return;
    }
    if (type == "list_item_close")
    {
      if (!_firstInline.empty())
        _firstInline.pop_back();
      return;
    }
    if (_firstInline.empty() || !_firstInline.back())
      return;
    _firstInline.back() = false;

    const std::string text = tokens::inlineText(token, _allowHtml);
    auto checked = marker(text);
    if (!checked)
      return;

    std::string label = text.substr(3);
    std::size_t first = label.find_first_not_of(' ');
    label = first == std::string::npos ? std::string() : label.substr(first);

    auto line = ctx.line();
    core::Json task;
    task["text"] = label;
    task["checked"] = *checked;
    task["token_index"] = tokenIndex;
    task["line"] = line ? core::Json(*line) : core::Json();
    auto section = line ? view.sectionOf(*line) : std::nullopt;
    task["section_id"] = section ? core::Json(*section) : core::Json();
    _tasks.push_back(std::move(task));
  }

  core::Json finalize(const index::DocumentView &) override { return _tasks; }

private:
  bool _allowHtml;
  core::Json _tasks;
  /// One entry per open list item: true until its first inline is seen.
  std::vector<bool> _firstInline;

  /// Checked state of a leading task marker, nullopt when there is none.
  static std::optional<bool> marker(const std::string &text)
  {
    if (text.size() < 3 || text[0] != '[' || text[2] != ']')
      return std::nullopt;
    if (text.size() > 3 && text[3] != ' ')
      return std::nullopt;
    if (text[1] == ' ')
      return false;
    if (text[1] == 'x' || text[1] == 'X')
      return true;
    return std::nullopt;
  }
};

} // namespace collectors
} // namespace mdguard
