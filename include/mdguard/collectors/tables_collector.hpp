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

/// \brief GFM tables as header cells plus body rows of cell text.
///
/// At most maxTables tables are kept per document; later ones are skipped
/// and the result is marked truncated.
class TablesCollector : public dispatch::Collector
{
public:
  static constexpr std::size_t DEFAULT_MAX_TABLES = 1000;

  explicit TablesCollector(std::size_t maxTables = DEFAULT_MAX_TABLES, bool allowHtml = false)
    : dispatch::Collector("tables",
                          dispatch::Interest{{"table_open", "thead_open", "thead_close",
                                              "tr_open", "tr_close", "th_open", "th_close",
                                              "td_open", "td_close", "inline", "table_close"},
                                             {}}),
      _maxTables(maxTables),
      _allowHtml(allowHtml)
  {
  }

  void onToken(std::size_t tokenIndex, const tokens::CanonicalToken &token,
               const dispatch::DispatchContext &, const index::DocumentView &view) override
  {
    const auto &type = token.type();
    if (type == "table_open")
    {
      if (_tables.size() >= _maxTables)
      {
        if (!_truncated)
        {
          MDGUARD_LOG_WARN("Table limit of " << _maxTables << " reached at token " << tokenIndex);
          addWarning("TableLimitReached",
                     "more than " + std::to_string(_maxTables) + " tables, rest skipped",
                     static_cast<std::int64_t>(tokenIndex));
        }
        _truncated = true;
        _current.reset();
        return;
      }
      Table table;
      table.tokenIndex = tokenIndex;
      if (token.map())
      {
        table.startLine = token.map()->start;
        table.endLine = token.map()->end;
        table.sectionId = view.sectionOf(token.map()->start);
      }
      _current = std::move(table);
    }
    else if (!_current)
    {
      return;
    }
    else if (type == "thead_open")
      _inHead = true;
    else if (type == "thead_close")
      _inHead = false;
    else if (type == "tr_open")
      _row.clear();
    else if (type == "th_open" || type == "td_open")
    {
      _inCell = true;
      _cell.clear();
    }
    else if (type == "inline" && _inCell)
      _cell += tokens::inlineText(token, _allowHtml);
    else if (type == "th_close" || type == "td_close")
    {
      _inCell = false;
      _row.push_back(trim(_cell));
    }
    else if (type == "tr_close")
    {
      if (_inHead)
        _current->headers = _row;
      else
        _current->rows.push_back(_row);
      _row.clear();
    }
    else if (type == "table_close")
    {
      _tables.push_back(std::move(*_current));
      _current.reset();
    }
  }

  core::Json finalize(const index::DocumentView &) override
  {
    core::Json tables = core::Json::array();
    for (std::size_t i = 0; i < _tables.size(); ++i)
    {
      const auto &table = _tables[i];
      core::Json record;
      record["id"] = "table_" + std::to_string(i);
      record["token_index"] = table.tokenIndex;
      record["start_line"] = table.startLine ? core::Json(*table.startLine) : core::Json();
      record["end_line"] = table.endLine ? core::Json(*table.endLine) : core::Json();
      record["section_id"] = table.sectionId ? core::Json(*table.sectionId) : core::Json();
      record["headers"] = table.headers;
      record["rows"] = table.rows;
      tables.push_back(std::move(record));
    }
    return core::Json{{"tables", std::move(tables)},
                      {"count", _tables.size()},
                      {"truncated", _truncated},
                      {"max_allowed", _maxTables}};
  }

  bool truncated() const { return _truncated; }

private:
  struct Table
  {
    std::size_t tokenIndex = 0;
    std::optional<std::size_t> startLine;
    std::optional<std::size_t> endLine;
    std::optional<std::string> sectionId;
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;
  };

  std::size_t _maxTables;
  bool _allowHtml;
  std::vector<Table> _tables;
  std::optional<Table> _current;
  std::vector<std::string> _row;
  std::string _cell;
  bool _inHead = false;
  bool _inCell = false;
  bool _truncated = false;

  static std::string trim(const std::string &s)
  {
    std::size_t first = s.find_first_not_of(" \t");
    if (first == std::string::npos)
      return std::string();
    return s.substr(first, s.find_last_not_of(" \t") - first + 1);
  }
};

} // namespace collectors
} // namespace mdguard
