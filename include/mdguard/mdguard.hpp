// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "collectors/codeblocks_collector.hpp"
#include "collectors/headings_collector.hpp"
#include "collectors/html_collector.hpp"
#include "collectors/images_collector.hpp"
#include "collectors/links_collector.hpp"
#include "collectors/lists_collector.hpp"
#include "collectors/sections_collector.hpp"
#include "collectors/tables_collector.hpp"
#include "collectors/tasklists_collector.hpp"
#include "core/config_loader.hpp"
#include "core/errors.hpp"
#include "core/json.hpp"
#include "core/logger.hpp"
#include "core/resource_limits.hpp"
#include "dispatch/token_warehouse.hpp"
#include "security/html_sanitizer.hpp"
#include "security/template_detector.hpp"
#include "security/url_validator.hpp"
#include "tokens/canonical_token.hpp"
#include "tokens/inline_text.hpp"
#include "tokens/raw_token.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mdguard
{

/// \brief Everything one extraction pass produced.
struct ExtractionResult
{
  std::map<std::string, core::Json> results;
  std::vector<core::DispatchIssue> issues;
  std::map<std::string, std::vector<dispatch::CollectorWarning>> warnings;

  core::Json toJson() const
  {
    core::Json out;
    out["results"] = core::Json::object();
    for (const auto &entry : results)
    {
      out["results"][entry.first] = entry.second;
    }

    out["issues"] = core::Json::array();
    for (const auto &issue : issues)
    {
      out["issues"].push_back({{"collector", issue.collector},
                               {"token_index", issue.tokenIndex},
                               {"kind", core::issueKindName(issue.kind)},
                               {"detail", issue.detail}});
    }

    out["warnings"] = core::Json::object();
    for (const auto &entry : warnings)
    {
      core::Json list = core::Json::array();
      for (const auto &warning : entry.second)
      {
        list.push_back({{"kind", warning.kind},
                        {"message", warning.message},
                        {"token_index", warning.tokenIndex}});
      }
      out["warnings"][entry.first] = std::move(list);
    }
    return out;
  }
};

/// \brief The built-in collectors configured from config, in dispatch order.
inline std::vector<dispatch::CollectorPtr> builtinCollectors(const core::ExtractionConfig &config)
{
  collectors::HtmlCollectorOptions htmlOptions;
  htmlOptions.allowHtml = config.allowHtml;
  htmlOptions.sanitizeOnFinalize = config.sanitizeOnFinalize;

  return {std::make_shared<collectors::SectionsCollector>(),
          std::make_shared<collectors::HeadingsCollector>(config.allowHtml),
          std::make_shared<collectors::LinksCollector>(config.linkPolicy, config.allowHtml),
          std::make_shared<collectors::ImagesCollector>(config.linkPolicy),
          std::make_shared<collectors::TablesCollector>(config.maxTables, config.allowHtml),
          std::make_shared<collectors::CodeBlocksCollector>(config.maxCodeBlocks),
          std::make_shared<collectors::ListsCollector>(config.maxListItems, config.allowHtml),
          std::make_shared<collectors::TaskListsCollector>(config.allowHtml),
          std::make_shared<collectors::HtmlCollector>(htmlOptions)};
}

/// \brief Runs one guarded extraction over a token stream with the built-in
/// collectors.
/// \throws core::DocumentTooLarge, core::NestingTooDeep, and
/// core::CollectorFailure when raiseOnCollectorError is set.
inline ExtractionResult extractDocument(const tokens::RawTokenList &rawTokens,
                                        std::size_t sourceBytes,
                                        const core::ExtractionConfig &config = core::ExtractionConfig())
{
  dispatch::TokenWarehouse warehouse(rawTokens, sourceBytes, config.limits, config.dispatch);
  for (auto &collector : builtinCollectors(config))
  {
    warehouse.registerCollector(std::move(collector));
  }
  warehouse.dispatchAll();

  ExtractionResult result;
  result.results = warehouse.results();
  result.issues = warehouse.issues();
  for (const auto &collector : warehouse.collectors())
  {
    auto warnings = collector->warnings();
    if (!warnings.empty())
    {
      result.warnings[collector->name()] = std::move(warnings);
    }
  }
  return result;
}

/// \brief Applies the [log] settings of a configuration to the Logger.
inline void configureLogging(const core::ExtractionConfig &config)
{
  core::Logger::init(config.logLevel, config.logFile);
}

} // namespace mdguard
