// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <mdguard/core/json.hpp>
#include <mdguard/dispatch/collector.hpp>

namespace mdguard
{
namespace collectors
{

/// \brief Presents the section index. Does no work during dispatch.
class SectionsCollector : public dispatch::Collector
{
public:
  SectionsCollector() : dispatch::Collector("sections", dispatch::Interest{{"heading_open"}, {}})
  {
  }

  bool shouldProcess(const tokens::CanonicalToken &, const dispatch::DispatchContext &,
                     const index::DocumentView &) const override
  {
    return false;
  }

  void onToken(std::size_t, const tokens::CanonicalToken &, const dispatch::DispatchContext &,
               const index::DocumentView &) override
  {
  }

  core::Json finalize(const index::DocumentView &view) override
  {
    core::Json out = core::Json::array();
    for (const auto &section : view.sections())
    {
      out.push_back({{"id", section.id},
                     {"heading_token", section.headingToken},
                     {"level", section.level},
                     {"text", section.text},
                     {"start_line", section.startLine},
                     {"end_line", section.endLine}});
    }
    return out;
  }
};

} // namespace collectors
} // namespace mdguard
