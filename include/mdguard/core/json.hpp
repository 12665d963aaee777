// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <nlohmann/json.hpp>

namespace mdguard
{
namespace core
{
  /// JSON type used for token metadata, collector results and token dumps.
  /// Aliased so the third-party namespace stays out of public signatures.
  using Json = nlohmann::json;
} // namespace core
} // namespace mdguard
