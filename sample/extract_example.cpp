// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

// Reads a markdown-it token dump (JSON array, as produced by
// `md.parse(text)` serialized with JSON.stringify) and prints the extracted
// document model.
//
//   mdguard_extract_example tokens.json [mdguard.toml]

#include <fstream>
#include <iostream>
#include <sstream>

#include <mdguard/mdguard.hpp>

int main(int argc, char **argv)
{
  if (argc < 2)
  {
    std::cerr << "usage: " << argv[0] << " <tokens.json> [config.toml]" << std::endl;
    return 2;
  }

  try
  {
    mdguard::core::ExtractionConfig config;
    if (argc > 2)
    {
      mdguard::core::ConfigLoader loader(argv[2]);
      config = loader.extractionConfig();
    }
    mdguard::configureLogging(config);

    std::ifstream input(argv[1], std::ios::binary);
    if (!input.is_open())
    {
      std::cerr << "cannot open " << argv[1] << std::endl;
      return 1;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    const std::string dump = buffer.str();

    // The dump is larger than its source, so this over-counts for admission.
    auto tokens =
      mdguard::tokens::JsonRawToken::fromJsonArray(mdguard::core::Json::parse(dump));
    auto result = mdguard::extractDocument(tokens, dump.size(), config);
    std::cout << result.toJson().dump(2) << std::endl;
    return result.issues.empty() ? 0 : 3;
  }
  catch (const mdguard::core::MdGuardError &ex)
  {
    MDGUARD_LOG_ERROR("Extraction rejected: " << ex.what());
    return 1;
  }
  catch (const std::exception &ex)
  {
    std::cerr << "error: " << ex.what() << std::endl;
    return 1;
  }
}
