// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <mdguard/parsers/minimal_toml.hpp>

namespace toml = mdguard::parsers::toml;

TEST_CASE("TOML scalar values", "[toml][parser]")
{
  auto root = toml::parse("# leading comment\n"
                          "name = \"mdguard\"\n"
                          "path = 'C:\\raw\\path'\n"
                          "count = 1_000\n"
                          "negative = -7\n"
                          "ratio = 0.25\n"
                          "big = 1e3\n"
                          "enabled = true\n"
                          "disabled = false # trailing comment\n"
                          "escaped = \"tab\\there \\\"quoted\\\"\"\n");

  REQUIRE(root.at_path("name").as<std::string>() == std::string("mdguard"));
  REQUIRE(root.at_path("path").as<std::string>() == std::string("C:\\raw\\path"));
  REQUIRE(root.at_path("count").as<int64_t>() == 1000);
  REQUIRE(root.at_path("negative").as<int64_t>() == -7);
  REQUIRE(root.at_path("ratio").as<double>() == Approx(0.25));
  REQUIRE(root.at_path("big").as<double>() == Approx(1000.0));
  REQUIRE(root.at_path("enabled").as<bool>() == true);
  REQUIRE(root.at_path("disabled").as<bool>() == false);
  REQUIRE(root.at_path("escaped").as<std::string>() == std::string("tab\there \"quoted\""));

  SECTION("Integers widen to double, nothing else converts")
  {
    REQUIRE(root.at_path("count").as<double>() == Approx(1000.0));
    REQUIRE_FALSE(root.at_path("ratio").as<int64_t>().has_value());
    REQUIRE_FALSE(root.at_path("enabled").as<std::string>().has_value());
  }

  SECTION("Node kind queries")
  {
    REQUIRE(root.at_path("name").is_string());
    REQUIRE(root.at_path("count").is_integer());
    REQUIRE(root.at_path("enabled").is_boolean());
    REQUIRE(root.at_path("name").is_value());
    REQUIRE_FALSE(root.at_path("absent"));
  }
}

TEST_CASE("TOML tables and arrays", "[toml][parser]")
{
  auto root = toml::parse("[limits]\n"
                          "max_tokens = 10\n"
                          "\n"
                          "[links.policy]\n"
                          "schemes = [\n"
                          "  \"http\",  # plain\n"
                          "  \"https\",\n"
                          "]\n"
                          "empty = []\n");

  REQUIRE(root.contains("limits"));
  REQUIRE(root.at_path("limits").is_table());
  REQUIRE(root.at_path("limits.max_tokens").as<int64_t>() == 10);
  REQUIRE(root.at_path("links").is_table());
  REQUIRE(root.at_path("links.policy").is_table());

  auto schemes = root.at_path("links.policy.schemes");
  REQUIRE(schemes.is_array());
  const auto *arr = schemes.as_array();
  REQUIRE(arr != nullptr);
  REQUIRE(arr->size() == 2);
  REQUIRE(std::get<std::string>((*arr)[0]) == "http");
  REQUIRE(std::get<std::string>((*arr)[1]) == "https");

  REQUIRE(root.at_path("links.policy.empty").as_array()->empty());
  REQUIRE_FALSE(root.at_path("limits.max_tokens.deeper"));
  REQUIRE_FALSE(root.at_path("links.missing.key"));
}

TEST_CASE("TOML parse errors", "[toml][parser][errors]")
{
  SECTION("Duplicate keys")
  {
    REQUIRE_THROWS_WITH(toml::parse("a = 1\na = 2\n"), Catch::Contains("duplicate key 'a'"));
  }

  SECTION("Errors report the line")
  {
    try
    {
      toml::parse("a = 1\n\nb = @\n");
      FAIL("expected parse_error");
    }
    catch (const toml::parse_error &ex)
    {
      REQUIRE(ex.line() == 3);
    }
  }

  SECTION("Malformed input")
  {
    REQUIRE_THROWS_AS(toml::parse("key \"value\"\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("s = \"unterminated\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("[open\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("[]\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("a = [1, [2]]\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("a = 1 2\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("a = truthy\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("a = 1.2.3\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("a = \"\\q\"\n"), toml::parse_error);
  }

  SECTION("A key cannot become a table")
  {
    REQUIRE_THROWS_AS(toml::parse("limits = 1\n[limits]\n"), toml::parse_error);
  }
}

TEST_CASE("TOML file loading", "[toml][file]")
{
  SECTION("Missing file")
  {
    REQUIRE_THROWS_WITH(toml::parse_file("no_such_mdguard_file.toml"),
                        Catch::Contains("Cannot open file"));
  }

  SECTION("Oversized file")
  {
    mdguard::test::TempFile big("mdguard_oversized.toml",
                                std::string(toml::MAX_FILE_SIZE + 1, '#'));
    REQUIRE_THROWS_WITH(toml::parse_file(big.path()), Catch::Contains("too large"));
  }

  SECTION("Round trip through disk")
  {
    mdguard::test::TempFile file("mdguard_small.toml", "[log]\nlevel = \"warn\"\n");
    auto root = toml::parse_file(file.path());
    REQUIRE(root.at_path("log.level").as<std::string>() == std::string("warn"));
  }
}
