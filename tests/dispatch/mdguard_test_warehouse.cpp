// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <algorithm>
#include <atomic>
#include <thread>

using namespace mdguard;
using dispatch::Interest;
using dispatch::TokenWarehouse;
using mdguard::test::CallLog;
using mdguard::test::RecordingCollector;
using mdguard::test::StreamBuilder;

namespace
{
core::ResourceLimits limitsWithTimeout(int milliseconds)
{
  core::ResourceLimits limits;
  limits.collectorTimeout = std::chrono::milliseconds(milliseconds);
  return limits;
}

/// Six paragraphs: tokens 0..17, inline tokens at 1, 4, 7, 10, 13, 16.
tokens::RawTokenList sixParagraphs()
{
  StreamBuilder builder;
  for (int i = 0; i < 6; ++i)
  {
    builder.paragraph("p" + std::to_string(i), i * 2);
  }
  return builder.tokens();
}

class ContextRecorder : public dispatch::Collector
{
public:
  ContextRecorder() : dispatch::Collector("context", Interest{{"inline"}, {}}) {}

  std::vector<std::vector<std::string>> stacks;
  std::vector<std::optional<std::size_t>> lines;
  std::vector<bool> insideList;

  void onToken(std::size_t, const tokens::CanonicalToken &, const dispatch::DispatchContext &ctx,
               const index::DocumentView &) override
  {
    stacks.push_back(ctx.stack());
    lines.push_back(ctx.line());
    insideList.push_back(ctx.inside("bullet_list_open"));
  }

  core::Json finalize(const index::DocumentView &) override { return core::Json::array(); }
};

class SkippingCollector : public RecordingCollector
{
public:
  using RecordingCollector::RecordingCollector;

  bool shouldProcess(const tokens::CanonicalToken &token, const dispatch::DispatchContext &,
                     const index::DocumentView &) const override
  {
    return token.type() == "inline";
  }
};
} // namespace

TEST_CASE("TokenWarehouse admission", "[warehouse][admission]")
{
  mdguard::test::initializeTestLogging();

  SECTION("A stream over the token budget is rejected before any work")
  {
    auto token = mdguard::test::makeToken("text");
    tokens::RawTokenList huge(200000, token);
    try
    {
      TokenWarehouse warehouse(huge, 1000);
      FAIL("expected DocumentTooLarge");
    }
    catch (const core::DocumentTooLarge &ex)
    {
      REQUIRE(ex.resource() == core::DocumentTooLarge::Resource::Tokens);
      REQUIRE(ex.actual() == 200000);
      REQUIRE(ex.limit() == 100000);
    }
    REQUIRE(token->reads.load() == 0);
  }

  SECTION("Source bytes over budget")
  {
    core::ResourceLimits limits;
    limits.maxBytes = 64;
    REQUIRE_THROWS_AS(TokenWarehouse(sixParagraphs(), 65, limits), core::DocumentTooLarge);
  }

  SECTION("Children count once canonicalized")
  {
    core::ResourceLimits limits;
    limits.maxTokens = 20;
    // 18 top-level tokens pass admission; their 6 children do not fit.
    REQUIRE_THROWS_AS(TokenWarehouse(sixParagraphs(), 10, limits), core::DocumentTooLarge);
  }

  SECTION("Nesting over budget")
  {
    core::ResourceLimits limits;
    limits.maxNesting = 10;
    REQUIRE_THROWS_AS(TokenWarehouse(StreamBuilder().nestedQuotes(11).tokens(), 10, limits),
                      core::NestingTooDeep);
  }

  SECTION("Hostile token fields never escape construction")
  {
    auto poisoned = mdguard::test::makeToken("paragraph_open", 1);
    poisoned->poisoned = {tokens::Field::Type, tokens::Field::Map, tokens::Field::Children};
    tokens::RawTokenList raw{poisoned, mdguard::test::makeToken("paragraph_close", -1)};

    std::unique_ptr<TokenWarehouse> warehouse;
    REQUIRE_NOTHROW(warehouse = std::make_unique<TokenWarehouse>(raw, 10));
    REQUIRE(warehouse->view().size() == 2);
    REQUIRE(warehouse->view().token(0).type().empty());
    REQUIRE(warehouse->view().rangeFor(0) == std::size_t(1));
  }
}

TEST_CASE("TokenWarehouse dispatch of an empty document", "[warehouse][dispatch]")
{
  auto log = std::make_shared<CallLog>();
  TokenWarehouse warehouse(tokens::RawTokenList{}, 0);
  warehouse.registerCollector(std::make_shared<RecordingCollector>("recorder", log));
  warehouse.registerCollector(std::make_shared<collectors::LinksCollector>());

  REQUIRE(warehouse.state() == dispatch::DispatchState::Idle);
  warehouse.dispatchAll();
  REQUIRE(warehouse.state() == dispatch::DispatchState::Done);

  REQUIRE(warehouse.issues().empty());
  REQUIRE(log->calls().empty());
  REQUIRE(warehouse.results().at("recorder") == core::Json::array());
  REQUIRE(warehouse.results().at("links") == core::Json::array());
}

TEST_CASE("TokenWarehouse delivery order", "[warehouse][dispatch][ordering]")
{
  mdguard::test::initializeTestLogging();
  const int timeout = GENERATE(0, 2000);
  INFO("collector timeout " << timeout << " ms");

  auto log = std::make_shared<CallLog>();
  TokenWarehouse warehouse(sixParagraphs(), 100, limitsWithTimeout(timeout));
  warehouse.registerCollector(std::make_shared<RecordingCollector>("first", log));
  warehouse.registerCollector(
    std::make_shared<RecordingCollector>("inline-only", log, Interest{{"inline"}, {}}));
  warehouse.registerCollector(std::make_shared<RecordingCollector>("last", log));
  warehouse.dispatchAll();

  SECTION("Tokens in document order, collectors in registration order")
  {
    auto calls = log->calls();
    REQUIRE(calls.size() == 18 + 6 + 18);
    REQUIRE(calls[0] == std::make_pair(std::string("first"), std::size_t(0)));
    REQUIRE(calls[1] == std::make_pair(std::string("last"), std::size_t(0)));
    REQUIRE(calls[2] == std::make_pair(std::string("first"), std::size_t(1)));
    REQUIRE(calls[3] == std::make_pair(std::string("inline-only"), std::size_t(1)));
    REQUIRE(calls[4] == std::make_pair(std::string("last"), std::size_t(1)));
  }

  SECTION("Each collector sees each wanted token exactly once")
  {
    std::vector<std::size_t> all(18);
    for (std::size_t i = 0; i < all.size(); ++i)
      all[i] = i;
    REQUIRE(log->indicesFor("first") == all);
    REQUIRE(log->indicesFor("last") == all);
    REQUIRE(log->indicesFor("inline-only") == std::vector<std::size_t>{1, 4, 7, 10, 13, 16});
  }

  SECTION("Results are stored by collector name")
  {
    REQUIRE(warehouse.results().size() == 3);
    REQUIRE(warehouse.results().at("inline-only").size() == 6);
  }
}

TEST_CASE("TokenWarehouse filtering", "[warehouse][dispatch][interest]")
{
  mdguard::test::initializeTestLogging();
  const int timeout = GENERATE(0, 2000);
  INFO("collector timeout " << timeout << " ms");

  SECTION("ignoreInside suppresses the container and everything in it")
  {
    // 0-2 paragraph, 3 blockquote_open, 4-6 paragraph, 7 blockquote_close, 8-10 paragraph
    auto raw = StreamBuilder()
                 .paragraph("before", 0)
                 .token(mdguard::test::withMap(
                   mdguard::test::makeToken("blockquote_open", 1, "blockquote"), 2, 4))
                 .paragraph("quoted", 2)
                 .token(mdguard::test::makeToken("blockquote_close", -1, "blockquote"))
                 .paragraph("after", 5)
                 .tokens();

    auto log = std::make_shared<CallLog>();
    TokenWarehouse warehouse(raw, 100, limitsWithTimeout(timeout));
    warehouse.registerCollector(
      std::make_shared<RecordingCollector>("outside", log, Interest{{}, {"blockquote_open"}}));
    warehouse.registerCollector(std::make_shared<RecordingCollector>("everything", log));
    warehouse.dispatchAll();

    REQUIRE(log->indicesFor("outside") == std::vector<std::size_t>{0, 1, 2, 7, 8, 9, 10});
    REQUIRE(log->indicesFor("everything").size() == 11);
  }

  SECTION("shouldProcess gates onToken")
  {
    auto log = std::make_shared<CallLog>();
    TokenWarehouse warehouse(sixParagraphs(), 100, limitsWithTimeout(timeout));
    warehouse.registerCollector(std::make_shared<SkippingCollector>("skipper", log));
    warehouse.dispatchAll();

    REQUIRE(log->indicesFor("skipper") == std::vector<std::size_t>{1, 4, 7, 10, 13, 16});
  }
}

TEST_CASE("TokenWarehouse dispatch context", "[warehouse][dispatch][context]")
{
  // 0 bullet_list_open, 1 list_item_open, 2 paragraph_open, 3 inline,
  // 4 paragraph_close, 5 list_item_close, 6 bullet_list_close, 7-9 paragraph
  auto raw = StreamBuilder()
               .token(mdguard::test::withMap(mdguard::test::makeToken("bullet_list_open", 1), 0, 1))
               .token(mdguard::test::withMap(mdguard::test::makeToken("list_item_open", 1), 0, 1))
               .paragraph("item", 0)
               .token(mdguard::test::makeToken("list_item_close", -1))
               .token(mdguard::test::makeToken("bullet_list_close", -1))
               .paragraph("after", 3)
               .tokens();

  auto recorder = std::make_shared<ContextRecorder>();
  TokenWarehouse warehouse(raw, 100, mdguard::test::inlineLimits());
  warehouse.registerCollector(recorder);
  warehouse.dispatchAll();

  REQUIRE(recorder->stacks.size() == 2);
  REQUIRE(recorder->stacks[0] ==
          std::vector<std::string>{"bullet_list_open", "list_item_open", "paragraph_open"});
  REQUIRE(recorder->stacks[1] == std::vector<std::string>{"paragraph_open"});
  REQUIRE(recorder->lines[0] == std::size_t(0));
  REQUIRE(recorder->lines[1] == std::size_t(3));
  REQUIRE(recorder->insideList == std::vector<bool>{true, false});
}

TEST_CASE("TokenWarehouse isolates collector errors", "[warehouse][errors]")
{
  mdguard::test::initializeTestLogging();
  const int timeout = GENERATE(0, 2000);
  INFO("collector timeout " << timeout << " ms");

  auto log = std::make_shared<CallLog>();
  auto failing = std::make_shared<RecordingCollector>("failing", log);
  failing->throwAt = {5};

  SECTION("One failure becomes one issue and dispatch continues")
  {
    TokenWarehouse warehouse(sixParagraphs(), 100, limitsWithTimeout(timeout));
    warehouse.registerCollector(std::make_shared<RecordingCollector>("before", log));
    warehouse.registerCollector(failing);
    warehouse.registerCollector(std::make_shared<RecordingCollector>("after", log));
    REQUIRE_NOTHROW(warehouse.dispatchAll());

    REQUIRE(warehouse.issues().size() == 1);
    const auto &issue = warehouse.issues().front();
    REQUIRE(issue.collector == "failing");
    REQUIRE(issue.tokenIndex == 5);
    REQUIRE(issue.kind == core::IssueKind::CollectorError);
    REQUIRE(issue.detail == "boom at 5");

    auto before = log->indicesFor("before");
    auto after = log->indicesFor("after");
    REQUIRE(std::find(before.begin(), before.end(), 5) != before.end());
    REQUIRE(std::find(after.begin(), after.end(), 5) != after.end());
    REQUIRE(after.size() == 18);

    auto failed = log->indicesFor("failing");
    REQUIRE(failed.size() == 17);
    REQUIRE(std::find(failed.begin(), failed.end(), 5) == failed.end());
    REQUIRE(warehouse.results().count("failing") == 1);
  }

  SECTION("Strict mode raises after recording")
  {
    core::DispatchOptions options;
    options.raiseOnCollectorError = true;
    TokenWarehouse warehouse(sixParagraphs(), 100, limitsWithTimeout(timeout), options);
    warehouse.registerCollector(failing);

    try
    {
      warehouse.dispatchAll();
      FAIL("expected CollectorFailure");
    }
    catch (const core::CollectorFailure &ex)
    {
      REQUIRE(ex.collector() == "failing");
      REQUIRE(ex.tokenIndex() == 5);
      REQUIRE(std::string(ex.what()).find("boom at 5") != std::string::npos);
    }
    REQUIRE(warehouse.issues().size() == 1);
    REQUIRE(warehouse.state() == dispatch::DispatchState::Done);
    REQUIRE_THROWS_AS(warehouse.dispatchAll(), core::DispatchCompletedError);
  }

  SECTION("A failing finalize is recorded without a result")
  {
    auto broken = std::make_shared<RecordingCollector>("broken", log);
    broken->throwInFinalize = true;
    TokenWarehouse warehouse(sixParagraphs(), 100, limitsWithTimeout(timeout));
    warehouse.registerCollector(broken);
    warehouse.registerCollector(std::make_shared<RecordingCollector>("healthy", log));
    warehouse.dispatchAll();

    REQUIRE(warehouse.issues().size() == 1);
    REQUIRE(warehouse.issues()[0].tokenIndex == -1);
    REQUIRE(warehouse.issues()[0].detail == "finalize failed");
    REQUIRE(warehouse.results().count("broken") == 0);
    REQUIRE(warehouse.results().count("healthy") == 1);
  }
}

TEST_CASE("TokenWarehouse refuses reentrant dispatch", "[warehouse][reentrancy]")
{
  mdguard::test::initializeTestLogging();
  const int timeout = GENERATE(0, 2000);
  INFO("collector timeout " << timeout << " ms");

  auto log = std::make_shared<CallLog>();
  TokenWarehouse warehouse(sixParagraphs(), 100, limitsWithTimeout(timeout));
  auto nested = std::make_shared<RecordingCollector>("nested", log);

  SECTION("The nested call raises ReentrantDispatchError")
  {
    std::atomic<int> refused{0};
    nested->hook = [&warehouse, &refused](std::size_t tokenIndex)
    {
      if (tokenIndex != 3)
        return;
      try
      {
        warehouse.dispatchAll();
      }
      catch (const core::ReentrantDispatchError &)
      {
        ++refused;
      }
    };
    warehouse.registerCollector(nested);
    warehouse.dispatchAll();

    REQUIRE(refused.load() == 1);
    REQUIRE(warehouse.issues().empty());
    REQUIRE(log->indicesFor("nested").size() == 18);
  }

  SECTION("An unhandled nested call aborts the outer dispatch")
  {
    nested->hook = [&warehouse](std::size_t tokenIndex)
    {
      if (tokenIndex == 3)
        warehouse.dispatchAll();
    };
    warehouse.registerCollector(nested);

    REQUIRE_THROWS_AS(warehouse.dispatchAll(), core::ReentrantDispatchError);
    REQUIRE(warehouse.state() == dispatch::DispatchState::Done);
  }
}

TEST_CASE("TokenWarehouse lifecycle rules", "[warehouse][lifecycle]")
{
  auto log = std::make_shared<CallLog>();
  TokenWarehouse warehouse(sixParagraphs(), 100, mdguard::test::inlineLimits());

  SECTION("Null and duplicate registrations are rejected")
  {
    REQUIRE_THROWS_AS(warehouse.registerCollector(nullptr), std::invalid_argument);
    warehouse.registerCollector(std::make_shared<RecordingCollector>("dup", log));
    REQUIRE_THROWS_AS(warehouse.registerCollector(std::make_shared<RecordingCollector>("dup", log)),
                      std::invalid_argument);
    REQUIRE(warehouse.collectors().size() == 1);
  }

  SECTION("Dispatch is single use")
  {
    warehouse.registerCollector(std::make_shared<RecordingCollector>("once", log));
    warehouse.dispatchAll();
    REQUIRE_THROWS_AS(warehouse.dispatchAll(), core::DispatchCompletedError);
    REQUIRE(log->indicesFor("once").size() == 18);
  }

  SECTION("Registration closes when dispatch starts")
  {
    warehouse.dispatchAll();
    REQUIRE_THROWS_AS(warehouse.registerCollector(std::make_shared<RecordingCollector>("late", log)),
                      std::logic_error);
  }

  SECTION("Limits and options are exposed")
  {
    REQUIRE(warehouse.limits().collectorTimeout.count() == 0);
    REQUIRE_FALSE(warehouse.options().raiseOnCollectorError);
    REQUIRE(warehouse.viewPtr().get() == &warehouse.view());
  }
}
