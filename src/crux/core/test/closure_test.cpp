/* Crux
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */


/// @file
#include "crux/core/closure.hpp"
#include <gtest/gtest.h>
#include <memory>

namespace crux::core::test
{

TEST(Closure, RunsAtMostOnce)
{
  int n_runs = 0;
  Closure closure([&](Core* core, reactor::Event_loop* event_loop)
  {
    EXPECT_EQ(core, nullptr);
    EXPECT_EQ(event_loop, nullptr);
    ++n_runs;
  });

  EXPECT_FALSE(closure.empty());
  closure(nullptr, nullptr);
  EXPECT_EQ(n_runs, 1);
  EXPECT_TRUE(closure.empty());

  closure(nullptr, nullptr); // No-op.
  EXPECT_EQ(n_runs, 1);
}

TEST(Closure, EmptyAndMoved)
{
  Closure empty_closure;
  EXPECT_TRUE(empty_closure.empty());
  empty_closure(nullptr, nullptr); // No-op.

  int n_runs = 0;
  Closure src([&](Core*, reactor::Event_loop*) { ++n_runs; });
  Closure dst(std::move(src));
  EXPECT_TRUE(src.empty());
  EXPECT_FALSE(dst.empty());

  src(nullptr, nullptr);
  EXPECT_EQ(n_runs, 0);

  Closure assigned;
  assigned = std::move(dst);
  EXPECT_TRUE(dst.empty());
  assigned(nullptr, nullptr);
  EXPECT_EQ(n_runs, 1);
}

TEST(Closure, MoveOnlyCapture)
{
  auto value = std::make_unique<int>(42);
  int seen = 0;
  Closure closure([value = std::move(value), &seen](Core*, reactor::Event_loop*)
  {
    seen = *value;
  });
  EXPECT_FALSE(value);

  closure(nullptr, nullptr);
  EXPECT_EQ(seen, 42);
}

TEST(Closure, CaptureDestroyedAfterRun)
{
  const auto tracker = std::make_shared<int>(0);
  Closure closure([held = tracker](Core*, reactor::Event_loop*) { ++(*held); });
  EXPECT_EQ(tracker.use_count(), 2);

  closure(nullptr, nullptr);
  EXPECT_EQ(*tracker, 1);
  EXPECT_EQ(tracker.use_count(), 1);
}

TEST(Closure, ReentrantInvocation)
{
  int n_runs = 0;
  Closure closure;
  closure = Closure([&](Core* core, reactor::Event_loop* event_loop)
  {
    ++n_runs;
    EXPECT_TRUE(closure.empty());
    closure(core, event_loop); // Payload was already taken out: no-op.
  });

  closure(nullptr, nullptr);
  EXPECT_EQ(n_runs, 1);
}

} // namespace crux::core::test
