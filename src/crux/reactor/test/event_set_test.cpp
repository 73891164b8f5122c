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
#include "crux/reactor/event_set.hpp"
#include "crux/util/util.hpp"
#include <gtest/gtest.h>

namespace crux::reactor::test
{

TEST(Event_set, Algebra)
{
  const Event_set none;
  EXPECT_TRUE(none.empty());
  EXPECT_EQ(none, Event_set::S_NONE);
  EXPECT_EQ(none.bits(), 0u);

  const auto rw = Event_set::S_READABLE | Event_set::S_WRITABLE;
  EXPECT_FALSE(rw.empty());
  EXPECT_TRUE(rw.contains(Event_set::S_READABLE));
  EXPECT_TRUE(rw.contains(Event_set::S_WRITABLE));
  EXPECT_TRUE(rw.contains(rw));
  EXPECT_FALSE(rw.contains(Event_set::S_ERROR));
  EXPECT_TRUE(rw.contains(Event_set::S_NONE));

  EXPECT_EQ(rw & Event_set::S_WRITABLE, Event_set::S_WRITABLE);
  EXPECT_TRUE((Event_set::S_READABLE & Event_set::S_ERROR).empty());
  EXPECT_NE(Event_set::S_READABLE, Event_set::S_WRITABLE);

  Event_set accum;
  accum |= Event_set::S_ERROR;
  accum |= Event_set::S_READABLE;
  EXPECT_EQ(accum, Event_set::S_READABLE | Event_set::S_ERROR);
}

TEST(Event_set, Print)
{
  EXPECT_EQ(util::ostream_op_string(Event_set::S_NONE), "-");
  EXPECT_EQ(util::ostream_op_string(Event_set::S_WRITABLE), "W");
  EXPECT_EQ(util::ostream_op_string(Event_set::S_READABLE | Event_set::S_WRITABLE), "R|W");
  EXPECT_EQ(util::ostream_op_string(Event_set::S_ERROR | Event_set::S_READABLE), "R|E");
}

} // namespace crux::reactor::test
