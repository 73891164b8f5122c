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
#include "crux/reactor/event_loop_options.hpp"
#include "crux/util/util.hpp"
#include <gtest/gtest.h>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>
#include <vector>

namespace crux::reactor::test
{

namespace
{
namespace opts = boost::program_options;

/// Parses `argv` (with a fake program name in front) into `*target`.
void parse(std::vector<const char*> args, Event_loop_options* target)
{
  Event_loop_options::Options_description opts_desc("Event loop options");
  target->setup_config_parsing(&opts_desc);

  args.insert(args.begin(), "crux_test");
  opts::variables_map vars;
  opts::store(opts::parse_command_line(int(args.size()), args.data(), opts_desc), vars);
  opts::notify(vars);
}

} // Anonymous namespace

TEST(Event_loop_options, Defaults)
{
  const Event_loop_options loop_opts;
  EXPECT_EQ(loop_opts.m_st_notify_capacity, 4096u);
  EXPECT_EQ(loop_opts.m_st_messages_per_tick, 256u);
  EXPECT_EQ(loop_opts.m_st_timer_capacity, 65536u);
  EXPECT_FALSE(loop_opts.m_st_capture_interrupt_signals_internally);
  EXPECT_EQ(loop_opts.m_st_thread_nickname, "crux_loop");
}

TEST(Event_loop_options, CommandLine)
{
  Event_loop_options loop_opts;
  parse({ "--notify-capacity", "16", "--messages-per-tick=4", "--capture-interrupt-signals-internally", "true",
          "--thread-nickname", "io" },
        &loop_opts);

  EXPECT_EQ(loop_opts.m_st_notify_capacity, 16u);
  EXPECT_EQ(loop_opts.m_st_messages_per_tick, 4u);
  EXPECT_EQ(loop_opts.m_st_timer_capacity, 65536u); // Not given: default kept.
  EXPECT_TRUE(loop_opts.m_st_capture_interrupt_signals_internally);
  EXPECT_EQ(loop_opts.m_st_thread_nickname, "io");

  // Defaults come from the object's current values.
  Event_loop_options more_opts = loop_opts;
  parse({ "--timer-capacity", "8" }, &more_opts);
  EXPECT_EQ(more_opts.m_st_notify_capacity, 16u);
  EXPECT_EQ(more_opts.m_st_timer_capacity, 8u);

  Event_loop_options bad_opts;
  EXPECT_THROW(parse({ "--no-such-option", "1" }, &bad_opts), opts::error);
  EXPECT_THROW(parse({ "--notify-capacity", "lots" }, &bad_opts), opts::error);
}

TEST(Event_loop_options, Print)
{
  Event_loop_options loop_opts;
  loop_opts.m_st_notify_capacity = 12;

  const auto str = util::ostream_op_string(loop_opts);
  EXPECT_NE(str.find("Per-reactor::Event_loop option values"), std::string::npos);
  EXPECT_NE(str.find("--notify-capacity"), std::string::npos);
  EXPECT_NE(str.find("(=12)"), std::string::npos);
  EXPECT_NE(str.find("--thread-nickname"), std::string::npos);
  EXPECT_NE(str.find("(=crux_loop)"), std::string::npos);
  // Values only; no descriptions.
  EXPECT_EQ(str.find("Must be positive"), std::string::npos);
}

} // namespace crux::reactor::test
