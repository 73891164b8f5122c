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
#include "crux/core/core.hpp"
#include "crux/core/state.hpp"
#include "crux/reactor/event_set.hpp"
#include "crux/test/test_logger.hpp"
#include "crux/log/config.hpp"
#include "crux/log/simple_ostream_logger.hpp"
#include "crux/util/string_ostream.hpp"
#include <gtest/gtest.h>
#include <boost/make_shared.hpp>
#include <vector>

namespace crux::core::test
{

namespace
{
using reactor::Event_set;
using crux::test::Test_logger;

/// Records everything dispatched to it.
class Recording_state :
  public State
{
public:
  void on_ready(Core*, reactor::Event_loop*, Token token, Event_set events) override
  {
    m_ready.push_back(token);
    m_last_events = events;
  }

  void on_timeout(Core*, reactor::Event_loop*, Token token) override
  {
    m_timeouts.push_back(token);
  }

  void on_terminate(Core*, reactor::Event_loop*) override
  {
    ++m_n_terminates;
  }

  std::vector<Token> m_ready;
  std::vector<Token> m_timeouts;
  Event_set m_last_events;
  unsigned int m_n_terminates = 0;
}; // class Recording_state

/// Unbinds its own token and state (dropping the registry's reference to itself) when it gets readiness.
class Self_removing_state :
  public State
{
public:
  explicit Self_removing_state(Context context) :
    m_context(context)
  {
    // Nothing else.
  }

  void on_ready(Core* core, reactor::Event_loop*, Token token, Event_set) override
  {
    core->unbind_token(token);
    core->unbind_state(m_context);
    ++m_n_ready; // `this` must still be alive here.
  }

  void on_timeout(Core*, reactor::Event_loop*, Token) override {}
  void on_terminate(Core*, reactor::Event_loop*) override {}

  const Context m_context;
  unsigned int m_n_ready = 0;
}; // class Self_removing_state

} // Anonymous namespace

TEST(Core, DispatchReadiness)
{
  Test_logger logger;
  Core core{&logger};
  const auto state = boost::make_shared<Recording_state>();

  core.bind_token(Token(5), Context(7));
  core.bind_state(Context(7), state);

  core.on_ready(nullptr, Token(5), Event_set::S_READABLE);
  ASSERT_EQ(state->m_ready.size(), 1u);
  EXPECT_EQ(state->m_ready.front(), Token(5));
  EXPECT_EQ(state->m_last_events, Event_set::S_READABLE);

  core.on_timeout(nullptr, Token(5));
  ASSERT_EQ(state->m_timeouts.size(), 1u);
  EXPECT_EQ(state->m_timeouts.front(), Token(5));

  // After the token is unbound nobody hears about it.
  core.unbind_token(Token(5));
  core.on_ready(nullptr, Token(5), Event_set::S_WRITABLE);
  core.on_timeout(nullptr, Token(5));
  EXPECT_EQ(state->m_ready.size(), 1u);
  EXPECT_EQ(state->m_timeouts.size(), 1u);
}

TEST(Core, DispatchMisses)
{
  Test_logger logger;
  Core core{&logger};
  const auto state = boost::make_shared<Recording_state>();

  // Unknown token.
  core.on_ready(nullptr, Token(1), Event_set::S_READABLE);

  // Token bound to a context with no state.
  core.bind_token(Token(2), Context(3));
  core.on_ready(nullptr, Token(2), Event_set::S_READABLE);
  core.on_timeout(nullptr, Token(2));
  core.terminate_state(nullptr, Context(3));

  // State bound elsewhere heard nothing.
  core.bind_state(Context(4), state);
  EXPECT_TRUE(state->m_ready.empty());
  EXPECT_TRUE(state->m_timeouts.empty());
  EXPECT_EQ(state->m_n_terminates, 0u);
}

TEST(Core, TerminateState)
{
  Test_logger logger;
  Core core{&logger};
  const auto state = boost::make_shared<Recording_state>();

  core.bind_token(Token(1), Context(9));
  core.bind_state(Context(9), state);

  core.terminate_state(nullptr, Context(9));
  EXPECT_EQ(state->m_n_terminates, 1u);
  // Termination does not touch the registry; the state cleans up after itself if it wants to.
  EXPECT_EQ(core.registry().n_tokens(), 1u);
  EXPECT_EQ(core.registry().n_states(), 1u);
}

TEST(Core, StateRemovesItselfDuringDispatch)
{
  Test_logger logger;
  Core core{&logger};
  const Context context = core.next_context();
  const Token token = core.next_token();

  auto state = boost::make_shared<Self_removing_state>(context);
  boost::weak_ptr<Self_removing_state> weak_state = state;
  core.bind_token(token, context);
  core.bind_state(context, state);
  state.reset(); // Registry holds the only reference now.

  core.on_ready(nullptr, token, Event_set::S_READABLE);
  // Dispatch kept it alive through the call; only now is it gone.
  EXPECT_TRUE(weak_state.expired());
  EXPECT_EQ(core.registry().n_tokens(), 0u);
  EXPECT_EQ(core.registry().n_states(), 0u);
}

TEST(Core, StateRemovedOnlyOnce)
{
  Test_logger logger;
  Core core{&logger};
  const auto state = boost::make_shared<Self_removing_state>(Context(1));
  core.bind_token(Token(1), Context(1));
  core.bind_state(Context(1), state);

  core.on_ready(nullptr, Token(1), Event_set::S_READABLE);
  core.on_ready(nullptr, Token(1), Event_set::S_READABLE); // Token gone: dropped.
  EXPECT_EQ(state->m_n_ready, 1u);
  EXPECT_FALSE(core.resolve_context(Context(1)));
}

TEST(Core, Message)
{
  Test_logger logger;
  Core core{&logger};
  Core* seen_core = nullptr;

  core.on_message(nullptr, [&](Core* core_arg, reactor::Event_loop*) { seen_core = core_arg; });
  EXPECT_EQ(seen_core, &core);

  core.on_message(nullptr, Closure()); // Empty: nothing happens.
}

TEST(Core, Seeds)
{
  Test_logger logger;
  Core core{&logger, Context(100), Token(20)};
  EXPECT_EQ(core.next_context(), Context(100));
  EXPECT_EQ(core.next_context(), Context(101));
  EXPECT_EQ(core.next_token(), Token(20));

  // Ids are the application's to bind; the generator does not touch the registry.
  EXPECT_EQ(core.registry().n_tokens(), 0u);
}

TEST(Core, NullStateNotBound)
{
  log::Config cfg;
  util::String_ostream os;
  log::Simple_ostream_logger logger{&cfg, os.os(), os.os()};
  Core core{&logger};
  const auto state = boost::make_shared<Recording_state>();

  EXPECT_FALSE(core.bind_state(Context(4), State_ptr()));
  EXPECT_EQ(core.registry().n_states(), 0u);
  EXPECT_NE(os.str().find("null state"), std::string::npos) << os.str();

  core.bind_state(Context(4), state);
  EXPECT_FALSE(core.bind_state(Context(4), State_ptr()));
  EXPECT_EQ(core.resolve_context(Context(4)), state);
}

} // namespace crux::core::test
