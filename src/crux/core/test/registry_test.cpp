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
#include "crux/core/registry.hpp"
#include "crux/core/state.hpp"
#include <gtest/gtest.h>
#include <boost/make_shared.hpp>

namespace crux::core::test
{

namespace
{

/// State that does nothing; only its identity matters here.
class Inert_state :
  public State
{
public:
  void on_ready(Core*, reactor::Event_loop*, Token, reactor::Event_set) override {}
  void on_timeout(Core*, reactor::Event_loop*, Token) override {}
  void on_terminate(Core*, reactor::Event_loop*) override {}
};

} // Anonymous namespace

TEST(Registry, Tokens)
{
  Registry registry;
  EXPECT_FALSE(registry.resolve_token(Token(5)));

  EXPECT_FALSE(registry.bind_token(Token(5), Context(7)));
  ASSERT_TRUE(registry.resolve_token(Token(5)));
  EXPECT_EQ(*registry.resolve_token(Token(5)), Context(7));

  // Rebinding returns the previous context and resolves to the new one.
  const auto prior = registry.bind_token(Token(5), Context(8));
  ASSERT_TRUE(prior);
  EXPECT_EQ(*prior, Context(7));
  EXPECT_EQ(*registry.resolve_token(Token(5)), Context(8));
  EXPECT_EQ(registry.n_tokens(), 1u);

  // Several tokens may share a context.
  registry.bind_token(Token(6), Context(8));
  EXPECT_EQ(registry.n_tokens(), 2u);

  const auto unbound = registry.unbind_token(Token(5));
  ASSERT_TRUE(unbound);
  EXPECT_EQ(*unbound, Context(8));
  EXPECT_FALSE(registry.resolve_token(Token(5)));
  EXPECT_FALSE(registry.unbind_token(Token(5))); // Already gone.
  EXPECT_EQ(*registry.resolve_token(Token(6)), Context(8));
}

TEST(Registry, States)
{
  Registry registry;
  const State_ptr state1 = boost::make_shared<Inert_state>();
  const State_ptr state2 = boost::make_shared<Inert_state>();

  EXPECT_FALSE(registry.resolve_context(Context(1)));
  EXPECT_FALSE(registry.bind_state(Context(1), state1));
  EXPECT_EQ(registry.resolve_context(Context(1)), state1);

  EXPECT_EQ(registry.bind_state(Context(1), state2), state1);
  EXPECT_EQ(registry.resolve_context(Context(1)), state2);
  EXPECT_EQ(registry.n_states(), 1u);

  EXPECT_EQ(registry.unbind_state(Context(1)), state2);
  EXPECT_FALSE(registry.resolve_context(Context(1)));
  EXPECT_FALSE(registry.unbind_state(Context(1)));
  EXPECT_EQ(registry.n_states(), 0u);

  // The registry's reference was the only one besides ours.
  EXPECT_EQ(state2.use_count(), 1);
}

TEST(Registry, MapsAreIndependent)
{
  Registry registry;
  const State_ptr state = boost::make_shared<Inert_state>();

  // A token bound to a context without a state: legal; resolves only halfway.
  registry.bind_token(Token(1), Context(10));
  EXPECT_FALSE(registry.resolve_context(*registry.resolve_token(Token(1))));

  registry.bind_state(Context(10), state);
  EXPECT_EQ(registry.resolve_context(*registry.resolve_token(Token(1))), state);

  // Removing the state leaves the token bound; no cascade.
  registry.unbind_state(Context(10));
  EXPECT_TRUE(registry.resolve_token(Token(1)));
  EXPECT_EQ(registry.n_tokens(), 1u);
}

TEST(Registry, NullStateIgnored)
{
  Registry registry;
  const State_ptr state = boost::make_shared<Inert_state>();

  EXPECT_FALSE(registry.bind_state(Context(3), State_ptr()));
  EXPECT_EQ(registry.n_states(), 0u);

  // An existing binding survives an attempt to replace it with null.
  registry.bind_state(Context(3), state);
  EXPECT_FALSE(registry.bind_state(Context(3), State_ptr()));
  EXPECT_EQ(registry.resolve_context(Context(3)), state);
  EXPECT_EQ(registry.n_states(), 1u);
}

} // namespace crux::core::test
