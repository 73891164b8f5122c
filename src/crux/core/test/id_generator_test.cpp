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
#include "crux/core/id_generator.hpp"
#include <gtest/gtest.h>
#include <boost/unordered_set.hpp>
#include <limits>
#include <sstream>

namespace crux::core::test
{

TEST(Id_generator, Sequence)
{
  Id_generator gen;
  EXPECT_EQ(gen.next_token(), Token(0));
  EXPECT_EQ(gen.next_token(), Token(1));
  EXPECT_EQ(gen.next_context(), Context(0)); // Independent of the token counter.

  Token prev = gen.next_token();
  for (int idx = 0; idx != 1000; ++idx)
  {
    const Token cur = gen.next_token();
    EXPECT_TRUE(prev < cur);
    prev = cur;
  }
}

TEST(Id_generator, Seeds)
{
  Id_generator gen{Context(100), Token(5)};
  EXPECT_EQ(gen.next_context(), Context(100));
  EXPECT_EQ(gen.next_context(), Context(101));
  EXPECT_EQ(gen.next_token(), Token(5));
}

TEST(Id_generator, Wraparound)
{
  constexpr auto MAX_RAW = std::numeric_limits<Token::raw_t>::max();

  Id_generator gen{Context(MAX_RAW - 1), Token(MAX_RAW)};
  EXPECT_EQ(gen.next_token(), Token(MAX_RAW));
  EXPECT_EQ(gen.next_token(), Token(0));
  EXPECT_EQ(gen.next_token(), Token(1));
  EXPECT_EQ(gen.next_context(), Context(MAX_RAW - 1));
  EXPECT_EQ(gen.next_context(), Context(MAX_RAW));
  EXPECT_EQ(gen.next_context(), Context(0));
}

TEST(Basic_id, ValueSemantics)
{
  EXPECT_EQ(Token(), Token(0));
  EXPECT_NE(Token(3), Token(4));
  EXPECT_EQ(Context(7).raw(), 7u);

  boost::unordered_set<Token> tokens;
  tokens.insert(Token(3));
  tokens.insert(Token(3));
  tokens.insert(Token(4));
  EXPECT_EQ(tokens.size(), 2u);

  std::ostringstream os;
  os << Token(5) << ' ' << Context(7);
  EXPECT_EQ(os.str(), "tok5 ctx7");
}

} // namespace crux::core::test
