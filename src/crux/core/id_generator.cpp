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

namespace crux::core
{

// Implementations.

Id_generator::Id_generator(Context context_seed, Token token_seed) :
  m_next_token(token_seed.raw()),
  m_next_context(context_seed.raw())
{
  // Nothing else.
}

Token Id_generator::next_token()
{
  return Token(m_next_token++); // Unsigned: wraps to 0 after the max.
}

Context Id_generator::next_context()
{
  return Context(m_next_context++);
}

} // namespace crux::core
