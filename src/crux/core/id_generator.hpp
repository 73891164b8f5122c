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
#pragma once

#include "crux/core/core_fwd.hpp"

namespace crux::core
{

// Types.

/**
 * Generator of new core::Token and core::Context values: two independent counters, each starting at a seed and
 * incremented by one per call.  On reaching the maximum raw value a counter wraps to zero silently; nothing
 * checks that a wrapped value is not still in use.
 *
 * ### Thread safety ###
 * None; same as the rest of the core, an Id_generator is used only from the loop thread.
 */
class Id_generator
{
public:
  // Constructors/destructor.

  /**
   * Constructs the generator.  Supplying a non-zero `context_seed` reserves the contexts below it, e.g. for
   * states created at bootstrap with well-known contexts.
   *
   * @param context_seed
   *        First value next_context() will return.
   * @param token_seed
   *        First value next_token() will return.
   */
  explicit Id_generator(Context context_seed = Context(), Token token_seed = Token());

  // Methods.

  /**
   * Returns the next token: the seed the first time, then one more than the previous result (modulo wraparound).
   *
   * @return See above.
   */
  Token next_token();

  /**
   * Returns the next context: the seed the first time, then one more than the previous result (modulo wraparound).
   *
   * @return See above.
   */
  Context next_context();

private:
  // Data.

  /// Value next_token() will return next.
  Token::raw_t m_next_token;

  /// Value next_context() will return next.
  Context::raw_t m_next_context;
}; // class Id_generator

} // namespace crux::core
