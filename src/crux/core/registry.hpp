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
#include <boost/unordered_map.hpp>
#include <optional>

namespace crux::core
{

// Types.

/**
 * The two maps at the heart of dispatch: `Token -> Context` and `Context -> State_ptr`.  A readiness event names a
 * Token; resolve_token() then resolve_context() find the State to call.
 *
 * The two maps are independent: a token may be bound to a context that has no state (yet, or any more), and a
 * state may have no tokens.  Either condition is legal, and a lookup through it simply finds nothing.  Registry
 * never removes anything on its own; in particular unbind_state() leaves the context's tokens bound, and it is up
 * to the caller (typically the state, on termination) to unbind them.
 *
 * No operation fails.  Absence is reported as an empty `optional` or a null State_ptr.
 *
 * ### Thread safety ###
 * None.  Used only from the loop thread; see core::Core.
 */
class Registry
{
public:
  // Constructors/destructor.

  /// Constructs empty registry.
  Registry();

  // Methods.

  /**
   * Binds the token to the context, replacing any existing binding of that token.
   *
   * @param token
   *        Token.
   * @param context
   *        Context.  Need not have a state bound.
   * @return The context the token was bound to before, if any.
   */
  std::optional<Context> bind_token(Token token, Context context);

  /**
   * Removes the binding of the token, if any.
   *
   * @param token
   *        Token.
   * @return The context the token was bound to, if any.
   */
  std::optional<Context> unbind_token(Token token);

  /**
   * Binds the state to the context, replacing any existing binding of that context.  A null `state` is ignored:
   * nothing changes, and null is returned.
   *
   * @param context
   *        Context.
   * @param state
   *        State.
   * @return The state the context was bound to before; null if none (or if `state` is null).
   */
  State_ptr bind_state(Context context, const State_ptr& state);

  /**
   * Removes the binding of the context, if any.  Tokens bound to `context` stay bound.
   *
   * @param context
   *        Context.
   * @return The state the context was bound to; null if none.
   */
  State_ptr unbind_state(Context context);

  /**
   * Looks up the context bound to the token.
   *
   * @param token
   *        Token.
   * @return See above; empty if none.
   */
  std::optional<Context> resolve_token(Token token) const;

  /**
   * Looks up the state bound to the context.
   *
   * @param context
   *        Context.
   * @return See above; null if none.
   */
  State_ptr resolve_context(Context context) const;

  /**
   * Number of tokens currently bound.
   * @return See above.
   */
  size_t n_tokens() const;

  /**
   * Number of contexts currently bound to a state.
   * @return See above.
   */
  size_t n_states() const;

private:
  // Types.

  /// Short-hand for the `Token -> Context` map type.
  using Token_to_context_map = boost::unordered_map<Token, Context>;

  /// Short-hand for the `Context -> State_ptr` map type.
  using Context_to_state_map = boost::unordered_map<Context, State_ptr>;

  // Data.

  /// `Token -> Context`.
  Token_to_context_map m_token_to_context;

  /// `Context -> State_ptr`.  No null values are stored.
  Context_to_state_map m_context_to_state;
}; // class Registry

} // namespace crux::core
