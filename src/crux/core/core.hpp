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

#include "crux/core/id_generator.hpp"
#include "crux/core/registry.hpp"
#include "crux/core/closure.hpp"
#include "crux/core/core_fwd.hpp"
#include "crux/reactor/reactor_fwd.hpp"
#include "crux/log/log.hpp"
#include <boost/noncopyable.hpp>
#include <optional>

namespace crux::core
{

// Types.

/**
 * The dispatch core: one Id_generator, one Registry, and the entry points through which a reactor delivers
 * events.  An application creates one Core per reactor::Event_loop, binds its State objects into it and passes it
 * to reactor::Event_loop::run().
 *
 * ### Dispatch ###
 * The reactor calls on_ready(), on_timeout() and on_message().  The first two resolve `token -> context -> state`.
 * If either step finds nothing, the event is dropped (logged at TRACE): it is normal for an event to race with
 * the unbinding of its token or state.  Otherwise the State's handler is invoked, given `this` and the reactor.
 * on_message() involves no lookup; it invokes the Closure.
 *
 * For the duration of the handler call the Core holds its own State_ptr to the state, so the handler may unbind
 * (and thus drop the Registry's reference to) its own state safely.
 *
 * terminate_state() is the same thing for an explicit, synchronous request to end a state.  It calls
 * State::on_terminate() and nothing else: it is the state's job to deregister its resources and unbind itself
 * and its tokens.
 *
 * ### Identity and registry ###
 * The Id_generator and Registry operations are forwarded as-is; see those classes.  Construct with a non-zero
 * `context_seed` to reserve contexts `[0, context_seed)` for states the application creates at bootstrap.
 *
 * ### Thread safety ###
 * None.  Everything, dispatch and the forwarded operations, happens in the loop thread.  Another thread that
 * wants something done sends a Closure over a reactor::Channel; it then runs via on_message().  Since handlers
 * get a `Core*` and call back into it, every method is safe to call re-entrantly from a handler.
 */
class Core :
  public log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs the core, with empty Registry.
   *
   * @param logger_ptr
   *        The Logger implementation to use subsequently.
   * @param context_seed
   *        First value next_context() returns.
   * @param token_seed
   *        First value next_token() returns.
   */
  explicit Core(log::Logger* logger_ptr, Context context_seed = Context(), Token token_seed = Token());

  // Methods.

  /**
   * See Id_generator::next_token().
   * @return See above.
   */
  Token next_token();

  /**
   * See Id_generator::next_context().
   * @return See above.
   */
  Context next_context();

  /**
   * See Registry::bind_token().
   *
   * @param token
   *        See Registry.
   * @param context
   *        See Registry.
   * @return See Registry.
   */
  std::optional<Context> bind_token(Token token, Context context);

  /**
   * See Registry::unbind_token().
   *
   * @param token
   *        See Registry.
   * @return See Registry.
   */
  std::optional<Context> unbind_token(Token token);

  /**
   * See Registry::bind_state().
   *
   * @param context
   *        See Registry.
   * @param state
   *        See Registry.
   * @return See Registry.
   */
  State_ptr bind_state(Context context, const State_ptr& state);

  /**
   * See Registry::unbind_state().
   *
   * @param context
   *        See Registry.
   * @return See Registry.
   */
  State_ptr unbind_state(Context context);

  /**
   * See Registry::resolve_token().
   *
   * @param token
   *        See Registry.
   * @return See Registry.
   */
  std::optional<Context> resolve_token(Token token) const;

  /**
   * See Registry::resolve_context().
   *
   * @param context
   *        See Registry.
   * @return See Registry.
   */
  State_ptr resolve_context(Context context) const;

  /**
   * Read-only access to the Registry, e.g., for its sizes.
   * @return See above.
   */
  const Registry& registry() const;

  /**
   * Dispatches descriptor readiness: resolves `token` to a State and calls its State::on_ready().  No-op if
   * the token or its context is not bound.
   *
   * @param event_loop
   *        The reactor delivering the event.
   * @param token
   *        Token of the ready descriptor.
   * @param events
   *        Events detected.
   */
  void on_ready(reactor::Event_loop* event_loop, Token token, reactor::Event_set events);

  /**
   * Dispatches a timeout: resolves `token` to a State and calls its State::on_timeout().  No-op if the token or
   * its context is not bound.
   *
   * @param event_loop
   *        The reactor delivering the event.
   * @param token
   *        Token given when scheduling the timeout.
   */
  void on_timeout(reactor::Event_loop* event_loop, Token token);

  /**
   * Runs a Closure received from another thread.
   *
   * @param event_loop
   *        The reactor that received it.
   * @param closure
   *        The work.  Consumed.
   */
  void on_message(reactor::Event_loop* event_loop, Closure&& closure);

  /**
   * Synchronously calls State::on_terminate() on the state bound to `context`; no-op if none.  Does not touch the
   * Registry.
   *
   * @param event_loop
   *        The reactor.
   * @param context
   *        Context of the state to terminate.
   */
  void terminate_state(reactor::Event_loop* event_loop, Context context);

private:
  // Methods.

  /**
   * Resolves `token` to a state, logging (at TRACE) and returning null if it does not.
   *
   * @param token
   *        Token.
   * @param event_desc
   *        What is being dispatched, for logging.
   * @return See above.
   */
  State_ptr resolve_token_to_state(Token token, util::String_view event_desc) const;

  // Data.

  /// Makes new ids.
  Id_generator m_id_generator;

  /// The two maps.
  Registry m_registry;
}; // class Core

} // namespace crux::core
